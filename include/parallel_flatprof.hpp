#pragma once

#include <atomic>
#include <limits>
#include <tbb/concurrent_hash_map.h>
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#include "flatprof.hpp"

// 在 flatprof.hpp 的基础上添加并行累加

namespace flatprof {

// 预先记录所有行的偏移量, 之后可以按下标随机访问
class ParallelLineScanner {
    std::string_view buffer;
    std::vector<size_t> line_offsets;

  public:
    explicit ParallelLineScanner(std::string_view data) : buffer(data) {
        line_offsets.push_back(0);
        for (size_t i = 0; i < buffer.size(); ++i) {
            if (buffer[i] == '\n') {
                line_offsets.push_back(i + 1);
            }
        }
        if (line_offsets.back() != buffer.size()) {
            line_offsets.push_back(buffer.size() + 1);
        }
    }

    size_t line_count() const {
        return line_offsets.size() - 1;
    }

    // 原始行, 不含 '\n'
    std::string_view get_line(size_t index) const {
        if (index >= line_count()) return {};
        size_t start = line_offsets[index];
        size_t end = line_offsets[index + 1] - 1;
        return buffer.substr(start, end - start);
    }
};

/**
 * @brief 用 TBB 分片累加 folded trace
 *
 * 每一行的贡献只是按 symbol 求和, 与顺序无关, 所以结果与 FoldedTraceAccumulator 完全一致。
 * 有多行出错时, 总是报告文件中第一处错误。
 */
class ParallelFoldedTraceAccumulator : public AbstractTraceAccumulator {
  private:
    static constexpr size_t kNoError = std::numeric_limits<size_t>::max();

    size_t min_lines_per_task_;

    using ConcurrentCountMap = tbb::concurrent_hash_map<std::string, size_t>;

    // 溢出时返回 false
    static bool add_count(ConcurrentCountMap& map, std::string_view symbol, size_t count) {
        // accessor 持有写锁, 计数本身不需要原子
        ConcurrentCountMap::accessor acc;
        if (map.insert(acc, std::string(symbol))) {
            acc->second = count;
            return true;
        }
        return checked_add(acc->second, count);
    }

    static bool add_total(std::atomic<size_t>& total, size_t count) {
        size_t current = total.load();
        do {
            if (count > std::numeric_limits<size_t>::max() - current) return false;
        } while (! total.compare_exchange_weak(current, current + count));
        return true;
    }

    static void record_error(std::atomic<size_t>& first_error, size_t index) {
        size_t current = first_error.load();
        while (index < current && ! first_error.compare_exchange_weak(current, index)) {
        }
    }

    static SymbolCountTable to_table(const ConcurrentCountMap& map) {
        SymbolCountTable table;
        table.reserve(map.size());
        for (const auto& entry : map) {
            table.emplace(entry.first, entry.second);
        }
        return table;
    }

  public:
    explicit ParallelFoldedTraceAccumulator(size_t min_lines_per_task = 10000)
        : min_lines_per_task_(std::max<size_t>(1, min_lines_per_task)) {}

    AccumulatedCounts accumulate(std::string_view buffer, std::string_view source = {}) override {
        ParallelLineScanner scanner(buffer);
        const size_t total_lines = scanner.line_count();

        if (total_lines < min_lines_per_task_) {
            // 数据量太小，使用单线程
            return FoldedTraceAccumulator{}.accumulate(buffer, source);
        }

        ConcurrentCountMap self_map;
        ConcurrentCountMap total_map;
        std::atomic<size_t> total_samples{0};
        std::atomic<size_t> first_error{kNoError};
        std::atomic<bool> overflow{false};

        tbb::parallel_for(
            tbb::blocked_range<size_t>(0, total_lines, min_lines_per_task_),
            [&](const tbb::blocked_range<size_t>& range) {
                size_t local_total = 0;
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    std::optional<ParsedSample> parsed;
                    try {
                        parsed = FoldedLineParser::parse(scanner.get_line(i));
                    } catch (const MalformedLineException&) {
                        record_error(first_error, i);
                        continue;
                    }
                    if (! parsed) continue;

                    bool ok = checked_add(local_total, parsed->count) &&
                              add_count(self_map, parsed->leaf(), parsed->count);
                    for (auto it = parsed->frames.begin(); ok && it != parsed->frames.end(); ++it) {
                        ok = add_count(total_map, *it, parsed->count);
                    }
                    if (! ok) overflow.store(true);
                }
                if (! add_total(total_samples, local_total)) overflow.store(true);
            });

        // 溢出位置取决于累加顺序, 交给单线程版本按文件顺序定位并报告
        if (overflow.load()) {
            return FoldedTraceAccumulator{}.accumulate(buffer, source);
        }

        if (first_error.load() != kNoError) {
            size_t index = first_error.load();
            try {
                FoldedLineParser::parse(scanner.get_line(index));
            } catch (const MalformedLineException& e) {
                throw e.with_location(source, index + 1);
            }
        }

        AccumulatedCounts counts;
        counts.self_counts = to_table(self_map);
        counts.total_counts = to_table(total_map);
        counts.total_samples = total_samples.load();

        require_samples(counts, source);
        return counts;
    }

    std::string_view get_accumulator_name() const override {
        return "ParallelFoldedTraceAccumulator";
    }
};

} // namespace flatprof
