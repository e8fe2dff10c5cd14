#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <algorithm>
#include <iomanip>
#include <filesystem>
#include <stdexcept>
#include <charconv>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>

namespace flatprof {

class FlatProfException : public std::runtime_error {
  public:
    explicit FlatProfException(std::string_view message)
        : std::runtime_error(std::string("FlatProf Error: ") + std::string(message)) {}
};

class MemoryException : public std::runtime_error {
  public:
    explicit MemoryException(std::string_view message)
        : std::runtime_error(std::string("Memory Error: ") + std::string(message)) {}
};

class FileNotFoundException : public std::runtime_error {
  public:
    explicit FileNotFoundException(std::string_view message)
        : std::runtime_error(std::string("File not found: ") + std::string(message)) {}
};

class OpenFileException : public std::runtime_error {
  public:
    explicit OpenFileException(std::string_view message)
        : std::runtime_error(std::string("Cannot open file: ") + std::string(message)) {}
};

class ParseException : public FlatProfException {
  public:
    explicit ParseException(std::string_view message)
        : FlatProfException(std::string("Parse Error: ") + std::string(message)) {}
};

/**
 * @brief 无法解析的 trace 行，整个 trace 的处理随之中止
 *
 * line() 是原始行内容（不含换行符）; line_number() 从 1 开始, 0 表示未知;
 * source() 为空表示调用方没有提供文件路径。
 */
class MalformedLineException : public ParseException {
  private:
    std::string reason_;
    std::string line_;
    size_t line_number_;
    std::string source_;

    static std::string compose(std::string_view reason, std::string_view line, size_t line_number,
                               std::string_view source) {
        std::ostringstream oss;
        oss << reason << " in line: '" << line << "'";
        if (! source.empty() || line_number > 0) {
            oss << " (" << (source.empty() ? "<input>" : source);
            if (line_number > 0) oss << ":" << line_number;
            oss << ")";
        }
        return oss.str();
    }

  public:
    MalformedLineException(std::string_view reason, std::string_view line, size_t line_number = 0,
                           std::string_view source = {})
        : ParseException(compose(reason, line, line_number, source)),
          reason_(reason),
          line_(line),
          line_number_(line_number),
          source_(source) {}

    MalformedLineException with_location(std::string_view source, size_t line_number) const {
        return MalformedLineException(reason_, line_, line_number, source);
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

    const std::string& line() const noexcept {
        return line_;
    }

    size_t line_number() const noexcept {
        return line_number_;
    }

    const std::string& source() const noexcept {
        return source_;
    }
};

class EmptyTraceException : public FlatProfException {
  public:
    explicit EmptyTraceException(std::string_view message)
        : FlatProfException(std::string("Empty Trace: ") + std::string(message)) {}
};

class RenderException : public FlatProfException {
  public:
    explicit RenderException(std::string_view message)
        : FlatProfException(std::string("Render Error: ") + std::string(message)) {}
};

class ConfigException : public FlatProfException {
  public:
    explicit ConfigException(std::string_view message)
        : FlatProfException(std::string("Config Error: ") + std::string(message)) {}
};

namespace detail {
constexpr std::string_view kWhitespace = " \t\r\n\v\f";

inline std::string_view trim(std::string_view str) {
    const auto first = str.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {}; // empty view
    }
    const auto last = str.find_last_not_of(kWhitespace);
    return str.substr(first, last - first + 1);
}

inline std::string_view file_suffix(std::string_view path) {
    size_t last_dot = path.find_last_of('.');
    if (last_dot == std::string_view::npos || last_dot == path.size() - 1) {
        return {}; // 没有后缀
    }

    // 点必须在最后一个路径分隔符之后, 兼容 Windows 和 Unix
    size_t last_slash = path.find_last_of("/\\");
    if (last_slash != std::string_view::npos && last_dot < last_slash) {
        return {};
    }

    return path.substr(last_dot + 1);
}

// 与普通 split 不同：丢弃空 token（连续/首尾分隔符产生的）
inline std::vector<std::string_view> split_nonempty(std::string_view str, char delimiter) {
    std::vector<std::string_view> tokens;

    size_t start = 0;
    while (start <= str.size()) {
        size_t end = str.find(delimiter, start);
        if (end == std::string_view::npos) end = str.size();
        if (end > start) {
            tokens.emplace_back(str.substr(start, end - start));
        }
        start = end + 1;
    }

    return tokens;
}

inline std::string escape_xml(std::string_view str) {
    std::string escaped;
    escaped.reserve(str.size() + (str.size() / 5));

    for (char c : str) {
        switch (c) {
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '&':
                escaped += "&amp;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            case '\'':
                escaped += "&#39;";
                break;
            default:
                escaped += c;
                break;
        }
    }
    return escaped;
}

// 最短的可往返十进制表示, 整数值保留 ".0"
// 十进制指数在 [-4, 16) 内用定点写法, 否则用科学计数法 (1e+16, 1e-05)
inline std::string format_shortest(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

    std::string text;
    int digits = 1;
    for (; digits <= 17; ++digits) {
        std::ostringstream oss;
        oss << std::scientific << std::setprecision(digits - 1) << value;
        text = oss.str();
        if (std::strtod(text.c_str(), nullptr) == value) break;
    }

    const int exponent = std::atoi(text.c_str() + text.find('e') + 1);
    if (exponent >= -4 && exponent < 16) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(std::max(0, digits - 1 - exponent)) << value;
        text = oss.str();
    }
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}
} // namespace detail

// 🔥 ===== 输入: mmap 与逐行扫描 =====
struct MMapBuffer {
    void* addr = nullptr;
    size_t size = 0;

    explicit MMapBuffer(const std::string& filename) {
        int fd = open(filename.c_str(), O_RDONLY);
        if (fd == -1) throw OpenFileException(filename);

        struct stat st {};
        if (fstat(fd, &st) == -1) {
            close(fd);
            throw OpenFileException(filename);
        }
        size = static_cast<size_t>(st.st_size);

        // 长度为 0 时 mmap 会失败, 空文件直接给空 view
        if (size > 0) {
            addr = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
            if (addr == MAP_FAILED) {
                close(fd);
                throw MemoryException("mmap failed for " + filename);
            }
            madvise(addr, size, MADV_SEQUENTIAL);
        }
        close(fd);
    }

    MMapBuffer(const MMapBuffer&) = delete;
    MMapBuffer& operator=(const MMapBuffer&) = delete;

    ~MMapBuffer() {
        if (addr != nullptr) munmap(addr, size);
    }

    std::string_view view() const {
        if (addr == nullptr) return {};
        return {static_cast<const char*>(addr), size};
    }
};

struct LineScanner {
    std::string_view buffer;
    size_t pos = 0;
    size_t line_number = 0;

    explicit LineScanner(std::string_view data) : buffer(data) {}

    // 返回下一行的原始内容（不含 '\n'）; 读完之后返回空 view
    std::string_view next_line() {
        if (pos >= buffer.size()) {
            return {};
        }

        size_t end = buffer.find('\n', pos);
        if (end == std::string_view::npos) end = buffer.size();

        std::string_view line = buffer.substr(pos, end - pos);
        pos = end + 1;
        line_number++;

        return line;
    }

    bool eof() const {
        return pos >= buffer.size();
    }
};

/**
 * @brief 只读映射一个 folded trace 文件
 *
 * 文件不存在时在任何解析开始前抛出 FileNotFoundException。
 */
class TraceReader {
  private:
    std::string path_;
    std::unique_ptr<MMapBuffer> buffer_;

  public:
    explicit TraceReader(std::string_view path) : path_(path) {
        std::error_code ec;
        if (! std::filesystem::is_regular_file(path_, ec)) {
            throw FileNotFoundException(path_);
        }
        buffer_ = std::make_unique<MMapBuffer>(path_);
    }

    std::string_view view() const {
        return buffer_->view();
    }

    const std::string& path() const {
        return path_;
    }
};

struct TraceLabels {
    std::string benchmark = "unknown";
    std::string trace_type = "unknown";
};

// out_dhrystone_dhrystone/callstack_folded_inst.txt -> {dhrystone_dhrystone, inst}
inline TraceLabels detect_trace_labels(std::string_view trace_path) {
    TraceLabels labels;
    std::filesystem::path path(trace_path);
    std::string stem = path.stem().string();
    std::string parent = path.parent_path().filename().string();

    if (parent.rfind("out_", 0) == 0) {
        auto parts = detail::split_nonempty(parent, '_');
        if (parts.size() >= 2) {
            std::string benchmark;
            for (size_t i = 1; i < parts.size(); ++i) {
                if (i > 1) benchmark += '_';
                benchmark += parts[i];
            }
            labels.benchmark = benchmark;
        }
    }

    auto parts = detail::split_nonempty(stem, '_');
    auto it = std::find(parts.begin(), parts.end(), "folded");
    if (it != parts.end() && std::next(it) != parts.end()) {
        labels.trace_type = std::string(*std::next(it));
    }

    return labels;
}

// 🔥 ===== 解析: 一行 folded stack =====
struct ParsedSample {
    std::vector<std::string_view> frames; // 外层(caller)在前, leaf 在最后; 指向原始行
    size_t count = 0;

    std::string_view leaf() const {
        return frames.back();
    }
};

class FoldedLineParser {
  public:
    /**
     * @brief 解析 "frame1;frame2;...;frameN COUNT"
     *
     * 空行或只有空白的行返回 std::nullopt; 其它无法解析的行抛出 MalformedLineException。
     * 返回的 frames 引用 line 的内存。
     */
    static std::optional<ParsedSample> parse(std::string_view line) {
        std::string_view trimmed = detail::trim(line);
        if (trimmed.empty()) {
            return std::nullopt;
        }

        // 从最后一段空白处切开: 左边是栈, 右边是计数
        size_t split_pos = trimmed.find_last_of(detail::kWhitespace);
        if (split_pos == std::string_view::npos) {
            throw MalformedLineException("bad line (missing count)", line);
        }
        std::string_view count_str = trimmed.substr(split_pos + 1);
        std::string_view stack_str = trimmed.substr(0, split_pos);
        stack_str = stack_str.substr(0, stack_str.find_last_not_of(detail::kWhitespace) + 1);

        ParsedSample sample;
        sample.count = parse_count(count_str, line);
        sample.frames = detail::split_nonempty(stack_str, ';');
        if (sample.frames.empty()) {
            throw MalformedLineException("bad line (no frames)", line);
        }
        return sample;
    }

  private:
    static size_t parse_count(std::string_view count_str, std::string_view line) {
        std::string_view digits = count_str;
        if (! digits.empty() && digits.front() == '+') {
            digits.remove_prefix(1);
        }

        size_t value = 0;
        const char* first = digits.data();
        const char* last = digits.data() + digits.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (digits.empty() || ec == std::errc::invalid_argument || ptr != last) {
            throw MalformedLineException("bad count '" + std::string(count_str) + "'", line);
        }
        if (ec == std::errc::result_out_of_range) {
            throw MalformedLineException("count out of range '" + std::string(count_str) + "'", line);
        }
        return value;
    }
};

// 🔥 ===== 累加: self / total 计数 =====
using SymbolCountTable = std::unordered_map<std::string, size_t>;

struct AccumulatedCounts {
    SymbolCountTable self_counts;  // symbol 是 leaf 的样本数
    SymbolCountTable total_counts; // symbol 在栈中每出现一次就计一次（递归帧不去重）
    size_t total_samples = 0;

    // 分片累加的结果按 key 求和
    void merge(const AccumulatedCounts& other) {
        for (const auto& [sym, count] : other.self_counts) self_counts[sym] += count;
        for (const auto& [sym, count] : other.total_counts) total_counts[sym] += count;
        total_samples += other.total_samples;
    }
};

inline void require_samples(const AccumulatedCounts& counts, std::string_view source = {}) {
    if (counts.total_samples == 0) {
        std::string message = "trace has no positive-count samples";
        if (! source.empty()) {
            message += ": " + std::string(source);
        }
        throw EmptyTraceException(message);
    }
}

// 溢出时返回 false, sum 保持不变
inline bool checked_add(size_t& sum, size_t count) {
    if (count > std::numeric_limits<size_t>::max() - sum) return false;
    sum += count;
    return true;
}

class SampleAccumulator {
  private:
    AccumulatedCounts counts_;

  public:
    // 任何一个累加值溢出都按坏行处理, line 只用于错误信息
    void add_sample(const ParsedSample& sample, std::string_view line = {}) {
        bool ok = checked_add(counts_.total_samples, sample.count) &&
                  checked_add(counts_.self_counts[std::string(sample.leaf())], sample.count);
        for (auto it = sample.frames.begin(); ok && it != sample.frames.end(); ++it) {
            ok = checked_add(counts_.total_counts[std::string(*it)], sample.count);
        }
        if (! ok) {
            throw MalformedLineException("count overflows total", line);
        }
    }

    // 空行返回 false, 不影响任何计数
    bool add_line(std::string_view line) {
        auto parsed = FoldedLineParser::parse(line);
        if (! parsed) return false;
        add_sample(*parsed, line);
        return true;
    }

    const AccumulatedCounts& counts() const {
        return counts_;
    }

    AccumulatedCounts take(std::string_view source = {}) {
        require_samples(counts_, source);
        return std::move(counts_);
    }
};

class AbstractTraceAccumulator {
  public:
    virtual ~AbstractTraceAccumulator() = default;

    virtual AccumulatedCounts accumulate(std::string_view buffer, std::string_view source = {}) = 0;
    virtual std::string_view get_accumulator_name() const = 0;
};

class FoldedTraceAccumulator : public AbstractTraceAccumulator {
  public:
    AccumulatedCounts accumulate(std::string_view buffer, std::string_view source = {}) override {
        SampleAccumulator accumulator;
        LineScanner scanner(buffer);

        while (! scanner.eof()) {
            std::string_view line = scanner.next_line();
            try {
                accumulator.add_line(line);
            } catch (const MalformedLineException& e) {
                throw e.with_location(source, scanner.line_number);
            }
        }

        return accumulator.take(source);
    }

    std::string_view get_accumulator_name() const override {
        return "FoldedTraceAccumulator";
    }
};

// 🔥 ===== 平面 profile =====
struct FlatRow {
    std::string symbol;
    size_t self_count = 0;
    size_t total_count = 0;
    double percent = 0.0;     // self_count / total_samples * 100
    double cum_percent = 0.0; // 按排名累加的 percent
    std::optional<double> self_time;  // 秒, 仅在给出时钟频率时存在
    std::optional<double> total_time; // 秒
};

struct TraceMetadata {
    size_t total_samples = 0;
    std::optional<double> clk_mhz;
    std::optional<double> total_time_s;

    bool has_time() const {
        return clk_mhz.has_value();
    }
};

struct FlatProfile {
    std::vector<FlatRow> rows;
    TraceMetadata meta;
};

class FlatProfileBuilder {
  public:
    /**
     * @brief 计数 -> 排好序并带百分比的行
     *
     * 只有作为 leaf 出现过的 symbol 才有一行。排序: self 降序, 相同时 symbol 升序。
     * clk_mhz 缺省或 <= 0 时不计算时间。
     */
    FlatProfile build(const AccumulatedCounts& counts, std::optional<double> clk_mhz = std::nullopt) const {
        if (counts.total_samples == 0) {
            throw EmptyTraceException("no samples");
        }

        FlatProfile profile;
        profile.rows.reserve(counts.self_counts.size());
        for (const auto& [sym, self_count] : counts.self_counts) {
            FlatRow row;
            row.symbol = sym;
            row.self_count = self_count;
            auto it = counts.total_counts.find(sym);
            row.total_count = it == counts.total_counts.end() ? 0 : it->second;
            profile.rows.push_back(std::move(row));
        }

        std::sort(profile.rows.begin(), profile.rows.end(), [](const FlatRow& a, const FlatRow& b) {
            if (a.self_count != b.self_count) return a.self_count > b.self_count;
            return a.symbol < b.symbol;
        });

        const bool use_time = clk_mhz.has_value() && *clk_mhz > 0.0;
        // clk 的单位是 MHz: 每秒 clk * 1e6 个事件
        const double denom = use_time ? *clk_mhz * 1e6 : 0.0;
        const double total = static_cast<double>(counts.total_samples);

        double cum = 0.0;
        for (auto& row : profile.rows) {
            row.percent = static_cast<double>(row.self_count) / total * 100.0;
            cum += row.percent;
            row.cum_percent = cum;
            if (use_time) {
                row.self_time = static_cast<double>(row.self_count) / denom;
                row.total_time = static_cast<double>(row.total_count) / denom;
            }
        }

        profile.meta.total_samples = counts.total_samples;
        if (use_time) {
            profile.meta.clk_mhz = *clk_mhz;
            profile.meta.total_time_s = total / denom;
        }
        return profile;
    }
};

// 🔥 ===== 过滤 =====
struct RowFilterOptions {
    std::optional<double> min_percent; // 保留 percent >= min_percent 的行
    std::optional<long long> top;      // 只保留前 N 行, 负数视为 0

    bool empty() const {
        return ! min_percent && ! top;
    }
};

// 先阈值后截断; 只删除, 不重排
template <typename Row, typename PercentOf>
std::vector<Row> filter_rows(std::vector<Row> rows, const RowFilterOptions& options, PercentOf percent_of) {
    if (options.min_percent) {
        const double threshold = *options.min_percent;
        rows.erase(std::remove_if(rows.begin(), rows.end(),
                                  [&](const Row& row) { return ! (percent_of(row) >= threshold); }),
                   rows.end());
    }
    if (options.top) {
        const size_t keep = static_cast<size_t>(std::max<long long>(0, *options.top));
        if (rows.size() > keep) {
            rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(keep), rows.end());
        }
    }
    return rows;
}

inline std::vector<FlatRow> filter_rows(std::vector<FlatRow> rows, const RowFilterOptions& options) {
    return filter_rows(std::move(rows), options, [](const FlatRow& row) { return row.percent; });
}

// 🔥 ===== 双 trace 合并 (inst + cycle) =====
struct CombinedRow {
    std::string symbol;
    size_t primary_self = 0;
    size_t primary_total = 0;
    double primary_percent = 0.0;
    size_t secondary_self = 0;
    size_t secondary_total = 0;
    double secondary_percent = 0.0;
    std::optional<double> ipc; // primary_total / secondary_total
    std::optional<double> cpi; // secondary_total / primary_total
};

struct CombinedMetadata {
    size_t total_primary = 0;
    size_t total_secondary = 0;
    std::optional<double> cpi;
    std::optional<double> ipc;
    std::optional<double> clk_mhz;      // 来自 secondary
    std::optional<double> total_time_s; // 来自 secondary
};

struct CombinedProfile {
    std::vector<CombinedRow> rows;
    CombinedMetadata meta;
};

class DualTraceMerger {
  public:
    /**
     * @brief 按 symbol 做 full outer join
     *
     * 两边都必须是未过滤的完整 profile; 过滤在合并之后按 secondary percent 进行。
     * 某一边没有的 symbol, 那一边的字段全部为 0, 与真实的 0 计数无法区分。
     */
    CombinedProfile merge(const FlatProfile& primary, const FlatProfile& secondary,
                          const RowFilterOptions& options = {}) const {
        std::unordered_map<std::string_view, const FlatRow*> secondary_map;
        secondary_map.reserve(secondary.rows.size());
        for (const auto& row : secondary.rows) {
            secondary_map.emplace(row.symbol, &row);
        }

        CombinedProfile combined;
        combined.rows.reserve(primary.rows.size() + secondary.rows.size());

        std::unordered_set<std::string_view> seen;
        for (const auto& row : primary.rows) {
            auto it = secondary_map.find(row.symbol);
            combined.rows.push_back(make_row(row.symbol, &row, it == secondary_map.end() ? nullptr : it->second));
            seen.insert(row.symbol);
        }
        for (const auto& row : secondary.rows) {
            if (seen.count(row.symbol) == 0) {
                combined.rows.push_back(make_row(row.symbol, nullptr, &row));
            }
        }

        // cycle 为排序轴
        std::sort(combined.rows.begin(), combined.rows.end(), [](const CombinedRow& a, const CombinedRow& b) {
            if (a.secondary_percent != b.secondary_percent) return a.secondary_percent > b.secondary_percent;
            return a.symbol < b.symbol;
        });

        combined.rows = filter_rows(std::move(combined.rows), options,
                                    [](const CombinedRow& row) { return row.secondary_percent; });

        CombinedMetadata& meta = combined.meta;
        meta.total_primary = primary.meta.total_samples;
        meta.total_secondary = secondary.meta.total_samples;
        if (meta.total_primary > 0) {
            meta.cpi = static_cast<double>(meta.total_secondary) / static_cast<double>(meta.total_primary);
        }
        if (meta.total_secondary > 0) {
            meta.ipc = static_cast<double>(meta.total_primary) / static_cast<double>(meta.total_secondary);
        }
        meta.clk_mhz = secondary.meta.clk_mhz;
        meta.total_time_s = secondary.meta.total_time_s;

        return combined;
    }

  private:
    static CombinedRow make_row(std::string_view symbol, const FlatRow* primary, const FlatRow* secondary) {
        CombinedRow row;
        row.symbol = std::string(symbol);
        if (primary) {
            row.primary_self = primary->self_count;
            row.primary_total = primary->total_count;
            row.primary_percent = primary->percent;
        }
        if (secondary) {
            row.secondary_self = secondary->self_count;
            row.secondary_total = secondary->total_count;
            row.secondary_percent = secondary->percent;
        }

        // 两者各自独立判定, 不能用 1/other
        if (row.secondary_total > 0) {
            row.ipc = static_cast<double>(row.primary_total) / static_cast<double>(row.secondary_total);
        }
        if (row.primary_total > 0) {
            row.cpi = static_cast<double>(row.secondary_total) / static_cast<double>(row.primary_total);
        }
        return row;
    }
};

// 🔥 ===== 文本表格输出 =====
struct TimeUnit {
    double scale;
    std::string_view name;
};

// 整张表只选一次单位, 依据最大的 self time
inline TimeUnit choose_time_unit(double max_seconds) {
    if (max_seconds < 1e-3) return {1e6, "us"};
    if (max_seconds < 1.0) return {1e3, "ms"};
    return {1.0, "s"};
}

class TablePrinter {
  public:
    static void print_flat(std::ostream& os, const std::vector<FlatRow>& rows, const TraceMetadata& meta) {
        bool use_time = std::any_of(rows.begin(), rows.end(), [](const FlatRow& r) { return r.self_time.has_value(); });

        std::ios_base::fmtflags flags = os.flags();
        std::streamsize precision = os.precision();
        if (use_time) {
            double max_self_s = 0.0;
            for (const auto& row : rows) {
                max_self_s = std::max(max_self_s, row.self_time.value_or(0.0));
            }
            TimeUnit unit = choose_time_unit(max_self_s);
            std::string self_col = "self[" + std::string(unit.name) + "]";
            std::string total_col = "total[" + std::string(unit.name) + "]";

            os << std::right << std::setw(6) << "%" << ' ' << std::setw(8) << "cum%" << ' ' << std::setw(12) << "self"
               << ' ' << std::setw(12) << "total" << ' ' << std::setw(12) << self_col << ' ' << std::setw(12)
               << total_col << "  symbol\n";
            for (const auto& row : rows) {
                write_counts(os, row);
                os << ' ' << std::fixed << std::setprecision(3) << std::setw(12)
                   << row.self_time.value_or(0.0) * unit.scale << ' ' << std::setw(12)
                   << row.total_time.value_or(0.0) * unit.scale << "  " << row.symbol << '\n';
            }
        } else {
            os << std::right << std::setw(6) << "%" << ' ' << std::setw(8) << "cum%" << ' ' << std::setw(12) << "self"
               << ' ' << std::setw(12) << "total" << "  symbol\n";
            for (const auto& row : rows) {
                write_counts(os, row);
                os << "  " << row.symbol << '\n';
            }
        }
        os.flags(flags);
        os.precision(precision);

        os << "total_samples: " << meta.total_samples << '\n';
        if (meta.clk_mhz) os << "clk_mhz: " << detail::format_shortest(*meta.clk_mhz) << '\n';
        if (meta.total_time_s) os << "total_time_s: " << detail::format_shortest(*meta.total_time_s) << '\n';
    }

    static void print_combined(std::ostream& os, const CombinedProfile& combined) {
        std::ios_base::fmtflags flags = os.flags();
        std::streamsize precision = os.precision();
        os << std::right << std::setw(7) << "inst%" << ' ' << std::setw(7) << "cyc%" << ' ' << std::setw(10)
           << "inst_self" << ' ' << std::setw(10) << "inst_tot" << ' ' << std::setw(10) << "cyc_self" << ' '
           << std::setw(10) << "cyc_tot" << ' ' << std::setw(8) << "ipc" << ' ' << std::setw(8) << "cpi"
           << "  symbol\n";

        for (const auto& row : combined.rows) {
            os << std::fixed << std::setprecision(2) << std::setw(7) << row.primary_percent << ' ' << std::setw(7)
               << row.secondary_percent << ' ' << std::setw(10) << row.primary_self << ' ' << std::setw(10)
               << row.primary_total << ' ' << std::setw(10) << row.secondary_self << ' ' << std::setw(10)
               << row.secondary_total << ' ' << std::setw(8) << format_ratio(row.ipc) << ' ' << std::setw(8)
               << format_ratio(row.cpi) << "  " << row.symbol << '\n';
        }
        os.flags(flags);
        os.precision(precision);

        const CombinedMetadata& meta = combined.meta;
        os << "total_instructions: " << meta.total_primary << '\n';
        os << "total_cycles: " << meta.total_secondary << '\n';
        if (meta.cpi) os << "CPI: " << detail::format_shortest(*meta.cpi) << '\n';
        if (meta.ipc) os << "IPC: " << detail::format_shortest(*meta.ipc) << '\n';
        if (meta.clk_mhz) os << "clk_mhz: " << detail::format_shortest(*meta.clk_mhz) << '\n';
        if (meta.total_time_s) os << "total_time_s: " << detail::format_shortest(*meta.total_time_s) << '\n';
    }

  private:
    static void write_counts(std::ostream& os, const FlatRow& row) {
        os << std::fixed << std::setprecision(2) << std::setw(6) << row.percent << ' ' << std::setw(8)
           << row.cum_percent << ' ' << std::setw(12) << row.self_count << ' ' << std::setw(12) << row.total_count;
    }

    // 未定义时输出空白
    static std::string format_ratio(const std::optional<double>& ratio) {
        if (! ratio) return "";
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << *ratio;
        return oss.str();
    }
};

// 🔥 ===== CSV 输出 =====
class CsvWriter {
  public:
    static void write(std::ostream& os, const std::vector<FlatRow>& rows) {
        os << "symbol,percent,cum_percent,self_count,total_count,self_time_s,total_time_s\r\n";
        for (const auto& row : rows) {
            os << quote(row.symbol) << ',' << format_fixed(row.percent, 6) << ','
               << format_fixed(row.cum_percent, 6) << ',' << row.self_count << ',' << row.total_count << ','
               << format_time(row.self_time) << ',' << format_time(row.total_time) << "\r\n";
        }
    }

    static void write_file(const std::vector<FlatRow>& rows, std::string_view path) {
        std::filesystem::path out_path(path);
        std::error_code ec;
        if (out_path.has_parent_path()) {
            std::filesystem::create_directories(out_path.parent_path(), ec);
            if (ec) {
                throw RenderException("Cannot create directory for CSV file: " + out_path.parent_path().string());
            }
        }

        std::ofstream ofs(out_path, std::ios::binary);
        if (! ofs.is_open()) {
            throw RenderException("Cannot create CSV file: " + std::string(path));
        }
        write(ofs, rows);
        if (! ofs.good()) {
            throw RenderException("Error writing to CSV file: " + std::string(path));
        }
    }

  private:
    static std::string quote(std::string_view field) {
        if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
            return std::string(field);
        }
        std::string quoted = "\"";
        for (char c : field) {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    static std::string format_fixed(double value, int precision) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << value;
        return oss.str();
    }

    // %.12g
    static std::string format_time(const std::optional<double>& seconds) {
        if (! seconds) return "";
        std::ostringstream oss;
        oss << std::setprecision(12) << *seconds;
        return oss.str();
    }
};

// 🔥 ===== 条形图输出 =====
class ColorScheme {
  public:
    virtual ~ColorScheme() = default;
    virtual std::string get_color(std::string_view symbol, double heat_ratio = 0.0) const = 0;
    virtual std::string_view get_name() const = 0;

  protected:
    static void hsl_to_rgb(double h, double s, double l, int& r, int& g, int& b) {
        auto hue2rgb = [](double p, double q, double t) {
            if (t < 0) t += 1.0;
            if (t > 1) t -= 1.0;
            if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
            if (t < 1.0 / 2.0) return q;
            if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
            return p;
        };

        h = std::fmod(h, 360.0) / 360.0;
        if (h < 0) h += 1.0;
        s = std::clamp(s, 0.0, 1.0);
        l = std::clamp(l, 0.0, 1.0);

        double q = l < 0.5 ? l * (1 + s) : l + s - l * s;
        double p = 2 * l - q;

        auto to255 = [](double v) { return static_cast<int>(std::round(std::clamp(v * 255, 0.0, 255.0))); };

        r = to255(hue2rgb(p, q, h + 1.0 / 3.0));
        g = to255(hue2rgb(p, q, h));
        b = to255(hue2rgb(p, q, h - 1.0 / 3.0));
    }

    static std::string rgb(int r, int g, int b) {
        std::ostringstream oss;
        oss << "rgb(" << r << "," << g << "," << b << ")";
        return oss.str();
    }
};

// 薄荷绿, heat_ratio 越高颜色越深; heat_ratio=1 时约为 #7ed3ab
class MintColorScheme : public ColorScheme {
  public:
    std::string get_color(std::string_view /*symbol*/, double heat_ratio = 0.0) const override {
        int r, g, b;
        hsl_to_rgb(151.8, 0.49, 0.76 - 0.10 * std::clamp(heat_ratio, 0.0, 1.0), r, g, b);
        return rgb(r, g, b);
    }

    std::string_view get_name() const override {
        return "mint";
    }
};

class ClassicHotColorScheme : public ColorScheme {
  private:
    size_t hash_symbol(std::string_view symbol) const {
        size_t seed = 114514;
        seed ^= std::hash<std::string_view>{}(symbol) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }

  public:
    std::string get_color(std::string_view symbol, double heat_ratio = 0.0) const override {
        auto hash = static_cast<unsigned int>(hash_symbol(symbol));
        double v1 = ((hash >> 0) & 0xFF) / 255.0;
        double v2 = ((hash >> 8) & 0xFF) / 255.0;

        // 同一个 symbol 颜色稳定, 越热越偏红
        double heat = std::clamp(heat_ratio, 0.0, 1.0);
        int r = 205 + static_cast<int>(50 * heat);
        int g = static_cast<int>(230 * v1 * (1.0 - 0.5 * heat));
        int b = static_cast<int>(55 * v2);

        return rgb(r, g, b);
    }

    std::string_view get_name() const override {
        return "hot";
    }
};

class ColorSchemeFactory {
  private:
    using CreatorFunc = std::function<std::unique_ptr<ColorScheme>()>;

    static const std::unordered_map<std::string_view, CreatorFunc>& get_scheme_map() {
        static const std::unordered_map<std::string_view, CreatorFunc> scheme_map = {
            {"mint", []() { return std::make_unique<MintColorScheme>(); }},
            { "hot", []() { return std::make_unique<ClassicHotColorScheme>(); }},
        };
        return scheme_map;
    }

  public:
    // 未知配色返回默认 mint
    static std::unique_ptr<ColorScheme> create(std::string_view scheme_name) {
        const auto& map = get_scheme_map();
        auto it = map.find(scheme_name);
        if (it != map.end()) {
            return it->second();
        }
        return std::make_unique<MintColorScheme>();
    }

    static bool has_scheme(std::string_view scheme_name) {
        return get_scheme_map().count(scheme_name) > 0;
    }

    static std::vector<std::string_view> get_available_schemes() {
        std::vector<std::string_view> schemes;
        for (const auto& [name, _] : get_scheme_map()) {
            schemes.push_back(name);
        }
        std::sort(schemes.begin(), schemes.end());
        return schemes;
    }
};

struct ChartConfig {
    std::string title = "Flat Profile";

    // 图像尺寸
    int width = 900;
    int bar_height = 20; // 每一行的高度
    int xpad = 10;       // 左右边距

    std::string font_type = "Verdana";
    int font_size = 12;
    double font_width = 0.6; // 字符宽度相对于 font_size 的比例
    size_t max_label_chars = 48; // 过长的 symbol 截断

    std::string colors = "mint";
    std::string bgcolor = "#ffffff";
    std::string x_label = "% of samples";

    void validate() const {
        if (width <= 0) {
            throw ConfigException("Chart width must be positive");
        }
        if (bar_height <= 0) {
            throw ConfigException("Bar height must be positive");
        }
        if (font_size <= 0) {
            throw ConfigException("Font size must be positive");
        }
        if (font_width <= 0 || font_width > 1) {
            throw ConfigException("Font width must be between 0 and 1");
        }
        if (xpad < 0) {
            throw ConfigException("Padding cannot be negative");
        }
        if (max_label_chars < 4) {
            throw ConfigException("Label length must be at least 4 characters");
        }
        if (! ColorSchemeFactory::has_scheme(colors)) {
            throw ConfigException("Unknown color scheme: " + colors);
        }
    }
};

// 0 < pct < 1 显示 "<1.0%", 其余保留一位小数
inline std::string format_percent_label(double percent) {
    if (percent > 0.0 && percent < 1.0) {
        return "<1.0%";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << percent << "%";
    return oss.str();
}

class BarChartRenderer {
  protected:
    ChartConfig config_;

    explicit BarChartRenderer(const ChartConfig& config) : config_(config) {
        config_.validate();
    }

  public:
    virtual ~BarChartRenderer() = default;

    virtual void write_chart(std::ostream& os, const std::vector<FlatRow>& rows, std::string_view title) = 0;
    virtual std::string_view get_format() const = 0;

    void render(const std::vector<FlatRow>& rows, std::string_view title, std::string_view output_file) {
        std::filesystem::path out_path(output_file);
        std::error_code ec;
        if (out_path.has_parent_path()) {
            std::filesystem::create_directories(out_path.parent_path(), ec);
            if (ec) {
                throw RenderException("Cannot create directory for chart: " + out_path.parent_path().string());
            }
        }

        std::ofstream ofs(out_path);
        if (! ofs.is_open()) {
            throw RenderException(std::string("Cannot create chart file: ") + std::string(output_file));
        }

        write_chart(ofs, rows, title);

        if (! ofs.good()) {
            throw RenderException(std::string("Error writing to chart file: ") + std::string(output_file));
        }
    }

    const ChartConfig& get_config() const {
        return config_;
    }
};

class SvgBarChartRenderer : public BarChartRenderer {
  private:
    std::unique_ptr<ColorScheme> color_scheme_;

    // 单次渲染的布局
    struct Layout {
        int image_height = 0;
        int top = 0;         // 第一根柱子的 y
        double label_w = 0;  // symbol 列宽
        double bar_x = 0;    // 柱子起点
        double bar_area = 0; // 柱子最大长度
        double max_percent = 0;
    };

  public:
    explicit SvgBarChartRenderer(const ChartConfig& config = {}) : BarChartRenderer(config) {
        color_scheme_ = ColorSchemeFactory::create(config_.colors);
    }

    // 第一行（排名最高）画在最上面
    void write_chart(std::ostream& os, const std::vector<FlatRow>& rows, std::string_view title) override {
        Layout layout = compute_layout(rows);
        std::ios_base::fmtflags flags = os.flags();
        std::streamsize precision = os.precision();

        write_svg_header(os, layout);
        write_svg_style(os);
        os << "<rect x=\"0\" y=\"0\" width=\"" << config_.width << "\" height=\"" << layout.image_height
           << "\" fill=\"" << config_.bgcolor << "\" />\n";
        os << "<text id=\"title\" x=\"" << (config_.width / 2) << "\" y=\"" << (config_.font_size * 2) << "\">"
           << detail::escape_xml(title.empty() ? std::string_view(config_.title) : title) << "</text>\n";

        os << "<g id=\"bars\">\n";
        for (size_t i = 0; i < rows.size(); ++i) {
            write_bar(os, rows[i], layout, layout.top + static_cast<int>(i) * config_.bar_height);
        }
        os << "</g>\n";

        int axis_y = layout.top + static_cast<int>(rows.size()) * config_.bar_height;
        os << "<line x1=\"" << std::fixed << std::setprecision(1) << layout.bar_x << "\" y1=\"" << axis_y
           << "\" x2=\"" << (layout.bar_x + layout.bar_area) << "\" y2=\"" << axis_y
           << "\" stroke=\"black\" stroke-width=\"0.5\" />\n";
        os << "<text id=\"xlabel\" x=\"" << (layout.bar_x + layout.bar_area / 2) << "\" y=\""
           << (axis_y + config_.font_size * 2) << "\">" << detail::escape_xml(config_.x_label) << "</text>\n";
        os.flags(flags);
        os.precision(precision);

        os << "</svg>\n";
    }

    std::string_view get_format() const override {
        return "svg";
    }

  private:
    Layout compute_layout(const std::vector<FlatRow>& rows) const {
        Layout layout;
        size_t longest = 0;
        for (const auto& row : rows) {
            longest = std::max(longest, std::min(row.symbol.size(), config_.max_label_chars));
            layout.max_percent = std::max(layout.max_percent, row.percent);
        }
        if (layout.max_percent <= 0.0) layout.max_percent = 1.0;

        const double char_w = config_.font_size * config_.font_width;
        const double value_w = char_w * 7; // "100.0%" 加间距
        layout.label_w = static_cast<double>(longest) * char_w + config_.xpad;
        layout.bar_x = config_.xpad + layout.label_w;
        layout.bar_area = std::max(1.0, config_.width - 2.0 * config_.xpad - layout.label_w - value_w);

        int ypad1 = config_.font_size * 3;     // 顶部空间（标题）
        int ypad2 = config_.font_size * 3 + 10; // 底部空间（坐标轴标签）
        layout.top = ypad1;
        layout.image_height = static_cast<int>(rows.size()) * config_.bar_height + ypad1 + ypad2;
        return layout;
    }

    void write_svg_header(std::ostream& os, const Layout& layout) const {
        os << "<?xml version=\"1.0\" standalone=\"no\"?>\n";
        os << "<svg version=\"1.1\" "
           << "width=\"" << config_.width << "\" "
           << "height=\"" << layout.image_height << "\" "
           << "viewBox=\"0 0 " << config_.width << " " << layout.image_height << "\" "
           << "xmlns=\"http://www.w3.org/2000/svg\">\n";
    }

    void write_svg_style(std::ostream& os) const {
        int title_size = config_.font_size + 5;

        os << "<style type=\"text/css\">\n";
        os << "  text { font-family:" << config_.font_type << "; font-size:" << config_.font_size
           << "px; fill:black; }\n";
        os << "  #title { text-anchor:middle; font-size:" << title_size << "px}\n";
        os << "  #xlabel { text-anchor:middle; }\n";
        os << "  .symbol { text-anchor:end; }\n";
        os << "  #bars > *:hover { stroke:black; stroke-width:0.5; }\n";
        os << "</style>\n";
    }

    void write_bar(std::ostream& os, const FlatRow& row, const Layout& layout, int y) const {
        const double width = row.percent / layout.max_percent * layout.bar_area;
        const double text_y = y + config_.bar_height - (config_.bar_height - config_.font_size) / 2.0 - 2;

        os << "<g>\n";
        os << "<title>" << detail::escape_xml(row.symbol) << " (" << row.self_count << " samples, " << std::fixed
           << std::setprecision(2) << row.percent << "%)</title>\n";
        os << "<text class=\"symbol\" x=\"" << std::setprecision(1) << (layout.bar_x - 4) << "\" y=\"" << text_y
           << "\">" << detail::escape_xml(shorten(row.symbol)) << "</text>\n";
        os << "<rect x=\"" << layout.bar_x << "\" y=\"" << (y + 2) << "\" width=\"" << width << "\" height=\""
           << (config_.bar_height - 4) << "\" fill=\""
           << color_scheme_->get_color(row.symbol, row.percent / layout.max_percent) << "\" />\n";
        os << "<text class=\"value\" x=\"" << (layout.bar_x + width + 3) << "\" y=\"" << text_y << "\">"
           << detail::escape_xml(format_percent_label(row.percent)) << "</text>\n";
        os << "</g>\n";
    }

    std::string shorten(const std::string& symbol) const {
        if (symbol.size() <= config_.max_label_chars) return symbol;
        return symbol.substr(0, config_.max_label_chars - 3) + "...";
    }
};

// 同一张 SVG, 嵌进独立 HTML 页面
class HtmlBarChartRenderer : public BarChartRenderer {
  public:
    explicit HtmlBarChartRenderer(const ChartConfig& config = {}) : BarChartRenderer(config) {}

    void write_chart(std::ostream& os, const std::vector<FlatRow>& rows, std::string_view title) override {
        std::string_view heading = title.empty() ? std::string_view(config_.title) : title;
        os << R"(<!DOCTYPE html>
<html>
<head>
  <meta charset="utf-8">
  <title>)" << detail::escape_xml(heading)
           << R"(</title>
</head>
<body>
  <h1>)" << detail::escape_xml(heading)
           << "</h1>\n";

        std::ostringstream svg;
        SvgBarChartRenderer(config_).write_chart(svg, rows, title);
        std::string svg_text = svg.str();
        // 去掉 XML 声明行
        if (svg_text.rfind("<?xml", 0) == 0) {
            svg_text.erase(0, svg_text.find('\n') + 1);
        }
        os << svg_text << "</body>\n</html>\n";
    }

    std::string_view get_format() const override {
        return "html";
    }
};

class BarChartRendererFactory {
    using CreatorFunc = std::function<std::unique_ptr<BarChartRenderer>(const ChartConfig&)>;

    static const std::unordered_map<std::string_view, CreatorFunc>& get_render_map() {
        static const std::unordered_map<std::string_view, CreatorFunc> render_map = {
            { "svg", [](const ChartConfig& c) { return std::make_unique<SvgBarChartRenderer>(c); }},
            {"html", [](const ChartConfig& c) { return std::make_unique<HtmlBarChartRenderer>(c); }},
        };
        return render_map;
    }

  public:
    static bool supports(std::string_view filetype) {
        return get_render_map().count(filetype) > 0;
    }

    // 未知类型默认 svg
    static std::unique_ptr<BarChartRenderer> create(std::string_view filetype, const ChartConfig& config = {}) {
        const auto& map = get_render_map();
        auto it = map.find(filetype);
        if (it != map.end()) {
            return it->second(config);
        }
        return std::make_unique<SvgBarChartRenderer>(config);
    }
};

// 🔥 ===== 主入口类 =====
struct FlatProfileConfig {
    std::string trace;        // 必填
    std::string second_trace; // 非空时输出合并表
    std::string event = "inst"; // 只影响标题

    std::optional<long long> top;
    std::optional<double> min_percent;           // 单 trace: self% 阈值
    std::optional<double> min_secondary_percent; // 合并: cycle% 阈值
    std::optional<double> clk_mhz;
    std::optional<double> second_clk_mhz;

    std::string csv_path; // 空表示不写
    bool plot = false;
    std::string chart_path; // 空则在 trace 旁边自动命名

    ChartConfig chart;

    void validate() const {
        if (trace.empty()) {
            throw ConfigException("Trace path is required");
        }
        if (min_percent && ! std::isfinite(*min_percent)) {
            throw ConfigException("Threshold must be a finite number");
        }
        if (min_secondary_percent && ! std::isfinite(*min_secondary_percent)) {
            throw ConfigException("Secondary threshold must be a finite number");
        }
        // <= 0 只是关闭时间列
        if (clk_mhz && ! std::isfinite(*clk_mhz)) {
            throw ConfigException("Clock frequency must be a finite number");
        }
        if (second_clk_mhz && ! std::isfinite(*second_clk_mhz)) {
            throw ConfigException("Second clock frequency must be a finite number");
        }
        if (! chart_path.empty() && ! BarChartRendererFactory::supports(detail::file_suffix(chart_path))) {
            throw ConfigException("Unsupported chart format (use .svg or .html): " + chart_path);
        }
        chart.validate();
    }

    RowFilterOptions flat_filter() const {
        return {min_percent, top};
    }

    RowFilterOptions combined_filter() const {
        return {min_secondary_percent, top};
    }
};

class FlatProfileGenerator {
  private:
    FlatProfileConfig config_;
    std::unique_ptr<AbstractTraceAccumulator> accumulator_;

  public:
    explicit FlatProfileGenerator(const FlatProfileConfig& config = {})
        : config_(config), accumulator_(std::make_unique<FoldedTraceAccumulator>()) {
        config_.validate();
    }

    void set_accumulator(std::unique_ptr<AbstractTraceAccumulator> accumulator) {
        if (! accumulator) {
            throw ConfigException("Accumulator must not be null");
        }
        accumulator_ = std::move(accumulator);
    }

    // 读取并构建未过滤的 profile
    FlatProfile load_profile(std::string_view trace_file, std::optional<double> clk_mhz) const {
        TraceReader reader(trace_file);
        AccumulatedCounts counts = accumulator_->accumulate(reader.view(), reader.path());
        return FlatProfileBuilder{}.build(counts, clk_mhz);
    }

    std::string title() const {
        return "Profile - " + config_.event;
    }

    std::string default_chart_path() const {
        std::filesystem::path trace_path(config_.trace);
        std::string name = trace_path.stem().string() + "_flat_" + config_.event + ".svg";
        return (trace_path.parent_path() / name).string();
    }

    // 从路径识别出的 benchmark 和 trace 类型; 类型与 event 相同时不重复
    std::string chart_title() const {
        TraceLabels labels = detect_trace_labels(config_.trace);
        std::vector<std::string> notes;
        if (labels.benchmark != "unknown") notes.push_back(labels.benchmark);
        if (labels.trace_type != "unknown" && labels.trace_type != config_.event) {
            notes.push_back(labels.trace_type + " trace");
        }
        if (notes.empty()) return title();

        std::string result = title() + " (";
        for (size_t i = 0; i < notes.size(); ++i) {
            if (i > 0) result += ", ";
            result += notes[i];
        }
        return result + ")";
    }

    CombinedProfile generate_combined() const {
        // 合并前两边都不能过滤
        FlatProfile primary = load_profile(config_.trace, config_.clk_mhz);
        FlatProfile secondary = load_profile(config_.second_trace, config_.second_clk_mhz);
        return DualTraceMerger{}.merge(primary, secondary, config_.combined_filter());
    }

    /**
     * @brief 完整流程: 打印报告, 按配置写 CSV / 图
     *
     * 有 second_trace 时只打印合并表。
     */
    void run(std::ostream& out) {
        if (! config_.second_trace.empty()) {
            // 两个文件都先确认存在, 再开始解析
            std::error_code ec;
            for (const auto& path : {config_.trace, config_.second_trace}) {
                if (! std::filesystem::is_regular_file(path, ec)) throw FileNotFoundException(path);
            }
            CombinedProfile combined = generate_combined();
            out << "Profile - combined (inst + second trace)\n";
            TablePrinter::print_combined(out, combined);
            return;
        }

        FlatProfile profile = load_profile(config_.trace, config_.clk_mhz);
        std::vector<FlatRow> rows = filter_rows(profile.rows, config_.flat_filter());

        out << title() << '\n';
        TablePrinter::print_flat(out, rows, profile.meta);

        if (! config_.csv_path.empty()) {
            CsvWriter::write_file(rows, config_.csv_path);
            out << "csv saved: " << config_.csv_path << '\n';
        }

        if (config_.plot) {
            std::string chart_path = config_.chart_path.empty() ? default_chart_path() : config_.chart_path;
            auto renderer = BarChartRendererFactory::create(detail::file_suffix(chart_path), config_.chart);
            renderer->render(rows, chart_title(), chart_path);
            out << "plot saved: " << chart_path << '\n';
        }
    }

    void set_config(const FlatProfileConfig& config) {
        config.validate();
        config_ = config;
    }

    const FlatProfileConfig& get_config() const {
        return config_;
    }
};
} // namespace flatprof
