#include "parallel_flatprof.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <string>

using namespace flatprof;

namespace {
// 确定性的伪随机 trace
std::string make_trace(size_t lines) {
    static const char* const frames[] = {"_start", "main", "Proc0", "Proc1", "memset", "memcpy", "strcmp", "fib"};
    std::string trace;
    uint32_t state = 12345;
    for (size_t i = 0; i < lines; ++i) {
        state = state * 1103515245u + 12345u;
        size_t depth = 1 + (state >> 16) % 6;
        trace += "_start";
        for (size_t d = 1; d < depth; ++d) {
            state = state * 1103515245u + 12345u;
            trace += ';';
            trace += frames[(state >> 16) % 8];
        }
        state = state * 1103515245u + 12345u;
        trace += ' ' + std::to_string((state >> 16) % 1000) + '\n';
        if (i % 97 == 0) trace += "\n";
    }
    return trace;
}
} // namespace

TEST(ParallelLineScannerTest, IndexesLines) {
    ParallelLineScanner scanner("a 1\n\nb 2");
    ASSERT_EQ(scanner.line_count(), 3u);
    EXPECT_EQ(scanner.get_line(0), "a 1");
    EXPECT_EQ(scanner.get_line(1), "");
    EXPECT_EQ(scanner.get_line(2), "b 2");
    EXPECT_EQ(scanner.get_line(3), "");

    EXPECT_EQ(ParallelLineScanner("").line_count(), 0u);
    EXPECT_EQ(ParallelLineScanner("x 1\n").line_count(), 1u);
}

TEST(ParallelFoldedTraceAccumulatorTest, MatchesSerialResult) {
    std::string trace = make_trace(20000);
    AccumulatedCounts serial = FoldedTraceAccumulator{}.accumulate(trace);
    AccumulatedCounts parallel = ParallelFoldedTraceAccumulator{64}.accumulate(trace);

    EXPECT_EQ(parallel.total_samples, serial.total_samples);
    EXPECT_EQ(parallel.self_counts, serial.self_counts);
    EXPECT_EQ(parallel.total_counts, serial.total_counts);
}

TEST(ParallelFoldedTraceAccumulatorTest, SmallInputFallsBackToSerial) {
    AccumulatedCounts counts = ParallelFoldedTraceAccumulator{}.accumulate(flatprof::testing::kDhrystoneInst);
    EXPECT_EQ(counts.total_samples, 80000742u);
}

TEST(ParallelFoldedTraceAccumulatorTest, ReportsFirstMalformedLine) {
    std::string trace = make_trace(3000);
    // 在两处插入坏行, 只报告靠前的那一处
    size_t pos = 0;
    for (int i = 0; i < 1200; ++i) pos = trace.find('\n', pos) + 1;
    trace.insert(pos, "first_bad_line\n");
    size_t first_line_number = 1201;
    trace += "second bad\n";

    try {
        ParallelFoldedTraceAccumulator{16}.accumulate(trace, "big.txt");
        FAIL() << "expected MalformedLineException";
    } catch (const MalformedLineException& e) {
        EXPECT_EQ(e.line(), "first_bad_line");
        EXPECT_EQ(e.line_number(), first_line_number);
        EXPECT_EQ(e.source(), "big.txt");
    }
}

TEST(ParallelFoldedTraceAccumulatorTest, OverflowReportedLikeSerial) {
    std::string trace = make_trace(3000);
    const size_t line_number = static_cast<size_t>(std::count(trace.begin(), trace.end(), '\n')) + 1;
    trace += "_start;huge " + std::to_string(std::numeric_limits<size_t>::max()) + "\n";
    trace += make_trace(200);

    try {
        ParallelFoldedTraceAccumulator{16}.accumulate(trace, "big.txt");
        FAIL() << "expected MalformedLineException";
    } catch (const MalformedLineException& e) {
        EXPECT_EQ(e.reason(), "count overflows total");
        EXPECT_EQ(e.line_number(), line_number);
        EXPECT_EQ(e.source(), "big.txt");
    }
}

TEST(ParallelFoldedTraceAccumulatorTest, AllZeroTraceIsEmpty) {
    std::string trace;
    for (int i = 0; i < 500; ++i) trace += "main;idle 0\n";
    EXPECT_THROW(ParallelFoldedTraceAccumulator{8}.accumulate(trace), EmptyTraceException);
}

TEST(ParallelFoldedTraceAccumulatorTest, PlugsIntoGenerator) {
    flatprof::testing::ScopedTempDir dir;
    FlatProfileConfig config;
    config.trace = dir.write("trace.txt", make_trace(5000));

    FlatProfileGenerator generator(config);
    FlatProfile serial = generator.load_profile(config.trace, std::nullopt);
    generator.set_accumulator(std::make_unique<ParallelFoldedTraceAccumulator>(32));
    FlatProfile parallel = generator.load_profile(config.trace, std::nullopt);

    ASSERT_EQ(parallel.rows.size(), serial.rows.size());
    for (size_t i = 0; i < serial.rows.size(); ++i) {
        EXPECT_EQ(parallel.rows[i].symbol, serial.rows[i].symbol);
        EXPECT_EQ(parallel.rows[i].self_count, serial.rows[i].self_count);
        EXPECT_EQ(parallel.rows[i].total_count, serial.rows[i].total_count);
        EXPECT_DOUBLE_EQ(parallel.rows[i].cum_percent, serial.rows[i].cum_percent);
    }
}
