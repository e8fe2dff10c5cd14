#include "flatprof.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace flatprof;
using flatprof::testing::accumulate_text;
using flatprof::testing::build_text;
using flatprof::testing::kDhrystoneInst;

TEST(FlatProfileBuilderTest, RanksBySelfCountDescending) {
    FlatProfile profile = build_text(kDhrystoneInst);

    ASSERT_EQ(profile.rows.size(), 3u);
    EXPECT_EQ(profile.rows[0].symbol, "Proc0");
    EXPECT_EQ(profile.rows[1].symbol, "memset");
    EXPECT_EQ(profile.rows[2].symbol, "_start");

    EXPECT_NEAR(profile.rows[0].percent, 99.9991, 1e-4);
    EXPECT_DOUBLE_EQ(profile.rows[0].cum_percent, profile.rows[0].percent);
    EXPECT_EQ(profile.rows[2].total_count, 80000742u);
    EXPECT_EQ(profile.meta.total_samples, 80000742u);
    EXPECT_FALSE(profile.meta.has_time());
    EXPECT_FALSE(profile.rows[0].self_time.has_value());
}

TEST(FlatProfileBuilderTest, TiesBrokenBySymbolAscending) {
    FlatProfile profile = build_text("x;zeta 5\nx;alpha 5\nx;Beta 5\nmid 9\n");
    ASSERT_EQ(profile.rows.size(), 4u);
    EXPECT_EQ(profile.rows[0].symbol, "mid");
    // 原始字节序: 大写在小写之前
    EXPECT_EQ(profile.rows[1].symbol, "Beta");
    EXPECT_EQ(profile.rows[2].symbol, "alpha");
    EXPECT_EQ(profile.rows[3].symbol, "zeta");

    for (size_t i = 1; i < profile.rows.size(); ++i) {
        const FlatRow& a = profile.rows[i - 1];
        const FlatRow& b = profile.rows[i];
        EXPECT_TRUE(a.self_count > b.self_count || (a.self_count == b.self_count && a.symbol <= b.symbol));
    }
}

TEST(FlatProfileBuilderTest, NonLeafSymbolsHaveNoRow) {
    FlatProfile profile = build_text("main;work 7\n");
    ASSERT_EQ(profile.rows.size(), 1u);
    EXPECT_EQ(profile.rows[0].symbol, "work");
}

TEST(FlatProfileBuilderTest, CumulativePercentReachesHundred) {
    FlatProfile profile = build_text("a;b 3\na;c;b 5\na 2\nd;e 7\nf 1\ng;h;i 13\n");
    double previous = 0.0;
    double sum = 0.0;
    for (const auto& row : profile.rows) {
        sum += row.percent;
        EXPECT_GE(row.cum_percent, previous);
        EXPECT_NEAR(row.cum_percent, sum, 1e-9);
        previous = row.cum_percent;
    }
    EXPECT_NEAR(profile.rows.back().cum_percent, 100.0, 1e-6);
}

TEST(FlatProfileBuilderTest, ClockFrequencyAddsTimes) {
    FlatProfile profile = build_text(kDhrystoneInst, 100.0);

    ASSERT_TRUE(profile.rows[0].self_time.has_value());
    EXPECT_DOUBLE_EQ(*profile.rows[0].self_time, 80000018.0 / 1e8);
    EXPECT_DOUBLE_EQ(*profile.rows[2].total_time, 80000742.0 / 1e8);

    ASSERT_TRUE(profile.meta.clk_mhz.has_value());
    EXPECT_DOUBLE_EQ(*profile.meta.clk_mhz, 100.0);
    ASSERT_TRUE(profile.meta.total_time_s.has_value());
    EXPECT_DOUBLE_EQ(*profile.meta.total_time_s, 80000742.0 / 1e8);
}

TEST(FlatProfileBuilderTest, NonPositiveClockDisablesTimes) {
    for (double clk : {0.0, -5.0}) {
        FlatProfile profile = build_text(kDhrystoneInst, clk);
        EXPECT_FALSE(profile.meta.clk_mhz.has_value());
        EXPECT_FALSE(profile.meta.total_time_s.has_value());
        for (const auto& row : profile.rows) {
            EXPECT_FALSE(row.self_time.has_value());
            EXPECT_FALSE(row.total_time.has_value());
        }
    }
}

TEST(FlatProfileBuilderTest, RevalidatesExternalCounts) {
    AccumulatedCounts counts;
    counts.self_counts["a"] = 0;
    EXPECT_THROW(FlatProfileBuilder{}.build(counts), EmptyTraceException);
}

TEST(FlatProfileBuilderTest, MissingTotalCountDefaultsToZero) {
    AccumulatedCounts counts;
    counts.self_counts["orphan"] = 4;
    counts.total_samples = 4;
    FlatProfile profile = FlatProfileBuilder{}.build(counts);
    ASSERT_EQ(profile.rows.size(), 1u);
    EXPECT_EQ(profile.rows[0].total_count, 0u);
    EXPECT_DOUBLE_EQ(profile.rows[0].percent, 100.0);
}
