#include "flatprof.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace flatprof;
using flatprof::testing::build_text;

namespace {
// 百分比: f=40 e=30 d=20 c=6 b=3 a=1
FlatProfile sample_profile() {
    return build_text("x;f 40\nx;e 30\nx;d 20\nx;c 6\nx;b 3\nx;a 1\n");
}

std::vector<std::string> symbols(const std::vector<FlatRow>& rows) {
    std::vector<std::string> out;
    for (const auto& row : rows) out.push_back(row.symbol);
    return out;
}
} // namespace

TEST(RowFilterTest, NoOptionsKeepsEverything) {
    FlatProfile profile = sample_profile();
    RowFilterOptions options;
    EXPECT_TRUE(options.empty());
    EXPECT_EQ(filter_rows(profile.rows, options).size(), profile.rows.size());
}

TEST(RowFilterTest, TopKeepsPrefix) {
    FlatProfile profile = sample_profile();
    auto rows = filter_rows(profile.rows, RowFilterOptions{std::nullopt, 2});
    EXPECT_EQ(symbols(rows), (std::vector<std::string>{"f", "e"}));

    EXPECT_EQ(filter_rows(profile.rows, RowFilterOptions{std::nullopt, 100}).size(), 6u);
    EXPECT_TRUE(filter_rows(profile.rows, RowFilterOptions{std::nullopt, 0}).empty());
}

TEST(RowFilterTest, NegativeTopYieldsEmpty) {
    FlatProfile profile = sample_profile();
    EXPECT_TRUE(filter_rows(profile.rows, RowFilterOptions{std::nullopt, -3}).empty());
}

TEST(RowFilterTest, ThresholdIsInclusive) {
    FlatProfile profile = sample_profile();
    auto rows = filter_rows(profile.rows, RowFilterOptions{20.0, std::nullopt});
    EXPECT_EQ(symbols(rows), (std::vector<std::string>{"f", "e", "d"}));
    for (const auto& row : rows) EXPECT_GE(row.percent, 20.0);
}

TEST(RowFilterTest, ThresholdAppliedBeforeTop) {
    FlatProfile profile = sample_profile();
    auto rows = filter_rows(profile.rows, RowFilterOptions{5.0, 10});
    EXPECT_EQ(symbols(rows), (std::vector<std::string>{"f", "e", "d", "c"}));

    rows = filter_rows(profile.rows, RowFilterOptions{5.0, 2});
    EXPECT_EQ(symbols(rows), (std::vector<std::string>{"f", "e"}));
}

TEST(RowFilterTest, FilteringKeepsCumulativePercentOfFullRanking) {
    FlatProfile profile = sample_profile();
    auto rows = filter_rows(profile.rows, RowFilterOptions{std::nullopt, 3});
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_NEAR(rows.back().cum_percent, 90.0, 1e-9);
}

TEST(RowFilterTest, GenericProjection) {
    std::vector<std::pair<std::string, double>> rows = {{"a", 9.0}, {"b", 1.0}, {"c", 5.0}};
    auto kept = filter_rows(rows, RowFilterOptions{4.0, std::nullopt},
                            [](const std::pair<std::string, double>& r) { return r.second; });
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].first, "a");
    EXPECT_EQ(kept[1].first, "c");
}
