#include <gtest/gtest.h>
#include "analysis/temporal_aggregator.hpp"
#include "core/errors.hpp"
#include "test_data.hpp"

using namespace lpi;

class TemporalAggregatorTest : public ::testing::Test {
protected:
    TemporalAggregator aggregator;

    // n days alternating between two themes
    std::vector<DayRecord> days_for(size_t n, const std::vector<double>& moods = {}) {
        return testdata::make_days(std::vector<Vector>(n, Vector{0.0f}), moods);
    }

    std::vector<ThemeCluster> two_themes(const std::vector<DayRecord>& days) {
        std::vector<std::string> even, odd;
        for (size_t i = 0; i < days.size(); ++i) {
            (i % 2 == 0 ? even : odd).push_back(days[i].id);
        }
        return {testdata::make_cluster(0, "Work Performance", even),
                testdata::make_cluster(1, "Rest & Recovery", odd)};
    }
};

// ==========================================
// Windowing Tests
// ==========================================

TEST_F(TemporalAggregatorTest, ThirtyDaysGiveFiveWeeks) {
    auto days = days_for(30);
    auto weeks = aggregator.aggregate(days, two_themes(days));

    ASSERT_EQ(weeks.size(), 5u);
    for (size_t w = 0; w < 4; ++w) EXPECT_EQ(weeks[w].day_count(), 7u);
    EXPECT_EQ(weeks[4].day_count(), 2u);
    EXPECT_EQ(weeks[0].start_date, "2024-01-01");
    EXPECT_EQ(weeks[0].end_date, "2024-01-07");
    EXPECT_EQ(weeks[4].start_date, "2024-01-29");
    EXPECT_EQ(weeks[4].end_date, "2024-01-30");
    for (size_t w = 0; w < weeks.size(); ++w) {
        EXPECT_EQ(weeks[w].week_index, static_cast<int>(w) + 1);
    }
}

TEST_F(TemporalAggregatorTest, DistributionSumsToDayCount) {
    auto days = days_for(30);
    auto weeks = aggregator.aggregate(days, two_themes(days));
    for (const auto& week : weeks) {
        int sum = 0;
        for (const auto& [cid, count] : week.theme_distribution) sum += count;
        EXPECT_EQ(static_cast<size_t>(sum), week.day_count());
    }
}

TEST_F(TemporalAggregatorTest, DominantThemeTiesGoToLowerId) {
    auto days = days_for(8);
    auto weeks = aggregator.aggregate(days, two_themes(days));
    ASSERT_EQ(weeks.size(), 2u);
    // Week 1 has four even days and three odd days
    EXPECT_EQ(weeks[0].dominant_cluster, 0);

    auto pair = days_for(2);
    auto pair_weeks = aggregator.aggregate(pair, two_themes(pair));
    ASSERT_EQ(pair_weeks.size(), 1u);
    EXPECT_EQ(pair_weeks[0].theme_distribution.at(0), 1);
    EXPECT_EQ(pair_weeks[0].theme_distribution.at(1), 1);
    EXPECT_EQ(pair_weeks[0].dominant_cluster, 0);
}

TEST_F(TemporalAggregatorTest, SingleDayFinalWeek) {
    auto days = days_for(8);
    auto weeks = aggregator.aggregate(days, two_themes(days));
    ASSERT_EQ(weeks.size(), 2u);
    EXPECT_EQ(weeks[1].day_count(), 1u);
    EXPECT_EQ(weeks[1].theme_distribution.size(), 1u);
    EXPECT_EQ(weeks[1].start_date, weeks[1].end_date);
}

TEST_F(TemporalAggregatorTest, CustomWindow) {
    auto days = days_for(10);
    auto weeks = aggregator.aggregate(days, two_themes(days), 3);
    ASSERT_EQ(weeks.size(), 4u);
    EXPECT_EQ(weeks[3].day_count(), 1u);
}

// ==========================================
// Mood and Trend Tests
// ==========================================

TEST_F(TemporalAggregatorTest, TrendFollowsWeeklyMood) {
    std::vector<double> moods;
    for (int i = 0; i < 7; ++i) moods.push_back(0.0);
    for (int i = 0; i < 7; ++i) moods.push_back(0.5);
    for (int i = 0; i < 7; ++i) moods.push_back(0.52);
    for (int i = 0; i < 7; ++i) moods.push_back(-0.2);

    auto days = days_for(28, moods);
    auto weeks = aggregator.aggregate(days, two_themes(days));
    ASSERT_EQ(weeks.size(), 4u);

    EXPECT_EQ(weeks[0].trend, Trend::Stable);
    EXPECT_EQ(weeks[1].trend, Trend::Improving);
    EXPECT_EQ(weeks[2].trend, Trend::Stable);
    EXPECT_EQ(weeks[3].trend, Trend::Declining);
    EXPECT_NEAR(weeks[1].mood_score, 0.5, 1e-12);
    EXPECT_NEAR(weeks[3].mood_score, -0.2, 1e-12);
}

TEST_F(TemporalAggregatorTest, ClassifyUsesEpsilon) {
    TemporalAggregator strict(0.1);
    EXPECT_EQ(strict.classify(0.15), Trend::Improving);
    EXPECT_EQ(strict.classify(-0.15), Trend::Declining);
    EXPECT_EQ(strict.classify(0.1), Trend::Stable);
    EXPECT_EQ(strict.classify(-0.05), Trend::Stable);
}

// ==========================================
// Error Tests
// ==========================================

TEST_F(TemporalAggregatorTest, ZeroWindowRejected) {
    auto days = days_for(4);
    EXPECT_THROW(aggregator.aggregate(days, two_themes(days), 0), InvalidConfigurationError);
}

TEST_F(TemporalAggregatorTest, UnassignedDayRejected) {
    auto days = days_for(4);
    auto clusters = two_themes(days);
    clusters[1].member_ids.erase(days[1].id);
    EXPECT_THROW(aggregator.aggregate(days, clusters), std::invalid_argument);
}

TEST_F(TemporalAggregatorTest, NegativeEpsilonRejected) {
    EXPECT_THROW(TemporalAggregator(-0.1), InvalidConfigurationError);
}
