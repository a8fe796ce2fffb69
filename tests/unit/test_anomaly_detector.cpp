#include <gtest/gtest.h>
#include "analysis/anomaly_detector.hpp"
#include "core/errors.hpp"
#include "test_data.hpp"
#include <algorithm>
#include <cmath>
#include <set>

using namespace lpi;

class AnomalyDetectorTest : public ::testing::Test {
protected:
    AnomalyDetector detector;

    // 30 points, outliers at 5, 14 and 22
    std::vector<Vector> vectors = testdata::with_outliers(8, {5, 14, 22}, 99);
};

// ==========================================
// Scoring Tests
// ==========================================

TEST_F(AnomalyDetectorTest, ScoresInUnitInterval) {
    auto scores = detector.score(vectors, 42);
    ASSERT_EQ(scores.size(), vectors.size());
    for (double s : scores) {
        EXPECT_GT(s, 0.0);
        EXPECT_LE(s, 1.0);
    }
}

TEST_F(AnomalyDetectorTest, OutliersScoreHighest) {
    auto scores = detector.score(vectors, 42);
    double min_outlier = std::min({scores[5], scores[14], scores[22]});
    for (size_t i = 0; i < scores.size(); ++i) {
        if (i == 5 || i == 14 || i == 22) continue;
        EXPECT_LT(scores[i], min_outlier) << "inlier " << i;
    }
}

TEST_F(AnomalyDetectorTest, AveragePathLength) {
    EXPECT_DOUBLE_EQ(AnomalyDetector::average_path_length(1), 0.0);
    EXPECT_DOUBLE_EQ(AnomalyDetector::average_path_length(2), 1.0);
    double expected = 2.0 * (std::log(255.0) + 0.5772156649015329) - 2.0 * 255.0 / 256.0;
    EXPECT_NEAR(AnomalyDetector::average_path_length(256), expected, 1e-12);
}

// ==========================================
// Ranking Tests
// ==========================================

TEST_F(AnomalyDetectorTest, DetectsPlantedOutliers) {
    auto anomalies = detector.detect(vectors, 0.1, 42, 3);
    ASSERT_EQ(anomalies.size(), 3u);

    std::set<std::string> ids;
    for (const auto& a : anomalies) ids.insert(a.day_id);
    EXPECT_EQ(ids, (std::set<std::string>{"5", "14", "22"}));
}

TEST_F(AnomalyDetectorTest, FartherOutliersRankFirst) {
    auto graded = testdata::graded_outliers(8, {4, 12, 20}, {5.0f, 15.0f, 60.0f}, 99);
    for (std::uint64_t seed : {1, 7, 42, 99}) {
        auto anomalies = detector.detect(graded, 0.1, seed, 3);
        ASSERT_EQ(anomalies.size(), 3u) << "seed " << seed;
        EXPECT_EQ(anomalies[0].day_id, "20") << "seed " << seed;
        EXPECT_EQ(anomalies[1].day_id, "12") << "seed " << seed;
        EXPECT_EQ(anomalies[2].day_id, "4") << "seed " << seed;
        EXPECT_EQ(anomalies[0].rank, 1);
        EXPECT_EQ(anomalies[2].rank, 3);
    }
}

TEST_F(AnomalyDetectorTest, RanksAreContiguousAndScoresNonIncreasing) {
    auto anomalies = detector.detect(vectors, 0.3, 42, 10);
    ASSERT_FALSE(anomalies.empty());
    for (size_t i = 0; i < anomalies.size(); ++i) {
        EXPECT_EQ(anomalies[i].rank, static_cast<int>(i) + 1);
        if (i > 0) EXPECT_GE(anomalies[i - 1].score, anomalies[i].score);
    }
}

TEST_F(AnomalyDetectorTest, CountBoundedByContaminationAndTopN) {
    // ceil(0.2 * 30) = 6
    EXPECT_EQ(detector.detect(vectors, 0.2, 42, 10).size(), 6u);
    // ceil(0.1 * 30) = 3, not 4
    EXPECT_EQ(detector.detect(vectors, 0.1, 42, 10).size(), 3u);
    // ceil(0.05 * 30) = 2
    EXPECT_EQ(detector.detect(vectors, 0.05, 42, 10).size(), 2u);
    EXPECT_EQ(detector.detect(vectors, 0.4, 42, 3).size(), 3u);
    EXPECT_TRUE(detector.detect(vectors, 0.1, 42, 0).empty());
}

TEST_F(AnomalyDetectorTest, SameSeedSameRanking) {
    auto a = detector.detect(vectors, 0.2, 7, 6);
    auto b = detector.detect(vectors, 0.2, 7, 6);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].day_id, b[i].day_id);
        EXPECT_DOUBLE_EQ(a[i].score, b[i].score);
    }
}

// ==========================================
// Degenerate Input Tests
// ==========================================

TEST_F(AnomalyDetectorTest, ConstantDataHasNoAnomalies) {
    std::vector<Vector> flat(20, Vector{0.5f, 0.5f, 0.5f});
    EXPECT_TRUE(detector.score(flat, 42).empty());
    EXPECT_TRUE(detector.detect(flat, 0.1, 42, 3).empty());
}

TEST_F(AnomalyDetectorTest, InvalidContaminationRejected) {
    for (double c : {0.0, 0.5, -0.1, 0.7}) {
        try {
            detector.detect(vectors, c, 42, 3);
            FAIL() << "contamination " << c << " accepted";
        } catch (const InvalidConfigurationError& e) {
            EXPECT_EQ(e.field(), "contamination");
        }
    }
}

TEST_F(AnomalyDetectorTest, NegativeTopNRejected) {
    EXPECT_THROW(detector.detect(vectors, 0.1, 42, -1), InvalidConfigurationError);
}

TEST_F(AnomalyDetectorTest, SingleRecordIsInsufficient) {
    std::vector<Vector> one = {{1.0f, 2.0f}};
    EXPECT_THROW(detector.detect(one, 0.1, 42, 3), InsufficientDataError);
}

// ==========================================
// Day and Category Tests
// ==========================================

TEST_F(AnomalyDetectorTest, DayDetectionCarriesDatesAndNearestTheme) {
    auto days = testdata::make_days(vectors);
    days[5].text = "Stressed about the deadline, so much pressure.";
    days[14].text = "Exhausted and drained after a sleepless night.";
    days[22].text = "Walked along the river.";

    std::vector<std::string> all;
    for (const auto& d : days) all.push_back(d.id);
    auto theme = testdata::make_cluster(0, "Daily Routine", all);
    theme.centroid = Vector(8, 0.0f);

    auto anomalies = detector.detect(days, {theme}, 0.1, 42, 3);
    ASSERT_EQ(anomalies.size(), 3u);
    for (const auto& a : anomalies) {
        EXPECT_EQ(a.nearest_cluster, 0);
        EXPECT_FALSE(a.date.empty());
        if (a.day_id == "day_6") {
            EXPECT_EQ(a.date, "2024-01-06");
            EXPECT_EQ(a.category, "stress surge");
            EXPECT_EQ(a.description, "Elevated stress levels detected on 2024-01-06");
        } else if (a.day_id == "day_15") {
            EXPECT_EQ(a.category, "fatigue spike");
            EXPECT_EQ(a.description, "Significant fatigue indicators on " + a.date);
        } else {
            EXPECT_EQ(a.day_id, "day_23");
            EXPECT_EQ(a.category, "unclassified");
            EXPECT_EQ(a.description, "Anomaly detected on " + a.date);
        }
        EXPECT_EQ(a.to_json()["description"], a.description);
    }
}

TEST_F(AnomalyDetectorTest, CategoryUsesThemeKeywords) {
    DayRecord day;
    day.id = "d";
    day.text = "Quiet evening.";

    auto tired = testdata::make_cluster(0, "Rest & Recovery", {"d"}, {"tired", "sleep"});
    EXPECT_EQ(detector.categorize(day, &tired), "fatigue spike");
    EXPECT_EQ(detector.categorize(day, nullptr), "unclassified");

    day.text = "Felt unprepared for the exam.";
    EXPECT_EQ(detector.categorize(day, nullptr), "confidence dip");
}

TEST_F(AnomalyDetectorTest, ThemeKeywordsOutrankDayText) {
    DayRecord day;
    day.id = "d";
    day.text = "Big deadline pressure at work";

    auto tired = testdata::make_cluster(0, "Rest & Recovery", {"d"}, {"tired", "sleep"});
    EXPECT_EQ(detector.categorize(day, &tired), "fatigue spike");
    EXPECT_EQ(detector.categorize(day, nullptr), "stress surge");

    // Keywords without a rule hit fall through to the day text
    auto walks = testdata::make_cluster(1, "Outdoors", {"d"}, {"river", "walk"});
    EXPECT_EQ(detector.categorize(day, &walks), "stress surge");
}

// ==========================================
// Description Tests
// ==========================================

TEST(DescriptionTableTest, DefaultTemplatesFillDate) {
    DescriptionTable table = default_category_descriptions();
    EXPECT_EQ(table.describe("stress surge", "2024-01-06"),
              "Elevated stress levels detected on 2024-01-06");
    EXPECT_EQ(table.describe("fatigue spike", "2024-01-07"),
              "Significant fatigue indicators on 2024-01-07");
    EXPECT_EQ(table.describe("confidence dip", "2024-01-08"),
              "Confidence or self-doubt concerns on 2024-01-08");
    EXPECT_EQ(table.describe("unclassified", "2024-01-09"), "Anomaly detected on 2024-01-09");
}

TEST(DescriptionTableTest, CustomTemplateRepeatsPlaceholder) {
    DescriptionTable table({{"emotional spike", "{date}: unusual emotional pattern ({date})"}},
                           "Anomaly detected on {date}");
    EXPECT_EQ(table.describe("emotional spike", "2024-02-01"),
              "2024-02-01: unusual emotional pattern (2024-02-01)");
    EXPECT_EQ(table.describe("other", "day_3"), "Anomaly detected on day_3");
}

TEST_F(AnomalyDetectorTest, VectorDetectionDescribesByIndex) {
    auto anomalies = detector.detect(vectors, 0.1, 42, 3);
    ASSERT_FALSE(anomalies.empty());
    for (const auto& a : anomalies) {
        EXPECT_EQ(a.description, "Anomaly detected on record " + a.day_id);
    }
}
