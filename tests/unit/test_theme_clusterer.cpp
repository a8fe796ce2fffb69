#include <gtest/gtest.h>
#include "analysis/theme_clusterer.hpp"
#include "core/errors.hpp"
#include "test_data.hpp"
#include <set>

using namespace lpi;

class ThemeClustererTest : public ::testing::Test {
protected:
    ThemeClusterer clusterer;

    // 30 days, 5 themes, 16 dimensions
    std::vector<Vector> vectors = testdata::separated_themes(30, 5, 16, 0.3, 7);
};

// ==========================================
// Partition Tests
// ==========================================

TEST_F(ThemeClustererTest, EveryRecordInExactlyOneCluster) {
    auto result = clusterer.cluster(vectors, 5, 42);

    std::set<std::string> seen;
    size_t total = 0;
    for (const auto& c : result.clusters) {
        EXPECT_FALSE(c.member_ids.empty());
        total += c.entry_count();
        seen.insert(c.member_ids.begin(), c.member_ids.end());
    }
    EXPECT_EQ(total, vectors.size());
    EXPECT_EQ(seen.size(), vectors.size());
    ASSERT_EQ(result.assignments.size(), vectors.size());

    for (size_t i = 0; i < vectors.size(); ++i) {
        const auto* owner = result.find_cluster_of(std::to_string(i));
        ASSERT_NE(owner, nullptr);
        EXPECT_EQ(owner->cluster_id, result.assignments[i]);
    }
}

TEST_F(ThemeClustererTest, RecoversSeparatedThemes) {
    auto result = clusterer.cluster(vectors, 5, 42);
    ASSERT_EQ(result.clusters.size(), 5u);
    EXPECT_FALSE(result.warning.has_value());

    for (const auto& c : result.clusters) {
        EXPECT_EQ(c.entry_count(), 6u);
        std::set<size_t> themes;
        for (const auto& id : c.member_ids) themes.insert(std::stoul(id) % 5);
        EXPECT_EQ(themes.size(), 1u) << "cluster " << c.cluster_id << " mixes themes";
        EXPECT_GE(c.confidence, 0.7);
    }
}

TEST_F(ThemeClustererTest, ConfidenceWithinUnitInterval) {
    auto result = clusterer.cluster(vectors, 3, 11);
    ASSERT_EQ(result.entry_confidence.size(), vectors.size());
    for (double c : result.entry_confidence) {
        EXPECT_GE(c, 0.0);
        EXPECT_LE(c, 1.0);
    }
    for (const auto& c : result.clusters) {
        EXPECT_GE(c.confidence, 0.0);
        EXPECT_LE(c.confidence, 1.0);
    }
}

TEST_F(ThemeClustererTest, ExemplarsAreMembers) {
    auto result = clusterer.cluster(vectors, 5, 42);
    for (const auto& c : result.clusters) {
        EXPECT_LE(c.exemplar_ids.size(), 3u);
        EXPECT_FALSE(c.exemplar_ids.empty());
        for (const auto& id : c.exemplar_ids) {
            EXPECT_TRUE(c.member_ids.count(id));
        }
    }
}

TEST_F(ThemeClustererTest, SameSeedSameResult) {
    auto a = clusterer.cluster(vectors, 4, 123);
    auto b = clusterer.cluster(vectors, 4, 123);
    EXPECT_EQ(a.assignments, b.assignments);
    EXPECT_DOUBLE_EQ(a.inertia, b.inertia);
    EXPECT_EQ(a.entry_confidence, b.entry_confidence);
}

TEST_F(ThemeClustererTest, KAsLargeAsInputGivesSingletons) {
    std::vector<Vector> few = {{0.0f, 0.0f}, {5.0f, 0.0f}, {0.0f, 5.0f}, {5.0f, 5.0f}};
    auto result = clusterer.cluster(few, 4, 1);
    ASSERT_EQ(result.clusters.size(), 4u);
    for (const auto& c : result.clusters) EXPECT_EQ(c.entry_count(), 1u);
}

// ==========================================
// Degenerate Input Tests
// ==========================================

TEST_F(ThemeClustererTest, FewerDistinctPointsThanKReducesK) {
    std::vector<Vector> dup = {{1.0f, 1.0f}, {1.0f, 1.0f}, {4.0f, 4.0f}, {4.0f, 4.0f}};
    auto result = clusterer.cluster(dup, 3, 42);

    ASSERT_TRUE(result.warning.has_value());
    EXPECT_EQ(result.warning->requested_k, 3);
    EXPECT_EQ(result.warning->effective_k, 2);
    EXPECT_EQ(result.warning->distinct_points, 2u);
    EXPECT_EQ(result.clusters.size(), 2u);
    EXPECT_NE(result.warning->message().find("k=2"), std::string::npos);
}

TEST_F(ThemeClustererTest, SingleRecordIsInsufficient) {
    std::vector<Vector> one = {{1.0f, 2.0f}};
    EXPECT_THROW(clusterer.cluster(one, 3, 42), InsufficientDataError);
}

TEST_F(ThemeClustererTest, NonPositiveKRejected) {
    try {
        clusterer.cluster(vectors, 0, 42);
        FAIL() << "expected InvalidConfigurationError";
    } catch (const InvalidConfigurationError& e) {
        EXPECT_EQ(e.field(), "k");
    }
}

TEST_F(ThemeClustererTest, MixedDimensionsRejected) {
    std::vector<Vector> mixed = {{1.0f, 2.0f}, {1.0f, 2.0f, 3.0f}, {0.0f, 0.0f}};
    EXPECT_THROW(clusterer.cluster(mixed, 2, 42), std::invalid_argument);
}

// ==========================================
// Labelling Tests
// ==========================================

TEST_F(ThemeClustererTest, LabelsFromExemplarKeywords) {
    std::vector<Vector> vecs = {
        {10.0f, 0.0f}, {10.2f, 0.1f}, {9.9f, -0.1f},
        {0.0f, 10.0f}, {0.1f, 10.1f}, {-0.1f, 9.8f}};
    auto days = testdata::make_days(vecs);
    days[0].text = "Deadline pressure on the project, long meeting with the team.";
    days[1].text = "Project review meeting, another deadline for the client.";
    days[2].text = "Team meeting about the project deadline.";
    days[3].text = "Slow weekend, time to relax and sleep in.";
    days[4].text = "Weekend rest, a long sleep and a quiet break.";
    days[5].text = "Relax at home, weekend rest.";

    auto result = clusterer.cluster(days, 2, 42);
    ASSERT_EQ(result.clusters.size(), 2u);

    const auto* work = result.find_cluster_of("day_1");
    const auto* rest = result.find_cluster_of("day_4");
    ASSERT_NE(work, nullptr);
    ASSERT_NE(rest, nullptr);
    EXPECT_EQ(work->label, "Work Performance");
    EXPECT_EQ(rest->label, "Rest & Recovery");
    EXPECT_FALSE(work->keywords.empty());
}

TEST_F(ThemeClustererTest, UnknownVocabularyFallsBackToKeywords) {
    std::vector<Vector> vecs = {{0.0f}, {0.1f}, {9.0f}, {9.1f}};
    std::vector<std::string> ids = {"a", "b", "c", "d"};
    auto text_of = [](const std::string& id) {
        return (id == "a" || id == "b") ? std::string("pottery glazing pottery")
                                        : std::string("");
    };

    auto result = clusterer.cluster(vecs, ids, 2, 42, text_of);
    const auto* pottery = result.find_cluster_of("a");
    const auto* blank = result.find_cluster_of("c");
    ASSERT_NE(pottery, nullptr);
    ASSERT_NE(blank, nullptr);
    EXPECT_EQ(pottery->label, "Pottery Glazing");
    EXPECT_EQ(blank->label, "Theme " + std::to_string(blank->cluster_id + 1));
}
