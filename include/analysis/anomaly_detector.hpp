#pragma once

#include "analysis/rule_table.hpp"
#include "core/types.hpp"
#include "core/vector_math.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace lpi {

// Isolation ensemble configuration
struct AnomalyOptions {
    size_t trees = 100;                  // Trees in the ensemble
    size_t sample_size = 256;            // Points per tree (capped at N)
    double variance_floor = 1e-9;        // Max per-dimension variance treated as constant data
    DistanceMetric metric = DistanceMetric::Euclidean;  // For nearest-theme lookup
    RuleTable category_rules = default_category_rules();
    DescriptionTable category_descriptions = default_category_descriptions();
};

/**
 * @brief Isolation-forest outlier scoring over day embeddings
 *
 * Each tree recursively splits a random subsample on a random dimension at a
 * uniform value between the subset's min and max, until a point is alone or
 * the depth cap ceil(log2(sample)) is reached. Shorter average paths mean
 * higher scores; scores lie in (0, 1].
 */
class AnomalyDetector {
public:
    explicit AnomalyDetector(AnomalyOptions options = AnomalyOptions());

    // Score every vector; empty if the data has (near) zero variance
    std::vector<double> score(const std::vector<Vector>& vectors, std::uint64_t seed) const;

    /**
     * @brief Ranked anomalies, day ids are the decimal input indices
     *
     * The operative set is the top ceil(contamination * N) scores; at most top_n
     * of those are returned, ranked 1.. by descending score, ties to the
     * earlier input.
     *
     * @throws InvalidConfigurationError for contamination outside (0, 0.5) or top_n < 0
     * @throws InsufficientDataError for fewer than two vectors
     */
    std::vector<Anomaly> detect(const std::vector<Vector>& vectors,
                                double contamination,
                                std::uint64_t seed,
                                int top_n) const;

    // Same ranking over days, categorized via the nearest theme and the rule table
    std::vector<Anomaly> detect(const std::vector<DayRecord>& days,
                                const std::vector<ThemeCluster>& clusters,
                                double contamination,
                                std::uint64_t seed,
                                int top_n) const;

    // Rule label from the nearest theme's keywords, else from the day text (nearest may be null)
    std::string categorize(const DayRecord& day, const ThemeCluster* nearest) const;

    // Average path length of an unsuccessful BST search over n points
    static double average_path_length(size_t n);

private:
    AnomalyOptions options_;

    struct Node {
        int dimension = -1;              // -1 marks a leaf
        float split = 0.0f;
        int left = -1;
        int right = -1;
        size_t size = 0;                 // points that reached this node
    };

    struct Tree {
        std::vector<Node> nodes;
    };

    Tree build_tree(const std::vector<Vector>& vectors, std::vector<size_t> sample,
                    size_t depth_limit, std::mt19937_64& rng) const;

    int grow(Tree& tree, const std::vector<Vector>& vectors, std::vector<size_t>& indices,
             size_t depth, size_t depth_limit, std::mt19937_64& rng) const;

    double path_length(const Tree& tree, const Vector& v) const;

    bool is_degenerate(const std::vector<Vector>& vectors) const;

    // Indices by score descending, ties to the smaller tie key (input index when keys are
    // empty), trimmed to min(top_n, ceil(contamination * N))
    std::vector<size_t> rank(const std::vector<double>& scores, double contamination, int top_n,
                             const std::vector<std::string>& tie_keys) const;
};

} // namespace lpi
