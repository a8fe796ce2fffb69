#pragma once

#include "analysis/rule_table.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "core/vector_math.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace lpi {

// Theme clustering configuration
struct ClusteringOptions {
    int restarts = 10;                   // Independent K-Means runs, best inertia kept
    int max_iterations = 300;            // Lloyd iterations per run
    double tolerance = 1e-4;             // Stop when no centroid moves further than this
    DistanceMetric metric = DistanceMetric::Euclidean;
    double confidence_scale = 2.0;       // Larger = more lenient confidence
    size_t exemplar_count = 3;
    size_t keyword_count = 10;
    RuleTable label_rules = default_theme_label_rules();
};

// Resolves a record id to its text, for keyword extraction
using TextAccessor = std::function<std::string(const std::string& id)>;

struct ClusteringResult {
    std::vector<ThemeCluster> clusters;
    std::vector<int> assignments;        // per input vector, index into clusters
    std::vector<double> entry_confidence;
    double inertia = 0.0;
    int iterations = 0;                  // Lloyd iterations of the winning run
    std::optional<DegenerateClusteringWarning> warning;

    // Cluster owning the given record id, or nullptr
    const ThemeCluster* find_cluster_of(const std::string& id) const;
};

class ThemeClusterer {
public:
    explicit ThemeClusterer(ClusteringOptions options = ClusteringOptions());

    /**
     * @brief Cluster raw vectors; record ids are the decimal input indices
     * @throws InsufficientDataError if fewer than two vectors
     * @throws InvalidConfigurationError if k < 1
     */
    ClusteringResult cluster(const std::vector<Vector>& vectors, int k, std::uint64_t seed) const;

    // Cluster embedded days; keywords come from the exemplars' fused text
    ClusteringResult cluster(const std::vector<DayRecord>& days, int k, std::uint64_t seed) const;

    ClusteringResult cluster(const std::vector<Vector>& vectors,
                             const std::vector<std::string>& ids,
                             int k,
                             std::uint64_t seed,
                             const TextAccessor& text_of) const;

    const ClusteringOptions& options() const { return options_; }

private:
    ClusteringOptions options_;

    // One Lloyd run from a k-means++ seeding
    struct Run {
        std::vector<Vector> centroids;
        std::vector<int> labels;
        double inertia = 0.0;
        int iterations = 0;
    };

    Run run_lloyd(const std::vector<Vector>& vectors, int k, std::mt19937_64& rng) const;

    std::vector<Vector> seed_centroids(const std::vector<Vector>& vectors, int k,
                                       std::mt19937_64& rng) const;

    // Nearest centroid index, ties to the lower index
    int nearest(const Vector& v, const std::vector<Vector>& centroids, double* dist_out) const;

    // Moves the point farthest from its centroid into an empty cluster
    bool reseed_empty(const std::vector<Vector>& vectors, std::vector<Vector>& centroids,
                      std::vector<int>& labels, int empty_cluster) const;

    std::vector<double> entry_confidences(const std::vector<Vector>& vectors,
                                          const std::vector<Vector>& centroids,
                                          const std::vector<int>& labels) const;
};

} // namespace lpi
