#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace lpi {

// ============================================================================
// Analysis Configuration
// ============================================================================

/**
 * @brief Every tunable of the analytics engine, validated once before a run
 *
 * The confidence and rule thresholds are empirical; they are exposed here
 * rather than hard-coded in the components.
 */
struct AnalysisConfig {
    // Theme clustering
    int k = 5;                              ///< Number of themes (3-6)
    int kmeans_restarts = 10;               ///< Independent K-Means restarts
    int kmeans_max_iterations = 300;        ///< Lloyd iterations per restart
    double kmeans_tolerance = 1e-4;         ///< Centroid shift convergence tolerance
    std::string distance_metric = "euclidean";  ///< "euclidean" or "cosine"
    double confidence_scale = 2.0;          ///< Per-entry confidence = exp(-d / (scale * mean spread))
    int exemplar_count = 3;                 ///< Exemplars per theme
    int keyword_count = 10;                 ///< Keywords per theme

    // Temporal aggregation
    int week_window = 7;                    ///< Days per window
    double trend_epsilon = 0.05;            ///< Mood delta treated as flat

    // Anomaly detection
    double contamination = 0.1;             ///< Expected anomaly fraction, (0, 0.5)
    int anomaly_top_n = 3;                  ///< Max anomalies reported
    int isolation_trees = 100;              ///< Trees in the isolation ensemble
    int isolation_sample_size = 256;        ///< Points sampled per tree
    double variance_floor = 1e-9;           ///< Below this the data is treated as constant

    // Cycle detection
    std::vector<int> cycle_periods = {7};   ///< Candidate periods in days
    double cycle_ratio_threshold = 0.6;     ///< Max within/overall variance ratio for a cycle

    // Embedding provider
    std::string embedding_provider = "hashing";  ///< "hashing" or "openai"
    int embedding_dim = 384;
    std::string embedding_model = "text-embedding-3-small";
    std::string embedding_api_key;
    int embedding_timeout_seconds = 60;
    int embedding_max_retries = 3;

    // Run
    std::uint64_t seed = 42;
    bool verbose = false;

    static AnalysisConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    static AnalysisConfig from_json_file(const std::string& path);
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by LPI_* environment variables
     *
     * Reads LPI_K, LPI_SEED, LPI_CONTAMINATION, LPI_TOP_N, LPI_WEEK_WINDOW,
     * LPI_EMBEDDING_PROVIDER, LPI_EMBEDDING_MODEL and OPENAI_API_KEY.
     */
    static AnalysisConfig from_environment();

    // LPI_OPENAI_API_KEY, else OPENAI_API_KEY, replaces embedding_api_key when set
    void load_api_key_from_environment();

    /**
     * @brief Range-check every field
     * @throws InvalidConfigurationError naming the first offending field
     */
    void validate() const;
};

} // namespace lpi
