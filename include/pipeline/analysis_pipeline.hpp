#pragma once

#include "analysis/anomaly_detector.hpp"
#include "analysis/cycle_detector.hpp"
#include "analysis/mood_scorer.hpp"
#include "analysis/temporal_aggregator.hpp"
#include "analysis/theme_clusterer.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "embedding/embedding_provider.hpp"
#include "insight/insight_synthesizer.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lpi {

// ============================================================================
// Pipeline Statistics
// ============================================================================

/**
 * @brief Counts and stage timings from one run
 */
struct PipelineStatistics {
    size_t records = 0;
    size_t embedding_dimension = 0;
    int themes = 0;
    int weeks = 0;
    int anomalies = 0;
    bool cycle_detected = false;

    double embedding_time_seconds = 0.0;
    double clustering_time_seconds = 0.0;
    double aggregation_time_seconds = 0.0;
    double anomaly_time_seconds = 0.0;
    double cycle_time_seconds = 0.0;
    double synthesis_time_seconds = 0.0;
    double total_time_seconds = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Results of the stages that completed, kept for diagnostics when a
 * later stage fails
 */
struct PartialResults {
    std::vector<DayRecord> days;
    std::optional<ClusteringResult> clustering;
    std::optional<std::vector<WeekAggregate>> weeks;
    std::optional<std::vector<Anomaly>> anomalies;
    bool cycles_evaluated = false;
    std::optional<CyclicPattern> cycle;
    std::vector<std::string> completed_stages;
    std::string failed_stage;
    std::string failure_message;
};

/**
 * @brief Complete output artifact of a successful run
 */
struct AnalysisReport {
    std::string run_id;
    std::string created_utc;
    AnalysisConfig config;
    std::string embedding_provider;

    std::vector<ThemeCluster> themes;
    std::vector<WeekAggregate> weeks;
    std::vector<Anomaly> anomalies;
    std::optional<CyclicPattern> cycle;
    std::vector<DayOfWeekStat> day_of_week;
    InsightBundle insights;
    std::vector<std::string> warnings;
    PipelineStatistics statistics;

    nlohmann::json to_json() const;
    void save_to_json(const std::string& path) const;
};

// ============================================================================
// Analysis Pipeline
// ============================================================================

// Progress callback: (stage name, stages done, total stages)
using PipelineProgressCallback = std::function<void(const std::string& stage, int current, int total)>;

/**
 * @brief Runs embed -> cluster -> aggregate -> anomalies -> cycles -> synthesize
 *
 * Stages run sequentially, each consuming the complete output of its
 * predecessors. A failing stage aborts the run (its exception propagates);
 * whatever completed before it remains available from partial().
 */
class AnalysisPipeline {
public:
    /**
     * @brief Validate the configuration and build the stage components
     *
     * @param config   Analysis configuration
     * @param provider Embedding provider, must outlive the pipeline
     * @throws InvalidConfigurationError naming the offending field
     */
    AnalysisPipeline(const AnalysisConfig& config, EmbeddingProvider& provider);

    /**
     * @brief Analyze a chronologically ordered set of entries
     *
     * @throws InsufficientDataError if fewer than two entries
     */
    AnalysisReport run(const std::vector<EntryRecord>& entries);

    // Analyze days that are already embedded (skips the provider)
    AnalysisReport run_days(const std::vector<DayRecord>& days);

    void set_run_id(const std::string& run_id) { run_id_ = run_id; }
    void set_progress_callback(PipelineProgressCallback cb) { progress_cb_ = std::move(cb); }

    const PartialResults& partial() const { return partial_; }
    const PipelineStatistics& statistics() const { return stats_; }
    const AnalysisConfig& config() const { return config_; }

    // Embed entries into days, scoring mood from the fused text
    std::vector<DayRecord> embed_entries(const std::vector<EntryRecord>& entries);

private:
    AnalysisConfig config_;
    EmbeddingProvider& provider_;
    std::string run_id_;
    PipelineProgressCallback progress_cb_;

    ThemeClusterer clusterer_;
    TemporalAggregator aggregator_;
    AnomalyDetector anomaly_detector_;
    CycleDetector cycle_detector_;
    InsightSynthesizer synthesizer_;
    LexiconMoodScorer mood_scorer_;

    PartialResults partial_;
    PipelineStatistics stats_;

    AnalysisReport analyze(std::vector<DayRecord> days);

    void report_progress(const std::string& stage, int current, int total);
    void log(const std::string& message) const;
    void warn(const std::string& message) const;

    static ClusteringOptions clustering_options(const AnalysisConfig& config);
    static AnomalyOptions anomaly_options(const AnalysisConfig& config);
    static CycleOptions cycle_options(const AnalysisConfig& config);
};

} // namespace lpi
