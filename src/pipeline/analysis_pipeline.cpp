#include "pipeline/analysis_pipeline.hpp"
#include "core/errors.hpp"
#include "ingest/entry_loader.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace lpi {

namespace {

const AnalysisConfig& validated(const AnalysisConfig& config) {
    config.validate();
    return config;
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

constexpr int kTotalStages = 6;

} // anonymous namespace

// ============================================================================
// PipelineStatistics
// ============================================================================

void PipelineStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Analysis Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Input:\n";
    std::cout << "  Records: " << records << "\n";
    std::cout << "  Embedding dimension: " << embedding_dimension << "\n\n";

    std::cout << "Results:\n";
    std::cout << "  Themes: " << themes << "\n";
    std::cout << "  Weeks: " << weeks << "\n";
    std::cout << "  Anomalies: " << anomalies << "\n";
    std::cout << "  Cycle detected: " << (cycle_detected ? "yes" : "no") << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Embedding: " << embedding_time_seconds << " seconds\n";
    std::cout << "  Clustering: " << clustering_time_seconds << " seconds\n";
    std::cout << "  Aggregation: " << aggregation_time_seconds << " seconds\n";
    std::cout << "  Anomaly detection: " << anomaly_time_seconds << " seconds\n";
    std::cout << "  Cycle detection: " << cycle_time_seconds << " seconds\n";
    std::cout << "  Synthesis: " << synthesis_time_seconds << " seconds\n";
    std::cout << "  Total: " << total_time_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json PipelineStatistics::to_json() const {
    json j;

    j["records"] = records;
    j["embedding_dimension"] = embedding_dimension;
    j["themes"] = themes;
    j["weeks"] = weeks;
    j["anomalies"] = anomalies;
    j["cycle_detected"] = cycle_detected;

    j["embedding_time_seconds"] = embedding_time_seconds;
    j["clustering_time_seconds"] = clustering_time_seconds;
    j["aggregation_time_seconds"] = aggregation_time_seconds;
    j["anomaly_time_seconds"] = anomaly_time_seconds;
    j["cycle_time_seconds"] = cycle_time_seconds;
    j["synthesis_time_seconds"] = synthesis_time_seconds;
    j["total_time_seconds"] = total_time_seconds;

    return j;
}

// ============================================================================
// AnalysisReport
// ============================================================================

json AnalysisReport::to_json() const {
    json j;
    j["meta"] = {
        {"run_id", run_id},
        {"created_utc", created_utc},
        {"embedding_provider", embedding_provider},
        {"seed", config.seed},
        {"k", config.k},
        {"contamination", config.contamination},
        {"anomaly_top_n", config.anomaly_top_n},
        {"week_window", config.week_window},
        {"total_records", statistics.records}
    };

    json themes_arr = json::array();
    for (const auto& t : themes) themes_arr.push_back(t.to_json());
    j["themes"] = themes_arr;

    json weeks_arr = json::array();
    for (size_t i = 0; i < weeks.size(); ++i) {
        json w = weeks[i].to_json();
        w["dominant_theme"] = "";
        for (const auto& t : themes) {
            if (t.cluster_id == weeks[i].dominant_cluster) w["dominant_theme"] = t.label;
        }
        w["micro_insight"] = i < insights.micro.size() ? insights.micro[i] : "";
        weeks_arr.push_back(w);
    }
    j["temporal_evolution"] = weeks_arr;

    json anomalies_arr = json::array();
    for (const auto& a : anomalies) anomalies_arr.push_back(a.to_json());
    j["anomalies"] = anomalies_arr;

    json dow = json::object();
    for (const auto& stat : day_of_week) {
        dow[stat.weekday] = {
            {"average_sentiment", stat.average},
            {"samples", stat.samples},
            {"trend", stat.tendency}
        };
    }
    j["pattern_cycles"] = {
        {"cycle_detected", cycle.has_value()},
        {"cycle", cycle ? cycle->to_json() : json(nullptr)},
        {"day_of_week_patterns", dow}
    };

    j["macro_insight"] = insights.macro;
    j["predictive_insight"] = insights.predictive;
    j["safety_notes"] = insights.safety_notes;
    j["warnings"] = warnings;
    j["statistics"] = statistics.to_json();
    return j;
}

void AnalysisReport::save_to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write report file: " + path);
    }
    file << to_json().dump(2);
}

// ============================================================================
// AnalysisPipeline
// ============================================================================

AnalysisPipeline::AnalysisPipeline(const AnalysisConfig& config, EmbeddingProvider& provider)
    : config_(validated(config)),
      provider_(provider),
      clusterer_(clustering_options(config_)),
      aggregator_(config_.trend_epsilon),
      anomaly_detector_(anomaly_options(config_)),
      cycle_detector_(cycle_options(config_)),
      synthesizer_(SynthesisOptions{config_.trend_epsilon}) {}

ClusteringOptions AnalysisPipeline::clustering_options(const AnalysisConfig& config) {
    ClusteringOptions options;
    options.restarts = config.kmeans_restarts;
    options.max_iterations = config.kmeans_max_iterations;
    options.tolerance = config.kmeans_tolerance;
    options.metric = parse_distance_metric(config.distance_metric);
    options.confidence_scale = config.confidence_scale;
    options.exemplar_count = static_cast<size_t>(config.exemplar_count);
    options.keyword_count = static_cast<size_t>(config.keyword_count);
    return options;
}

AnomalyOptions AnalysisPipeline::anomaly_options(const AnalysisConfig& config) {
    AnomalyOptions options;
    options.trees = static_cast<size_t>(config.isolation_trees);
    options.sample_size = static_cast<size_t>(config.isolation_sample_size);
    options.variance_floor = config.variance_floor;
    options.metric = parse_distance_metric(config.distance_metric);
    return options;
}

CycleOptions AnalysisPipeline::cycle_options(const AnalysisConfig& config) {
    CycleOptions options;
    options.ratio_threshold = config.cycle_ratio_threshold;
    options.variance_floor = config.variance_floor;
    return options;
}

void AnalysisPipeline::report_progress(const std::string& stage, int current, int total) {
    if (progress_cb_) {
        progress_cb_(stage, current, total);
    }
}

void AnalysisPipeline::log(const std::string& message) const {
    if (config_.verbose) {
        std::cout << message << std::endl;
    }
}

void AnalysisPipeline::warn(const std::string& message) const {
    std::cerr << "Warning: " << message << std::endl;
}

std::vector<DayRecord> AnalysisPipeline::embed_entries(const std::vector<EntryRecord>& entries) {
    std::vector<Vector> vectors = provider_.embed_batch(entries);
    if (vectors.size() != entries.size()) {
        throw std::runtime_error("Embedding provider returned " + std::to_string(vectors.size()) +
                                 " vectors for " + std::to_string(entries.size()) + " records");
    }

    std::vector<DayRecord> days;
    days.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        if (vectors[i].size() != provider_.dimension()) {
            throw std::runtime_error("Embedding for '" + entries[i].entry_id + "' has dimension " +
                                     std::to_string(vectors[i].size()) + ", expected " +
                                     std::to_string(provider_.dimension()));
        }
        DayRecord day;
        day.id = entries[i].entry_id;
        day.date = entries[i].date;
        day.embedding = std::move(vectors[i]);
        day.text = combined_text(entries[i]);
        day.mood = mood_scorer_.score(day.text);
        days.push_back(std::move(day));
    }
    return days;
}

AnalysisReport AnalysisPipeline::run(const std::vector<EntryRecord>& entries) {
    partial_ = PartialResults();
    stats_ = PipelineStatistics();

    if (entries.size() < 2) {
        throw InsufficientDataError("the pipeline needs at least 2 records, got " +
                                    std::to_string(entries.size()));
    }

    auto start = std::chrono::steady_clock::now();
    report_progress("embed", 0, kTotalStages);
    log("Embedding " + std::to_string(entries.size()) + " records with " +
        provider_.get_provider_name() + " provider...");

    std::vector<DayRecord> days;
    try {
        days = embed_entries(entries);
    } catch (const std::exception& e) {
        partial_.failed_stage = "embed";
        partial_.failure_message = e.what();
        throw;
    }
    stats_.embedding_time_seconds = seconds_since(start);
    partial_.completed_stages.push_back("embed");

    AnalysisReport report = analyze(std::move(days));
    stats_.total_time_seconds = seconds_since(start);
    report.statistics = stats_;
    return report;
}

AnalysisReport AnalysisPipeline::run_days(const std::vector<DayRecord>& days) {
    partial_ = PartialResults();
    stats_ = PipelineStatistics();

    if (days.size() < 2) {
        throw InsufficientDataError("the pipeline needs at least 2 records, got " +
                                    std::to_string(days.size()));
    }

    auto start = std::chrono::steady_clock::now();
    AnalysisReport report = analyze(days);
    stats_.total_time_seconds = seconds_since(start);
    report.statistics = stats_;
    return report;
}

AnalysisReport AnalysisPipeline::analyze(std::vector<DayRecord> days) {
    partial_.days = std::move(days);
    const std::vector<DayRecord>& in = partial_.days;

    stats_.records = in.size();
    stats_.embedding_dimension = in.front().embedding.size();

    AnalysisReport report;
    report.run_id = run_id_;
    report.created_utc = utc_timestamp();
    report.config = config_;
    report.embedding_provider = provider_.get_provider_name();

    std::string stage;
    try {
        // Theme clustering
        stage = "cluster";
        report_progress(stage, 1, kTotalStages);
        log("Clustering into " + std::to_string(config_.k) + " themes...");
        auto t0 = std::chrono::steady_clock::now();
        ClusteringResult clustering = clusterer_.cluster(in, config_.k, config_.seed);
        stats_.clustering_time_seconds = seconds_since(t0);
        if (clustering.warning) {
            warn(clustering.warning->message());
            report.warnings.push_back(clustering.warning->message());
        }
        partial_.clustering = clustering;
        partial_.completed_stages.push_back(stage);
        const auto& clusters = partial_.clustering->clusters;

        // Weekly aggregation
        stage = "aggregate";
        report_progress(stage, 2, kTotalStages);
        log("Aggregating " + std::to_string(config_.week_window) + "-day windows...");
        t0 = std::chrono::steady_clock::now();
        partial_.weeks = aggregator_.aggregate(in, clusters, config_.week_window);
        stats_.aggregation_time_seconds = seconds_since(t0);
        partial_.completed_stages.push_back(stage);

        // Anomalies
        stage = "anomalies";
        report_progress(stage, 3, kTotalStages);
        log("Scoring anomalies...");
        t0 = std::chrono::steady_clock::now();
        partial_.anomalies = anomaly_detector_.detect(in, clusters, config_.contamination,
                                                      config_.seed, config_.anomaly_top_n);
        stats_.anomaly_time_seconds = seconds_since(t0);
        partial_.completed_stages.push_back(stage);

        // Cycles
        stage = "cycles";
        report_progress(stage, 4, kTotalStages);
        log("Testing cyclic structure...");
        t0 = std::chrono::steady_clock::now();
        std::set<int> periods(config_.cycle_periods.begin(), config_.cycle_periods.end());
        partial_.cycle = cycle_detector_.detect_cycles(in, periods);
        report.day_of_week = cycle_detector_.day_of_week_profile(in);
        partial_.cycles_evaluated = true;
        stats_.cycle_time_seconds = seconds_since(t0);
        partial_.completed_stages.push_back(stage);

        // Insights
        stage = "synthesize";
        report_progress(stage, 5, kTotalStages);
        log("Synthesizing insights...");
        t0 = std::chrono::steady_clock::now();
        std::vector<std::string> source_texts;
        source_texts.reserve(in.size());
        for (const auto& day : in) source_texts.push_back(day.text);
        report.insights = synthesizer_.synthesize(*partial_.weeks, clusters, *partial_.anomalies,
                                                  partial_.cycle, source_texts);
        stats_.synthesis_time_seconds = seconds_since(t0);
        partial_.completed_stages.push_back(stage);
    } catch (const std::exception& e) {
        partial_.failed_stage = stage;
        partial_.failure_message = e.what();
        std::cerr << "Error: stage '" << stage << "' failed: " << e.what() << std::endl;
        throw;
    }

    report.themes = partial_.clustering->clusters;
    report.weeks = *partial_.weeks;
    report.anomalies = *partial_.anomalies;
    report.cycle = partial_.cycle;

    stats_.themes = static_cast<int>(report.themes.size());
    stats_.weeks = static_cast<int>(report.weeks.size());
    stats_.anomalies = static_cast<int>(report.anomalies.size());
    stats_.cycle_detected = report.cycle.has_value();

    report_progress("done", kTotalStages, kTotalStages);
    return report;
}

} // namespace lpi
