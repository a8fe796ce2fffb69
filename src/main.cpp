#include "cli/cli.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "embedding/embedding_provider.hpp"
#include "ingest/entry_loader.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

using namespace lpi;

// ============== Helper Functions ==============

// Generate timestamp-based run ID
std::string generate_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << "run_" << std::put_time(std::gmtime(&time), "%Y%m%d_%H%M%S");
    return ss.str();
}

// Config file, or defaults with LPI_* environment overrides; command-line flags win
AnalysisConfig resolve_config(const Args& args) {
    AnalysisConfig config;
    if (args.has("config")) {
        config = AnalysisConfig::from_json_file(args.get("config").value);
        // Saved configs never carry the key
        config.load_api_key_from_environment();
    } else {
        config = AnalysisConfig::from_environment();
    }

    if (args.has("k")) config.k = args.get("k").as_int_in_range("k");
    if (args.has("seed")) {
        long long seed = args.get("seed").as_int();
        if (seed < 0) throw InvalidConfigurationError("seed", "must be non-negative");
        config.seed = static_cast<std::uint64_t>(seed);
    }
    if (args.has("contamination")) config.contamination = args.get("contamination").as_double();
    if (args.has("top-n")) config.anomaly_top_n = args.get("top-n").as_int_in_range("anomaly_top_n");
    if (args.has("window")) config.week_window = args.get("window").as_int_in_range("week_window");
    if (args.has("periods")) config.cycle_periods = args.get("periods").as_int_list();
    if (args.has("metric")) config.distance_metric = args.get("metric").value;
    if (args.has("provider")) config.embedding_provider = args.get("provider").value;
    if (args.has("verbose")) config.verbose = true;

    return config;
}

// ============== lpi analyze ==============
int cmd_analyze(const Args& args) {
    std::string input_path = args.require("input");
    std::string output_path = args.get("output", "output/results.json").value;

    AnalysisConfig config = resolve_config(args);
    config.validate();

    std::cout << "Loading entries from: " << input_path << "\n";
    std::vector<EntryRecord> entries = load_entries(input_path);
    std::cout << "Loaded " << entries.size() << " entries\n";

    auto provider = EmbeddingProviderFactory::create(config);

    AnalysisPipeline pipeline(config, *provider);
    pipeline.set_run_id(generate_run_id());
    pipeline.set_progress_callback([](const std::string& stage, int current, int total) {
        if (stage == "done") return;
        std::cout << "[" << (current + 1) << "/" << total << "] " << stage << "\n";
    });

    AnalysisReport report;
    try {
        report = pipeline.run(entries);
    } catch (const std::exception&) {
        const auto& partial = pipeline.partial();
        std::cerr << "Analysis aborted in stage '" << partial.failed_stage << "'";
        if (!partial.completed_stages.empty()) {
            std::cerr << " after:";
            for (const auto& s : partial.completed_stages) std::cerr << " " << s;
        }
        std::cerr << "\n";
        throw;
    }

    fs::path out(output_path);
    if (out.has_parent_path()) {
        fs::create_directories(out.parent_path());
    }
    report.save_to_json(output_path);

    std::cout << "\nThemes:\n";
    for (const auto& theme : report.themes) {
        std::cout << "  [" << theme.cluster_id << "] " << theme.label
                  << " (" << theme.entry_count() << " entries, confidence "
                  << std::fixed << std::setprecision(2) << theme.confidence << ")\n";
    }
    std::cout << "\nAnomalies: " << report.anomalies.size() << "\n";
    for (const auto& a : report.anomalies) {
        std::cout << "  #" << a.rank << " " << a.description << " [" << a.category
                  << ", score " << std::setprecision(3) << a.score << "]\n";
    }
    std::cout << "\nCycle: " << (report.cycle ? report.cycle->description : "none detected") << "\n";
    std::cout << "\n" << report.insights.macro << "\n";
    std::cout << report.insights.predictive << "\n";

    if (config.verbose) {
        report.statistics.print_summary();
    }

    std::cout << "\nResults saved to: " << output_path << "\n";
    return kExitOk;
}

// ============== lpi config ==============
int cmd_config(const Args& args) {
    std::string output_path = args.get("output", "lpi_config.json").value;
    AnalysisConfig config;
    config.to_json_file(output_path);
    std::cout << "Default configuration written to: " << output_path << "\n";
    return kExitOk;
}

// ============== lpi validate ==============
int cmd_validate(const Args& args) {
    std::string config_path = args.require("config");
    AnalysisConfig config = AnalysisConfig::from_json_file(config_path);
    try {
        config.validate();
    } catch (const InvalidConfigurationError& e) {
        std::cerr << config_path << ": " << e.what() << "\n";
        return kExitUsage;
    }
    std::cout << config_path << ": OK\n";
    return kExitOk;
}

int main(int argc, char** argv) {
    CLI cli("lpi", "0.1.0");

    cli.register_command({
        "analyze",
        "Extract themes, weekly trends, anomalies, cycles and insights from daily entries",
        {
            {"input", "i", "JSON array of daily entries", "", true, false},
            {"output", "o", "Output results JSON", "output/results.json", false, false},
            {"config", "c", "Analysis configuration JSON", "", false, false},
            {"k", "k", "Number of themes (3-6)", "", false, false},
            {"seed", "s", "Random seed", "", false, false},
            {"contamination", "", "Expected anomaly fraction (0, 0.5)", "", false, false},
            {"top-n", "n", "Maximum anomalies reported", "", false, false},
            {"window", "w", "Days per aggregation window", "", false, false},
            {"periods", "p", "Candidate cycle periods, comma separated", "", false, false},
            {"metric", "m", "Distance metric", "", false, false, {"euclidean", "cosine"}},
            {"provider", "", "Embedding provider", "", false, false, {"hashing", "openai"}},
            {"verbose", "v", "Verbose output", "", false, true}
        },
        cmd_analyze
    });

    cli.register_command({
        "config",
        "Write the default analysis configuration",
        {
            {"output", "o", "Output config JSON", "lpi_config.json", false, false}
        },
        cmd_config
    });

    cli.register_command({
        "validate",
        "Check an analysis configuration file",
        {
            {"config", "c", "Analysis configuration JSON", "", true, false}
        },
        cmd_validate
    });

    return cli.run(argc, argv);
}
