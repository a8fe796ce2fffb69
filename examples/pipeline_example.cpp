/**
 * Pipeline Example
 *
 * Builds four weeks of synthetic diary entries with a work/weekend rhythm,
 * embeds them with the offline hashing provider and prints the analysis.
 *
 * Usage: ./pipeline_example [output.json]
 */

#include "core/date.hpp"
#include "embedding/embedding_provider.hpp"
#include "ingest/entry_loader.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include <iostream>

using namespace lpi;

namespace {

std::vector<EntryRecord> make_month() {
    const std::vector<std::string> weekday_texts = {
        "Stressful project deadline at the office, team meeting ran late and pressure kept building.",
        "Client review went badly, anxious about the presentation and tired after work.",
        "Long meeting with the team, project work is tough but manageable.",
        "Presentation rehearsal at the office, nervous but motivated to finish the project.",
        "Finished the client deliverable, relieved and proud of the team work."
    };
    const std::vector<std::string> weekend_texts = {
        "Relaxing weekend hiking with friends by the beach, great fun and recharged.",
        "Family dinner together, wonderful conversation and a peaceful evening of music."
    };

    std::vector<EntryRecord> entries;
    Date start = parse_iso_date("2024-03-04");  // a Monday
    for (int i = 0; i < 28; ++i) {
        EntryRecord e;
        e.entry_id = "entry_" + std::to_string(i + 1);
        e.date = Date::from_days(start.to_days() + i).to_string();
        int dow = i % 7;
        e.text = dow < 5 ? weekday_texts[static_cast<size_t>(dow)]
                         : weekend_texts[static_cast<size_t>(dow - 5)];
        e.voice_transcript = dow < 5 ? "Voice note about the work day." : "Voice note from the weekend.";
        e.image_caption = dow < 5 ? "A desk with a laptop" : "An outdoor scene";
        e.location_city = "Lisbon";
        entries.push_back(e);
    }
    // One unusual day
    entries[17].text = "Felt hopeless and exhausted, could not sleep, sick with worry about everything.";
    return entries;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string output_path = argc > 1 ? argv[1] : "pipeline_example_results.json";

    AnalysisConfig config;
    config.k = 4;
    config.seed = 7;
    config.embedding_dim = 128;
    config.verbose = true;

    try {
        auto provider = EmbeddingProviderFactory::create(config);
        AnalysisPipeline pipeline(config, *provider);
        pipeline.set_run_id("example");

        AnalysisReport report = pipeline.run(make_month());

        for (const auto& theme : report.themes) {
            std::cout << "Theme " << theme.cluster_id << ": " << theme.label
                      << " (" << theme.entry_count() << " entries)\n";
        }
        for (const auto& micro : report.insights.micro) {
            std::cout << micro << "\n";
        }
        std::cout << report.insights.macro << "\n" << report.insights.predictive << "\n";
        for (const auto& note : report.insights.safety_notes) {
            std::cout << "Note: " << note << "\n";
        }

        report.statistics.print_summary();
        report.save_to_json(output_path);
        std::cout << "Saved " << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
