#include <gtest/gtest.h>
#include "core/config.hpp"
#include "core/errors.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>

using namespace lpi;
using json = nlohmann::json;

namespace {

std::string field_of_failure(const AnalysisConfig& config) {
    try {
        config.validate();
    } catch (const InvalidConfigurationError& e) {
        return e.field();
    }
    return "";
}

} // anonymous namespace

TEST(AnalysisConfigTest, DefaultsAreValid) {
    AnalysisConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.k, 5);
    EXPECT_DOUBLE_EQ(config.contamination, 0.1);
    EXPECT_EQ(config.anomaly_top_n, 3);
    EXPECT_EQ(config.week_window, 7);
    EXPECT_EQ(config.cycle_periods, std::vector<int>{7});
}

TEST(AnalysisConfigTest, ValidationNamesOffendingField) {
    AnalysisConfig config;
    config.k = 7;
    EXPECT_EQ(field_of_failure(config), "k");

    config = AnalysisConfig();
    config.k = 2;
    EXPECT_EQ(field_of_failure(config), "k");

    config = AnalysisConfig();
    config.contamination = 0.5;
    EXPECT_EQ(field_of_failure(config), "contamination");

    config = AnalysisConfig();
    config.contamination = 0.0;
    EXPECT_EQ(field_of_failure(config), "contamination");

    config = AnalysisConfig();
    config.week_window = 0;
    EXPECT_EQ(field_of_failure(config), "week_window");

    config = AnalysisConfig();
    config.distance_metric = "manhattan";
    EXPECT_EQ(field_of_failure(config), "distance_metric");

    config = AnalysisConfig();
    config.cycle_periods = {7, 1};
    EXPECT_EQ(field_of_failure(config), "cycle_periods");

    config = AnalysisConfig();
    config.embedding_provider = "openai";
    EXPECT_EQ(field_of_failure(config), "embedding_api_key");
}

TEST(AnalysisConfigTest, FromJsonAcceptsAliases) {
    json j = {{"n_clusters", 4}, {"contamination", 0.2}, {"cycle_periods", {7, 14}}, {"seed", 9}};
    AnalysisConfig config = AnalysisConfig::from_json(j);
    EXPECT_EQ(config.k, 4);
    EXPECT_DOUBLE_EQ(config.contamination, 0.2);
    EXPECT_EQ(config.cycle_periods, (std::vector<int>{7, 14}));
    EXPECT_EQ(config.seed, 9u);
    EXPECT_EQ(config.anomaly_top_n, 3);
}

TEST(AnalysisConfigTest, WrongTypeIsConfigurationError) {
    json j = {{"k", "five"}};
    try {
        AnalysisConfig::from_json(j);
        FAIL() << "expected InvalidConfigurationError";
    } catch (const InvalidConfigurationError& e) {
        EXPECT_EQ(e.field(), "k");
    }
}

TEST(AnalysisConfigTest, ApiKeyIsRedacted) {
    AnalysisConfig config;
    config.embedding_api_key = "sk-secret";
    EXPECT_EQ(config.to_json()["embedding_api_key"], "***REDACTED***");
}

TEST(AnalysisConfigTest, FileRoundTrip) {
    auto path = (std::filesystem::temp_directory_path() / "lpi_config_test.json").string();
    AnalysisConfig config;
    config.k = 3;
    config.week_window = 5;
    config.distance_metric = "cosine";
    config.to_json_file(path);

    AnalysisConfig loaded = AnalysisConfig::from_json_file(path);
    std::remove(path.c_str());

    EXPECT_EQ(loaded.k, 3);
    EXPECT_EQ(loaded.week_window, 5);
    EXPECT_EQ(loaded.distance_metric, "cosine");
}

TEST(AnalysisConfigTest, MissingFileThrows) {
    EXPECT_THROW(AnalysisConfig::from_json_file("/nonexistent/lpi.json"), std::runtime_error);
}

TEST(AnalysisConfigTest, EnvironmentOverrides) {
    setenv("LPI_K", "4", 1);
    setenv("LPI_CONTAMINATION", "0.25", 1);
    AnalysisConfig config = AnalysisConfig::from_environment();
    unsetenv("LPI_K");
    unsetenv("LPI_CONTAMINATION");

    EXPECT_EQ(config.k, 4);
    EXPECT_DOUBLE_EQ(config.contamination, 0.25);

    setenv("LPI_TOP_N", "three", 1);
    EXPECT_THROW(AnalysisConfig::from_environment(), InvalidConfigurationError);
    unsetenv("LPI_TOP_N");
}

TEST(AnalysisConfigTest, OversizedEnvironmentIntegerRejected) {
    setenv("LPI_K", "4294967300", 1);
    try {
        AnalysisConfig::from_environment();
        unsetenv("LPI_K");
        FAIL() << "expected InvalidConfigurationError";
    } catch (const InvalidConfigurationError& e) {
        unsetenv("LPI_K");
        EXPECT_EQ(e.field(), "k");
    }
}

TEST(AnalysisConfigTest, SavedConfigTakesApiKeyFromEnvironment) {
    auto path = (std::filesystem::temp_directory_path() / "lpi_config_key_test.json").string();
    AnalysisConfig config;
    config.embedding_provider = "openai";
    config.embedding_api_key = "sk-written";
    config.to_json_file(path);

    AnalysisConfig loaded = AnalysisConfig::from_json_file(path);
    std::remove(path.c_str());
    EXPECT_TRUE(loaded.embedding_api_key.empty());
    EXPECT_THROW(loaded.validate(), InvalidConfigurationError);

    unsetenv("LPI_OPENAI_API_KEY");
    setenv("OPENAI_API_KEY", "sk-from-env", 1);
    loaded.load_api_key_from_environment();
    unsetenv("OPENAI_API_KEY");

    EXPECT_EQ(loaded.embedding_api_key, "sk-from-env");
    EXPECT_NO_THROW(loaded.validate());
}
