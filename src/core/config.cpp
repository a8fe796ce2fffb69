#include "core/config.hpp"
#include "core/errors.hpp"
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace lpi {

namespace {

template <typename T>
void read_field(const json& j, const char* name, T& target) {
    if (!j.contains(name)) return;
    try {
        target = j.at(name).get<T>();
    } catch (const json::exception& e) {
        throw InvalidConfigurationError(name, std::string("wrong type (") + e.what() + ")");
    }
}

long parse_env_long(const char* name, const char* value) {
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0') {
        throw InvalidConfigurationError(name, std::string("not an integer: ") + value);
    }
    if (errno == ERANGE) {
        throw InvalidConfigurationError(name, std::string("out of range: ") + value);
    }
    return parsed;
}

int parse_env_int(const char* name, const char* value) {
    long parsed = parse_env_long(name, value);
    if (parsed < INT_MIN || parsed > INT_MAX) {
        throw InvalidConfigurationError(name, std::string("out of range: ") + value);
    }
    return static_cast<int>(parsed);
}

const char* const kRedactedKey = "***REDACTED***";

double parse_env_double(const char* name, const char* value) {
    char* end = nullptr;
    double parsed = std::strtod(value, &end);
    if (end == value || *end != '\0') {
        throw InvalidConfigurationError(name, std::string("not a number: ") + value);
    }
    return parsed;
}

} // anonymous namespace

AnalysisConfig AnalysisConfig::from_json(const json& j) {
    AnalysisConfig config;

    // Short names from the configuration surface are accepted as aliases
    read_field(j, "k", config.k);
    read_field(j, "n_clusters", config.k);
    read_field(j, "kmeans_restarts", config.kmeans_restarts);
    read_field(j, "kmeans_max_iterations", config.kmeans_max_iterations);
    read_field(j, "kmeans_tolerance", config.kmeans_tolerance);
    read_field(j, "distance_metric", config.distance_metric);
    read_field(j, "confidence_scale", config.confidence_scale);
    read_field(j, "exemplar_count", config.exemplar_count);
    read_field(j, "keyword_count", config.keyword_count);

    read_field(j, "week_window", config.week_window);
    read_field(j, "trend_epsilon", config.trend_epsilon);

    read_field(j, "contamination", config.contamination);
    read_field(j, "anomaly_top_n", config.anomaly_top_n);
    read_field(j, "isolation_trees", config.isolation_trees);
    read_field(j, "isolation_sample_size", config.isolation_sample_size);
    read_field(j, "variance_floor", config.variance_floor);

    read_field(j, "cycle_periods", config.cycle_periods);
    read_field(j, "cycle_ratio_threshold", config.cycle_ratio_threshold);

    read_field(j, "embedding_provider", config.embedding_provider);
    read_field(j, "embedding_dim", config.embedding_dim);
    read_field(j, "embedding_model", config.embedding_model);
    read_field(j, "embedding_api_key", config.embedding_api_key);
    if (config.embedding_api_key == kRedactedKey) config.embedding_api_key.clear();
    read_field(j, "embedding_timeout_seconds", config.embedding_timeout_seconds);
    read_field(j, "embedding_max_retries", config.embedding_max_retries);

    read_field(j, "seed", config.seed);
    read_field(j, "verbose", config.verbose);

    return config;
}

json AnalysisConfig::to_json() const {
    json j;

    j["k"] = k;
    j["kmeans_restarts"] = kmeans_restarts;
    j["kmeans_max_iterations"] = kmeans_max_iterations;
    j["kmeans_tolerance"] = kmeans_tolerance;
    j["distance_metric"] = distance_metric;
    j["confidence_scale"] = confidence_scale;
    j["exemplar_count"] = exemplar_count;
    j["keyword_count"] = keyword_count;

    j["week_window"] = week_window;
    j["trend_epsilon"] = trend_epsilon;

    j["contamination"] = contamination;
    j["anomaly_top_n"] = anomaly_top_n;
    j["isolation_trees"] = isolation_trees;
    j["isolation_sample_size"] = isolation_sample_size;
    j["variance_floor"] = variance_floor;

    j["cycle_periods"] = cycle_periods;
    j["cycle_ratio_threshold"] = cycle_ratio_threshold;

    j["embedding_provider"] = embedding_provider;
    j["embedding_dim"] = embedding_dim;
    j["embedding_model"] = embedding_model;
    j["embedding_api_key"] = embedding_api_key.empty() ? "" : kRedactedKey;
    j["embedding_timeout_seconds"] = embedding_timeout_seconds;
    j["embedding_max_retries"] = embedding_max_retries;

    j["seed"] = seed;
    j["verbose"] = verbose;

    return j;
}

AnalysisConfig AnalysisConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config file " + path + " must contain a JSON object");
    }
    return from_json(j);
}

void AnalysisConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << to_json().dump(2);
}

AnalysisConfig AnalysisConfig::from_environment() {
    AnalysisConfig config;

    if (const char* v = std::getenv("LPI_K")) {
        config.k = parse_env_int("k", v);
    }
    if (const char* v = std::getenv("LPI_SEED")) {
        long seed = parse_env_long("seed", v);
        if (seed < 0) throw InvalidConfigurationError("seed", std::string("must be non-negative: ") + v);
        config.seed = static_cast<std::uint64_t>(seed);
    }
    if (const char* v = std::getenv("LPI_CONTAMINATION")) {
        config.contamination = parse_env_double("contamination", v);
    }
    if (const char* v = std::getenv("LPI_TOP_N")) {
        config.anomaly_top_n = parse_env_int("anomaly_top_n", v);
    }
    if (const char* v = std::getenv("LPI_WEEK_WINDOW")) {
        config.week_window = parse_env_int("week_window", v);
    }
    if (const char* v = std::getenv("LPI_EMBEDDING_PROVIDER")) {
        config.embedding_provider = v;
    }
    if (const char* v = std::getenv("LPI_EMBEDDING_MODEL")) {
        config.embedding_model = v;
    }

    config.load_api_key_from_environment();
    return config;
}

void AnalysisConfig::load_api_key_from_environment() {
    const char* api_key = std::getenv("LPI_OPENAI_API_KEY");
    if (!api_key) api_key = std::getenv("OPENAI_API_KEY");
    if (api_key) embedding_api_key = api_key;
}

void AnalysisConfig::validate() const {
    if (k < 3 || k > 6) {
        throw InvalidConfigurationError("k", "must be between 3 and 6, got " + std::to_string(k));
    }
    if (kmeans_restarts < 1) {
        throw InvalidConfigurationError("kmeans_restarts", "must be at least 1");
    }
    if (kmeans_max_iterations < 1) {
        throw InvalidConfigurationError("kmeans_max_iterations", "must be at least 1");
    }
    if (!(kmeans_tolerance >= 0.0) || !std::isfinite(kmeans_tolerance)) {
        throw InvalidConfigurationError("kmeans_tolerance", "must be a finite non-negative number");
    }
    if (distance_metric != "euclidean" && distance_metric != "cosine") {
        throw InvalidConfigurationError("distance_metric",
                                        "must be 'euclidean' or 'cosine', got '" + distance_metric + "'");
    }
    if (!(confidence_scale > 0.0) || !std::isfinite(confidence_scale)) {
        throw InvalidConfigurationError("confidence_scale", "must be positive");
    }
    if (exemplar_count < 1) {
        throw InvalidConfigurationError("exemplar_count", "must be at least 1");
    }
    if (keyword_count < 0) {
        throw InvalidConfigurationError("keyword_count", "must not be negative");
    }

    if (week_window < 1) {
        throw InvalidConfigurationError("week_window", "must be at least 1 day");
    }
    if (!(trend_epsilon >= 0.0) || !std::isfinite(trend_epsilon)) {
        throw InvalidConfigurationError("trend_epsilon", "must be a finite non-negative number");
    }

    if (!(contamination > 0.0 && contamination < 0.5)) {
        throw InvalidConfigurationError("contamination",
                                        "must be in the open interval (0, 0.5), got " +
                                        std::to_string(contamination));
    }
    if (anomaly_top_n < 0) {
        throw InvalidConfigurationError("anomaly_top_n", "must not be negative");
    }
    if (isolation_trees < 1) {
        throw InvalidConfigurationError("isolation_trees", "must be at least 1");
    }
    if (isolation_sample_size < 2) {
        throw InvalidConfigurationError("isolation_sample_size", "must be at least 2");
    }
    if (!(variance_floor >= 0.0) || !std::isfinite(variance_floor)) {
        throw InvalidConfigurationError("variance_floor", "must be a finite non-negative number");
    }

    if (cycle_periods.empty()) {
        throw InvalidConfigurationError("cycle_periods", "must name at least one period");
    }
    for (int p : cycle_periods) {
        if (p < 2) {
            throw InvalidConfigurationError("cycle_periods",
                                            "periods must be at least 2 days, got " + std::to_string(p));
        }
    }
    if (!(cycle_ratio_threshold > 0.0 && cycle_ratio_threshold < 1.0)) {
        throw InvalidConfigurationError("cycle_ratio_threshold", "must be in the open interval (0, 1)");
    }

    if (embedding_provider != "hashing" && embedding_provider != "openai") {
        throw InvalidConfigurationError("embedding_provider",
                                        "must be 'hashing' or 'openai', got '" + embedding_provider + "'");
    }
    if (embedding_dim < 1) {
        throw InvalidConfigurationError("embedding_dim", "must be at least 1");
    }
    if (embedding_provider == "openai" && embedding_api_key.empty()) {
        throw InvalidConfigurationError("embedding_api_key", "required for the openai provider");
    }
    if (embedding_timeout_seconds < 1) {
        throw InvalidConfigurationError("embedding_timeout_seconds", "must be at least 1");
    }
    if (embedding_max_retries < 1) {
        throw InvalidConfigurationError("embedding_max_retries", "must be at least 1");
    }
}

} // namespace lpi
