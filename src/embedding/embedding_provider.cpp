#include "embedding/embedding_provider.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include "ingest/entry_loader.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace lpi {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string http_post(
    const std::string& url,
    const std::string& json_payload,
    const std::vector<std::string>& headers,
    int timeout_seconds
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string response;
    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw std::runtime_error("CURL request failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw std::runtime_error(
            "HTTP request failed with code " + std::to_string(http_code) + ": " + response
        );
    }

    return response;
}

std::uint64_t fnv1a(const std::string& s) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // anonymous namespace

// ============================================================================
// EmbeddingProvider Base Class
// ============================================================================

std::vector<Vector> EmbeddingProvider::embed_batch(const std::vector<EntryRecord>& entries) {
    std::vector<Vector> vectors;
    vectors.reserve(entries.size());
    for (const auto& entry : entries) {
        vectors.push_back(embed(entry));
    }
    return vectors;
}

// ============================================================================
// Hashing Provider
// ============================================================================

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension)
    : dimension_(dimension) {
    if (dimension_ == 0) {
        throw InvalidConfigurationError("embedding_dim", "must be at least 1");
    }
}

Vector HashingEmbeddingProvider::embed(const EntryRecord& entry) {
    return embed_text(combined_text(entry));
}

Vector HashingEmbeddingProvider::embed_text(const std::string& text) const {
    std::vector<double> acc(dimension_, 0.0);
    for (const auto& token : tokenize_words(text, 2)) {
        std::uint64_t h = fnv1a(token);
        size_t bucket = static_cast<size_t>(h % dimension_);
        double sign = ((h >> 63) & 1ULL) ? -1.0 : 1.0;
        acc[bucket] += sign;
    }

    double norm = 0.0;
    for (double v : acc) norm += v * v;
    norm = std::sqrt(norm);

    Vector out(dimension_, 0.0f);
    if (norm > 0.0) {
        for (size_t i = 0; i < dimension_; ++i) out[i] = static_cast<float>(acc[i] / norm);
    }
    return out;
}

// ============================================================================
// OpenAI Provider
// ============================================================================

OpenAIEmbeddingProvider::OpenAIEmbeddingProvider(RemoteEmbeddingConfig config)
    : config_(std::move(config)) {
    if (config_.api_key.empty()) {
        throw InvalidConfigurationError("embedding_api_key", "required for the openai provider");
    }
    if (config_.dimension == 0) {
        throw InvalidConfigurationError("embedding_dim", "must be at least 1");
    }
}

std::string OpenAIEmbeddingProvider::make_request(const std::string& json_payload) {
    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Authorization: Bearer " + config_.api_key
    };

    int attempts = 0;
    while (true) {
        try {
            return http_post(config_.api_base_url + "/embeddings", json_payload, headers,
                             config_.timeout_seconds);
        } catch (const std::runtime_error& e) {
            attempts++;
            if (attempts >= config_.max_retries) {
                throw std::runtime_error("Embedding request failed after " +
                                         std::to_string(attempts) + " attempts: " + e.what());
            }
            if (config_.verbose) {
                std::cerr << "Attempt " << attempts << " failed for embeddings: "
                          << e.what() << ". Retrying..." << std::endl;
            }
            // Exponential backoff
            std::this_thread::sleep_for(std::chrono::seconds(1 << (attempts - 1)));
        }
    }
}

std::string OpenAIEmbeddingProvider::build_payload(const std::vector<std::string>& inputs) const {
    json j;
    j["model"] = config_.model;
    j["input"] = inputs;
    j["dimensions"] = config_.dimension;
    j["encoding_format"] = "float";
    return j.dump();
}

std::vector<Vector> OpenAIEmbeddingProvider::parse_response(const std::string& body,
                                                            size_t expected) const {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed embedding response: ") + e.what());
    }

    if (j.contains("error")) {
        throw std::runtime_error("Embedding API error: " + j["error"].value("message", std::string("unknown")));
    }
    if (!j.contains("data") || !j["data"].is_array() || j["data"].size() != expected) {
        throw std::runtime_error("Embedding response does not contain " + std::to_string(expected) +
                                 " vectors");
    }

    std::vector<Vector> vectors(expected);
    for (const auto& item : j["data"]) {
        size_t index = item.value("index", static_cast<size_t>(0));
        if (index >= expected) {
            throw std::runtime_error("Embedding response index out of range: " + std::to_string(index));
        }
        Vector v = item.at("embedding").get<Vector>();
        if (v.size() != config_.dimension) {
            throw std::runtime_error("Embedding dimension " + std::to_string(v.size()) +
                                     " does not match configured " + std::to_string(config_.dimension));
        }
        vectors[index] = std::move(v);
    }
    return vectors;
}

Vector OpenAIEmbeddingProvider::embed(const EntryRecord& entry) {
    return embed_batch({entry}).front();
}

std::vector<Vector> OpenAIEmbeddingProvider::embed_batch(const std::vector<EntryRecord>& entries) {
    if (entries.empty()) return {};

    std::vector<std::string> inputs;
    inputs.reserve(entries.size());
    for (const auto& e : entries) {
        std::string text = combined_text(e);
        // The endpoint rejects empty input strings
        inputs.push_back(text.empty() ? std::string(" ") : text);
    }

    std::string response = make_request(build_payload(inputs));
    return parse_response(response, entries.size());
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<EmbeddingProvider> EmbeddingProviderFactory::create(const AnalysisConfig& config) {
    if (config.embedding_dim < 1) {
        throw InvalidConfigurationError("embedding_dim", "must be at least 1");
    }

    if (config.embedding_provider == "hashing") {
        return std::make_unique<HashingEmbeddingProvider>(static_cast<size_t>(config.embedding_dim));
    }
    if (config.embedding_provider == "openai") {
        RemoteEmbeddingConfig remote;
        remote.api_key = config.embedding_api_key;
        remote.model = config.embedding_model;
        remote.dimension = static_cast<size_t>(config.embedding_dim);
        remote.timeout_seconds = config.embedding_timeout_seconds;
        remote.max_retries = config.embedding_max_retries;
        remote.verbose = config.verbose;
        return std::make_unique<OpenAIEmbeddingProvider>(remote);
    }

    throw InvalidConfigurationError("embedding_provider",
                                    "unknown provider '" + config.embedding_provider + "'");
}

} // namespace lpi
