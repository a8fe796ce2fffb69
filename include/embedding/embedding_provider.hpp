#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace lpi {

// ============================================================================
// Embedding Provider Interface
// ============================================================================

/**
 * @brief Maps a daily record to a fixed-dimension semantic vector
 *
 * Constructed once, injected into the pipeline and reused for every record of
 * a run. Every vector it returns has dimension() components.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Embed one record's fused text/voice/image content
     */
    virtual Vector embed(const EntryRecord& entry) = 0;

    /**
     * @brief Embed several records; the default embeds them one by one
     */
    virtual std::vector<Vector> embed_batch(const std::vector<EntryRecord>& entries);

    virtual size_t dimension() const = 0;

    virtual std::string get_provider_name() const = 0;
};

// ============================================================================
// Hashing Provider
// ============================================================================

/**
 * @brief Offline, deterministic bag-of-words embedding
 *
 * Tokens are hashed (FNV-1a) into dimension() signed buckets and the
 * result is L2-normalized. Records with no tokens map to the zero vector.
 */
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension = 384);

    Vector embed(const EntryRecord& entry) override;
    Vector embed_text(const std::string& text) const;

    size_t dimension() const override { return dimension_; }
    std::string get_provider_name() const override { return "hashing"; }

private:
    size_t dimension_;
};

// ============================================================================
// OpenAI Provider
// ============================================================================

struct RemoteEmbeddingConfig {
    std::string api_key;
    std::string model = "text-embedding-3-small";
    std::string api_base_url = "https://api.openai.com/v1";
    size_t dimension = 384;
    int timeout_seconds = 60;
    int max_retries = 3;
    bool verbose = false;
};

/**
 * @brief Embeddings from the OpenAI /embeddings endpoint over libcurl
 */
class OpenAIEmbeddingProvider : public EmbeddingProvider {
public:
    explicit OpenAIEmbeddingProvider(RemoteEmbeddingConfig config);

    Vector embed(const EntryRecord& entry) override;
    std::vector<Vector> embed_batch(const std::vector<EntryRecord>& entries) override;

    size_t dimension() const override { return config_.dimension; }
    std::string get_provider_name() const override { return "openai"; }

    // Request body for a list of inputs
    std::string build_payload(const std::vector<std::string>& inputs) const;

    // Vectors from a response body, in input order; throws std::runtime_error
    std::vector<Vector> parse_response(const std::string& body, size_t expected) const;

private:
    RemoteEmbeddingConfig config_;

    std::string make_request(const std::string& json_payload);
};

// ============================================================================
// Factory
// ============================================================================

class EmbeddingProviderFactory {
public:
    // "hashing" or "openai" per config.embedding_provider
    static std::unique_ptr<EmbeddingProvider> create(const AnalysisConfig& config);
};

} // namespace lpi
