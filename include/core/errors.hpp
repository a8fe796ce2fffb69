#pragma once

#include <stdexcept>
#include <string>

namespace lpi {

// Fewer records than a stage needs. Fatal: aborts the pipeline.
class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& message)
        : std::runtime_error("Insufficient data: " + message) {}
};

// Out-of-range or malformed configuration value. Fatal, raised before any stage runs.
class InvalidConfigurationError : public std::runtime_error {
public:
    InvalidConfigurationError(const std::string& field, const std::string& message)
        : std::runtime_error("Invalid configuration '" + field + "': " + message),
          field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// Non-fatal: k was reduced because the input has fewer distinct points.
// Recorded on the clustering result and logged, never thrown.
struct DegenerateClusteringWarning {
    int requested_k = 0;
    int effective_k = 0;
    size_t distinct_points = 0;

    std::string message() const {
        return "Requested " + std::to_string(requested_k) + " themes but only " +
               std::to_string(distinct_points) + " distinct embeddings exist; using k=" +
               std::to_string(effective_k);
    }
};

} // namespace lpi
