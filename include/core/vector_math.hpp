#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace lpi {

enum class DistanceMetric {
    Euclidean,
    Cosine
};

// "euclidean" / "cosine"; throws InvalidConfigurationError("distance_metric") otherwise
DistanceMetric parse_distance_metric(const std::string& name);
std::string distance_metric_to_string(DistanceMetric metric);

double squared_euclidean(const Vector& a, const Vector& b);

// Euclidean distance, or 1 - cosine similarity (0 for zero-length vectors of equal shape)
double distance(const Vector& a, const Vector& b, DistanceMetric metric);

// Component-wise mean; all rows must share the first row's dimension
Vector mean_vector(const std::vector<Vector>& rows);

// Throws std::invalid_argument if rows are empty or differ in dimension
size_t check_uniform_dimension(const std::vector<Vector>& rows);

// Number of pairwise distinct rows (exact comparison)
size_t count_distinct(const std::vector<Vector>& rows);

} // namespace lpi
