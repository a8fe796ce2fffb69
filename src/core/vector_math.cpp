#include "core/vector_math.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace lpi {

DistanceMetric parse_distance_metric(const std::string& name) {
    if (name == "euclidean") return DistanceMetric::Euclidean;
    if (name == "cosine") return DistanceMetric::Cosine;
    throw InvalidConfigurationError("distance_metric", "unknown metric '" + name + "'");
}

std::string distance_metric_to_string(DistanceMetric metric) {
    return metric == DistanceMetric::Cosine ? "cosine" : "euclidean";
}

double squared_euclidean(const Vector& a, const Vector& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return sum;
}

double distance(const Vector& a, const Vector& b, DistanceMetric metric) {
    if (metric == DistanceMetric::Euclidean) {
        return std::sqrt(squared_euclidean(a, b));
    }

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na == 0.0 || nb == 0.0) {
        return (na == nb) ? 0.0 : 1.0;
    }
    double cos = dot / (std::sqrt(na) * std::sqrt(nb));
    cos = std::max(-1.0, std::min(1.0, cos));
    return 1.0 - cos;
}

Vector mean_vector(const std::vector<Vector>& rows) {
    if (rows.empty()) return {};
    std::vector<double> acc(rows[0].size(), 0.0);
    for (const auto& row : rows) {
        for (size_t i = 0; i < acc.size(); ++i) acc[i] += row[i];
    }
    Vector mean(acc.size());
    for (size_t i = 0; i < acc.size(); ++i) {
        mean[i] = static_cast<float>(acc[i] / static_cast<double>(rows.size()));
    }
    return mean;
}

size_t check_uniform_dimension(const std::vector<Vector>& rows) {
    if (rows.empty()) {
        throw std::invalid_argument("No vectors supplied");
    }
    size_t dim = rows[0].size();
    if (dim == 0) {
        throw std::invalid_argument("Vectors must have at least one dimension");
    }
    for (size_t i = 1; i < rows.size(); ++i) {
        if (rows[i].size() != dim) {
            throw std::invalid_argument("Vector " + std::to_string(i) + " has dimension " +
                                        std::to_string(rows[i].size()) + ", expected " +
                                        std::to_string(dim));
        }
    }
    return dim;
}

size_t count_distinct(const std::vector<Vector>& rows) {
    std::vector<const Vector*> sorted;
    sorted.reserve(rows.size());
    for (const auto& r : rows) sorted.push_back(&r);
    std::sort(sorted.begin(), sorted.end(),
              [](const Vector* a, const Vector* b) { return *a < *b; });
    size_t distinct = 0;
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i == 0 || *sorted[i] != *sorted[i - 1]) ++distinct;
    }
    return distinct;
}

} // namespace lpi
