#include "analysis/anomaly_detector.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace lpi {

namespace {

constexpr double kEulerGamma = 0.5772156649015329;

void validate_detection_params(double contamination, int top_n) {
    if (!(contamination > 0.0 && contamination < 0.5)) {
        throw InvalidConfigurationError("contamination",
                                        "must be in the open interval (0, 0.5), got " +
                                        std::to_string(contamination));
    }
    if (top_n < 0) {
        throw InvalidConfigurationError("anomaly_top_n", "must not be negative, got " +
                                        std::to_string(top_n));
    }
}

} // anonymous namespace

AnomalyDetector::AnomalyDetector(AnomalyOptions options)
    : options_(std::move(options)) {
    if (options_.trees < 1) {
        throw InvalidConfigurationError("isolation_trees", "must be at least 1");
    }
    if (options_.sample_size < 2) {
        throw InvalidConfigurationError("isolation_sample_size", "must be at least 2");
    }
}

double AnomalyDetector::average_path_length(size_t n) {
    if (n <= 1) return 0.0;
    if (n == 2) return 1.0;
    double m = static_cast<double>(n - 1);
    double harmonic = std::log(m) + kEulerGamma;
    return 2.0 * harmonic - 2.0 * m / static_cast<double>(n);
}

bool AnomalyDetector::is_degenerate(const std::vector<Vector>& vectors) const {
    const size_t dim = vectors[0].size();
    const double n = static_cast<double>(vectors.size());
    for (size_t d = 0; d < dim; ++d) {
        double mean = 0.0;
        for (const auto& v : vectors) mean += v[d];
        mean /= n;
        double var = 0.0;
        for (const auto& v : vectors) {
            double diff = v[d] - mean;
            var += diff * diff;
        }
        if (var / n > options_.variance_floor) return false;
    }
    return true;
}

std::vector<double> AnomalyDetector::score(const std::vector<Vector>& vectors,
                                           std::uint64_t seed) const {
    if (vectors.size() < 2) {
        throw InsufficientDataError("anomaly detection needs at least 2 records, got " +
                                    std::to_string(vectors.size()));
    }
    check_uniform_dimension(vectors);
    if (is_degenerate(vectors)) return {};

    const size_t n = vectors.size();
    const size_t psi = std::min(options_.sample_size, n);
    const size_t depth_limit = static_cast<size_t>(std::ceil(std::log2(static_cast<double>(psi))));
    const double normalizer = average_path_length(psi);

    std::vector<double> total_path(n, 0.0);
    std::mt19937_64 master(seed);

    for (size_t t = 0; t < options_.trees; ++t) {
        std::mt19937_64 rng(master());

        // Partial Fisher-Yates: the first psi slots become the tree's sample
        std::vector<size_t> order(n);
        std::iota(order.begin(), order.end(), 0);
        for (size_t i = 0; i < psi; ++i) {
            std::uniform_int_distribution<size_t> pick(i, n - 1);
            std::swap(order[i], order[pick(rng)]);
        }
        order.resize(psi);

        Tree tree = build_tree(vectors, std::move(order), depth_limit, rng);
        for (size_t i = 0; i < n; ++i) {
            total_path[i] += path_length(tree, vectors[i]);
        }
    }

    std::vector<double> scores(n);
    for (size_t i = 0; i < n; ++i) {
        double mean_path = total_path[i] / static_cast<double>(options_.trees);
        scores[i] = std::pow(2.0, -mean_path / normalizer);
    }
    return scores;
}

AnomalyDetector::Tree AnomalyDetector::build_tree(const std::vector<Vector>& vectors,
                                                  std::vector<size_t> sample,
                                                  size_t depth_limit,
                                                  std::mt19937_64& rng) const {
    Tree tree;
    tree.nodes.reserve(2 * sample.size());
    grow(tree, vectors, sample, 0, depth_limit, rng);
    return tree;
}

int AnomalyDetector::grow(Tree& tree, const std::vector<Vector>& vectors,
                          std::vector<size_t>& indices, size_t depth, size_t depth_limit,
                          std::mt19937_64& rng) const {
    const int node_index = static_cast<int>(tree.nodes.size());
    Node node;
    node.size = indices.size();
    tree.nodes.push_back(node);

    if (indices.size() <= 1 || depth >= depth_limit) return node_index;

    // Only dimensions that still vary within this subset can split it
    const size_t dim = vectors[indices[0]].size();
    std::vector<size_t> candidates;
    std::vector<float> lows(dim), highs(dim);
    for (size_t d = 0; d < dim; ++d) {
        float lo = std::numeric_limits<float>::max();
        float hi = std::numeric_limits<float>::lowest();
        for (size_t i : indices) {
            lo = std::min(lo, vectors[i][d]);
            hi = std::max(hi, vectors[i][d]);
        }
        lows[d] = lo;
        highs[d] = hi;
        if (hi > lo) candidates.push_back(d);
    }
    if (candidates.empty()) return node_index;

    std::uniform_int_distribution<size_t> pick_dim(0, candidates.size() - 1);
    const size_t d = candidates[pick_dim(rng)];
    std::uniform_real_distribution<double> pick_split(lows[d], highs[d]);
    float split = static_cast<float>(pick_split(rng));
    if (!(split > lows[d]) || split > highs[d]) {
        split = lows[d] + (highs[d] - lows[d]) / 2.0f;
    }
    if (!(split > lows[d])) split = highs[d];

    std::vector<size_t> left, right;
    for (size_t i : indices) {
        if (vectors[i][d] < split) left.push_back(i);
        else right.push_back(i);
    }

    tree.nodes[static_cast<size_t>(node_index)].dimension = static_cast<int>(d);
    tree.nodes[static_cast<size_t>(node_index)].split = split;
    int left_child = grow(tree, vectors, left, depth + 1, depth_limit, rng);
    int right_child = grow(tree, vectors, right, depth + 1, depth_limit, rng);
    tree.nodes[static_cast<size_t>(node_index)].left = left_child;
    tree.nodes[static_cast<size_t>(node_index)].right = right_child;
    return node_index;
}

double AnomalyDetector::path_length(const Tree& tree, const Vector& v) const {
    size_t node = 0;
    double depth = 0.0;
    while (tree.nodes[node].dimension >= 0) {
        const Node& n = tree.nodes[node];
        node = static_cast<size_t>(v[static_cast<size_t>(n.dimension)] < n.split ? n.left : n.right);
        depth += 1.0;
    }
    return depth + average_path_length(tree.nodes[node].size);
}

std::vector<size_t> AnomalyDetector::rank(const std::vector<double>& scores, double contamination,
                                          int top_n, const std::vector<std::string>& tie_keys) const {
    std::vector<size_t> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (scores[a] != scores[b]) return scores[a] > scores[b];
        if (!tie_keys.empty() && tie_keys[a] != tie_keys[b]) return tie_keys[a] < tie_keys[b];
        return a < b;
    });

    // Small slack so 0.1 * 30 does not round up to 4
    size_t operative = static_cast<size_t>(
        std::ceil(contamination * static_cast<double>(scores.size()) - 1e-9));
    size_t keep = std::min(operative, static_cast<size_t>(top_n));
    if (order.size() > keep) order.resize(keep);
    return order;
}

std::vector<Anomaly> AnomalyDetector::detect(const std::vector<Vector>& vectors,
                                             double contamination,
                                             std::uint64_t seed,
                                             int top_n) const {
    validate_detection_params(contamination, top_n);
    std::vector<double> scores = score(vectors, seed);

    std::vector<Anomaly> anomalies;
    int rank_value = 1;
    for (size_t i : rank(scores, contamination, top_n, {})) {
        Anomaly a;
        a.day_id = std::to_string(i);
        a.score = scores[i];
        a.rank = rank_value++;
        a.category = options_.category_rules.fallback();
        a.description = options_.category_descriptions.describe(a.category, "record " + a.day_id);
        anomalies.push_back(std::move(a));
    }
    return anomalies;
}

std::vector<Anomaly> AnomalyDetector::detect(const std::vector<DayRecord>& days,
                                             const std::vector<ThemeCluster>& clusters,
                                             double contamination,
                                             std::uint64_t seed,
                                             int top_n) const {
    validate_detection_params(contamination, top_n);

    std::vector<Vector> vectors;
    std::vector<std::string> dates;
    vectors.reserve(days.size());
    dates.reserve(days.size());
    for (const auto& day : days) {
        vectors.push_back(day.embedding);
        dates.push_back(day.date);
    }

    std::vector<double> scores = score(vectors, seed);

    std::vector<Anomaly> anomalies;
    int rank_value = 1;
    for (size_t i : rank(scores, contamination, top_n, dates)) {
        const DayRecord& day = days[i];

        const ThemeCluster* nearest = nullptr;
        double best = std::numeric_limits<double>::max();
        for (const auto& cluster : clusters) {
            if (cluster.centroid.size() != day.embedding.size()) continue;
            double d = distance(day.embedding, cluster.centroid, options_.metric);
            if (d < best) {
                best = d;
                nearest = &cluster;
            }
        }

        Anomaly a;
        a.day_id = day.id;
        a.date = day.date;
        a.score = scores[i];
        a.rank = rank_value++;
        a.nearest_cluster = nearest ? nearest->cluster_id : -1;
        a.category = categorize(day, nearest);
        a.description = options_.category_descriptions.describe(
            a.category, day.date.empty() ? day.id : day.date);
        anomalies.push_back(std::move(a));
    }
    return anomalies;
}

std::string AnomalyDetector::categorize(const DayRecord& day, const ThemeCluster* nearest) const {
    // The theme's vocabulary outranks the day's own wording
    if (nearest) {
        std::string from_theme = options_.category_rules.first_keyword_match(nearest->keywords);
        if (!from_theme.empty()) return from_theme;
    }
    return options_.category_rules.first_match(day.text);
}

} // namespace lpi
