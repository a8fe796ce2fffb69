#include "analysis/theme_clusterer.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace lpi {

const ThemeCluster* ClusteringResult::find_cluster_of(const std::string& id) const {
    for (const auto& c : clusters) {
        if (c.member_ids.count(id)) return &c;
    }
    return nullptr;
}

ThemeClusterer::ThemeClusterer(ClusteringOptions options)
    : options_(std::move(options)) {
    if (options_.restarts < 1) {
        throw InvalidConfigurationError("kmeans_restarts", "must be at least 1");
    }
    if (options_.max_iterations < 1) {
        throw InvalidConfigurationError("kmeans_max_iterations", "must be at least 1");
    }
    if (!(options_.confidence_scale > 0.0)) {
        throw InvalidConfigurationError("confidence_scale", "must be positive");
    }
}

ClusteringResult ThemeClusterer::cluster(const std::vector<Vector>& vectors, int k,
                                         std::uint64_t seed) const {
    std::vector<std::string> ids;
    ids.reserve(vectors.size());
    for (size_t i = 0; i < vectors.size(); ++i) ids.push_back(std::to_string(i));
    return cluster(vectors, ids, k, seed, TextAccessor());
}

ClusteringResult ThemeClusterer::cluster(const std::vector<DayRecord>& days, int k,
                                         std::uint64_t seed) const {
    std::vector<Vector> vectors;
    std::vector<std::string> ids;
    std::unordered_map<std::string, const DayRecord*> by_id;
    vectors.reserve(days.size());
    ids.reserve(days.size());
    for (const auto& day : days) {
        vectors.push_back(day.embedding);
        ids.push_back(day.id);
        by_id[day.id] = &day;
    }

    TextAccessor text_of = [&by_id](const std::string& id) -> std::string {
        auto it = by_id.find(id);
        return it != by_id.end() ? it->second->text : std::string();
    };
    return cluster(vectors, ids, k, seed, text_of);
}

ClusteringResult ThemeClusterer::cluster(const std::vector<Vector>& vectors,
                                         const std::vector<std::string>& ids,
                                         int k,
                                         std::uint64_t seed,
                                         const TextAccessor& text_of) const {
    if (vectors.size() < 2) {
        throw InsufficientDataError("theme clustering needs at least 2 records, got " +
                                    std::to_string(vectors.size()));
    }
    if (ids.size() != vectors.size()) {
        throw std::invalid_argument("Got " + std::to_string(ids.size()) + " ids for " +
                                    std::to_string(vectors.size()) + " vectors");
    }
    if (std::set<std::string>(ids.begin(), ids.end()).size() != ids.size()) {
        throw std::invalid_argument("Record ids must be unique for clustering");
    }
    if (k < 1) {
        throw InvalidConfigurationError("k", "must be at least 1, got " + std::to_string(k));
    }
    check_uniform_dimension(vectors);

    ClusteringResult result;

    size_t distinct = count_distinct(vectors);
    int effective_k = k;
    if (static_cast<size_t>(k) > distinct) {
        effective_k = static_cast<int>(distinct);
        DegenerateClusteringWarning warning;
        warning.requested_k = k;
        warning.effective_k = effective_k;
        warning.distinct_points = distinct;
        result.warning = warning;
    }

    // Every restart gets its own stream derived from the caller's seed
    std::mt19937_64 master(seed);
    Run best;
    bool have_best = false;
    for (int r = 0; r < options_.restarts; ++r) {
        std::mt19937_64 rng(master());
        Run run = run_lloyd(vectors, effective_k, rng);
        if (!have_best || run.inertia < best.inertia) {
            best = std::move(run);
            have_best = true;
        }
    }

    // Drop clusters that stayed empty so ids stay dense and the partition exact
    std::vector<int> remap(best.centroids.size(), -1);
    std::vector<Vector> centroids;
    for (size_t c = 0; c < best.centroids.size(); ++c) {
        if (std::find(best.labels.begin(), best.labels.end(), static_cast<int>(c)) != best.labels.end()) {
            remap[c] = static_cast<int>(centroids.size());
            centroids.push_back(best.centroids[c]);
        }
    }
    std::vector<int> labels(best.labels.size());
    for (size_t i = 0; i < labels.size(); ++i) labels[i] = remap[static_cast<size_t>(best.labels[i])];

    result.assignments = labels;
    result.inertia = best.inertia;
    result.iterations = best.iterations;
    result.entry_confidence = entry_confidences(vectors, centroids, labels);

    for (size_t c = 0; c < centroids.size(); ++c) {
        ThemeCluster theme;
        theme.cluster_id = static_cast<int>(c);
        theme.centroid = centroids[c];

        std::vector<size_t> members;
        for (size_t i = 0; i < labels.size(); ++i) {
            if (labels[i] == static_cast<int>(c)) members.push_back(i);
        }

        double conf_sum = 0.0;
        for (size_t i : members) {
            theme.member_ids.insert(ids[i]);
            conf_sum += result.entry_confidence[i];
        }
        theme.confidence = members.empty() ? 0.0 : conf_sum / static_cast<double>(members.size());

        // stable_sort keeps input order among equal confidences
        std::stable_sort(members.begin(), members.end(), [&](size_t a, size_t b) {
            return result.entry_confidence[a] > result.entry_confidence[b];
        });
        for (size_t i = 0; i < members.size() && i < options_.exemplar_count; ++i) {
            theme.exemplar_ids.push_back(ids[members[i]]);
        }

        if (text_of) {
            std::vector<std::string> texts;
            for (const auto& id : theme.exemplar_ids) texts.push_back(text_of(id));
            theme.keywords = extract_keywords(texts, options_.keyword_count);
        }

        theme.label = options_.label_rules.best_match(theme.keywords);
        if (theme.label.empty()) {
            if (theme.keywords.size() >= 2) {
                theme.label = title_case(theme.keywords[0] + " " + theme.keywords[1]);
            } else if (theme.keywords.size() == 1) {
                theme.label = title_case(theme.keywords[0]);
            } else {
                theme.label = "Theme " + std::to_string(c + 1);
            }
        }

        result.clusters.push_back(std::move(theme));
    }

    return result;
}

ThemeClusterer::Run ThemeClusterer::run_lloyd(const std::vector<Vector>& vectors, int k,
                                              std::mt19937_64& rng) const {
    Run run;
    run.centroids = seed_centroids(vectors, k, rng);
    run.labels.assign(vectors.size(), -1);

    for (int iter = 1; iter <= options_.max_iterations; ++iter) {
        run.iterations = iter;

        bool changed = false;
        for (size_t i = 0; i < vectors.size(); ++i) {
            int label = nearest(vectors[i], run.centroids, nullptr);
            if (label != run.labels[i]) {
                run.labels[i] = label;
                changed = true;
            }
        }

        for (int c = 0; c < k; ++c) {
            if (std::find(run.labels.begin(), run.labels.end(), c) == run.labels.end()) {
                if (reseed_empty(vectors, run.centroids, run.labels, c)) changed = true;
            }
        }

        double max_shift = 0.0;
        for (int c = 0; c < k; ++c) {
            std::vector<Vector> members;
            for (size_t i = 0; i < vectors.size(); ++i) {
                if (run.labels[i] == c) members.push_back(vectors[i]);
            }
            if (members.empty()) continue;
            Vector updated = mean_vector(members);
            max_shift = std::max(max_shift, std::sqrt(squared_euclidean(updated, run.centroids[c])));
            run.centroids[c] = std::move(updated);
        }

        if (!changed || max_shift <= options_.tolerance) break;
    }

    run.inertia = 0.0;
    for (size_t i = 0; i < vectors.size(); ++i) {
        double d = distance(vectors[i], run.centroids[static_cast<size_t>(run.labels[i])], options_.metric);
        run.inertia += d * d;
    }
    return run;
}

std::vector<Vector> ThemeClusterer::seed_centroids(const std::vector<Vector>& vectors, int k,
                                                   std::mt19937_64& rng) const {
    // k-means++: each new centroid drawn with probability proportional to D^2
    std::vector<Vector> centroids;
    std::uniform_int_distribution<size_t> pick(0, vectors.size() - 1);
    centroids.push_back(vectors[pick(rng)]);

    std::vector<double> weights(vectors.size());
    while (static_cast<int>(centroids.size()) < k) {
        double total = 0.0;
        for (size_t i = 0; i < vectors.size(); ++i) {
            double d = 0.0;
            nearest(vectors[i], centroids, &d);
            weights[i] = d * d;
            total += weights[i];
        }

        size_t chosen = vectors.size();
        if (total > 0.0) {
            std::uniform_real_distribution<double> unit(0.0, total);
            double target = unit(rng);
            double cumulative = 0.0;
            for (size_t i = 0; i < vectors.size(); ++i) {
                if (weights[i] <= 0.0) continue;
                cumulative += weights[i];
                chosen = i;
                if (cumulative >= target) break;
            }
        }
        if (chosen == vectors.size()) {
            // Remaining points coincide with chosen centroids under this metric
            for (size_t i = 0; i < vectors.size(); ++i) {
                if (std::find(centroids.begin(), centroids.end(), vectors[i]) == centroids.end()) {
                    chosen = i;
                    break;
                }
            }
        }
        if (chosen == vectors.size()) break;
        centroids.push_back(vectors[chosen]);
    }

    // Pad when the metric collapses distinct points (e.g. parallel vectors under cosine)
    while (static_cast<int>(centroids.size()) < k) {
        centroids.push_back(centroids.back());
    }
    return centroids;
}

int ThemeClusterer::nearest(const Vector& v, const std::vector<Vector>& centroids,
                            double* dist_out) const {
    int best = 0;
    double best_dist = std::numeric_limits<double>::max();
    for (size_t c = 0; c < centroids.size(); ++c) {
        double d = distance(v, centroids[c], options_.metric);
        if (d < best_dist) {
            best_dist = d;
            best = static_cast<int>(c);
        }
    }
    if (dist_out) *dist_out = best_dist;
    return best;
}

bool ThemeClusterer::reseed_empty(const std::vector<Vector>& vectors, std::vector<Vector>& centroids,
                                  std::vector<int>& labels, int empty_cluster) const {
    std::vector<size_t> counts(centroids.size(), 0);
    for (int label : labels) {
        if (label >= 0) counts[static_cast<size_t>(label)]++;
    }

    size_t farthest = vectors.size();
    double farthest_dist = -1.0;
    for (size_t i = 0; i < vectors.size(); ++i) {
        size_t own = static_cast<size_t>(labels[i]);
        if (counts[own] < 2) continue;
        double d = distance(vectors[i], centroids[own], options_.metric);
        if (d > farthest_dist) {
            farthest_dist = d;
            farthest = i;
        }
    }
    if (farthest == vectors.size()) return false;

    labels[farthest] = empty_cluster;
    centroids[static_cast<size_t>(empty_cluster)] = vectors[farthest];
    return true;
}

std::vector<double> ThemeClusterer::entry_confidences(const std::vector<Vector>& vectors,
                                                      const std::vector<Vector>& centroids,
                                                      const std::vector<int>& labels) const {
    // Distances are normalized by the mean spread of the whole dataset around its mean
    Vector global = mean_vector(vectors);
    double spread = 0.0;
    for (const auto& v : vectors) spread += distance(v, global, options_.metric);
    spread /= static_cast<double>(vectors.size());

    std::vector<double> confidence(vectors.size(), 1.0);
    if (spread <= 0.0) return confidence;

    for (size_t i = 0; i < vectors.size(); ++i) {
        double d = distance(vectors[i], centroids[static_cast<size_t>(labels[i])], options_.metric);
        double c = std::exp(-d / (options_.confidence_scale * spread));
        confidence[i] = std::max(0.0, std::min(1.0, c));
    }
    return confidence;
}

} // namespace lpi
