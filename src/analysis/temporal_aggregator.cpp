#include "analysis/temporal_aggregator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace lpi {

TemporalAggregator::TemporalAggregator(double trend_epsilon)
    : trend_epsilon_(trend_epsilon) {
    if (!(trend_epsilon_ >= 0.0)) {
        throw InvalidConfigurationError("trend_epsilon", "must not be negative");
    }
}

Trend TemporalAggregator::classify(double delta) const {
    if (delta > trend_epsilon_) return Trend::Improving;
    if (delta < -trend_epsilon_) return Trend::Declining;
    return Trend::Stable;
}

std::vector<WeekAggregate> TemporalAggregator::aggregate(const std::vector<DayRecord>& days,
                                                         const std::vector<ThemeCluster>& clusters,
                                                         int window) const {
    if (window < 1) {
        throw InvalidConfigurationError("week_window", "must be at least 1 day, got " +
                                        std::to_string(window));
    }

    std::unordered_map<std::string, int> theme_of;
    for (const auto& cluster : clusters) {
        for (const auto& id : cluster.member_ids) theme_of[id] = cluster.cluster_id;
    }

    std::vector<WeekAggregate> weeks;
    const size_t step = static_cast<size_t>(window);

    for (size_t start = 0; start < days.size(); start += step) {
        size_t end = std::min(days.size(), start + step);

        WeekAggregate week;
        week.week_index = static_cast<int>(weeks.size()) + 1;
        week.start_date = days[start].date;
        week.end_date = days[end - 1].date;

        double mood_sum = 0.0;
        for (size_t i = start; i < end; ++i) {
            const auto& day = days[i];
            auto it = theme_of.find(day.id);
            if (it == theme_of.end()) {
                throw std::invalid_argument("Day '" + day.id + "' is not assigned to any theme");
            }
            week.theme_distribution[it->second]++;
            week.day_ids.push_back(day.id);
            mood_sum += day.mood;
        }
        week.mood_score = mood_sum / static_cast<double>(end - start);

        // Highest count wins; std::map iteration makes the lowest id win ties
        int best_count = -1;
        for (const auto& [cid, count] : week.theme_distribution) {
            if (count > best_count) {
                best_count = count;
                week.dominant_cluster = cid;
            }
        }

        week.trend = weeks.empty() ? Trend::Stable
                                   : classify(week.mood_score - weeks.back().mood_score);
        weeks.push_back(std::move(week));
    }

    return weeks;
}

} // namespace lpi
