#pragma once

#include "core/types.hpp"
#include <vector>

namespace lpi {

/**
 * @brief Buckets chronologically ordered days into fixed windows
 *
 * Each window gets its theme mix, the mean of the supplied per-day mood signal,
 * and a trend label against the previous window. The final window may be short;
 * nothing is padded or dropped.
 */
class TemporalAggregator {
public:
    explicit TemporalAggregator(double trend_epsilon = 0.05);

    /**
     * @param days      Days in chronological order
     * @param clusters  Themes whose member sets cover every day id
     * @param window    Days per window, at least 1
     * @throws InvalidConfigurationError if window < 1
     * @throws std::invalid_argument if a day belongs to no theme
     */
    std::vector<WeekAggregate> aggregate(const std::vector<DayRecord>& days,
                                         const std::vector<ThemeCluster>& clusters,
                                         int window = 7) const;

    // improving / declining / stable for a change in mood
    Trend classify(double delta) const;

    double trend_epsilon() const { return trend_epsilon_; }

private:
    double trend_epsilon_;
};

} // namespace lpi
