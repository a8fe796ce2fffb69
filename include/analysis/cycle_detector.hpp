#pragma once

#include "core/types.hpp"
#include <optional>
#include <set>
#include <vector>

namespace lpi {

struct CycleOptions {
    double ratio_threshold = 0.6;        // within/overall variance ratio must fall below this
    double variance_floor = 1e-9;        // flatter signals never form a cycle
};

/**
 * @brief Tests the day sequence for recurring structure in the mood signal
 *
 * For a period p, days are grouped by index mod p. A period is cyclic when the
 * mean within-group (sample) variance is well below the overall variance.
 */
class CycleDetector {
public:
    explicit CycleDetector(CycleOptions options = CycleOptions());

    // Strongest qualifying period, or nullopt when none clears the threshold or
    // no candidate has two full periods of data
    std::optional<CyclicPattern> detect_cycles(const std::vector<DayRecord>& days,
                                               const std::set<int>& period_candidates = {7}) const;

    // Raw-signal variant; labels are phase offsets
    std::optional<CyclicPattern> detect_cycles(const std::vector<double>& signal,
                                               const std::set<int>& period_candidates = {7}) const;

    // Mean mood per weekday, Monday first; weekdays without data are omitted
    std::vector<DayOfWeekStat> day_of_week_profile(const std::vector<DayRecord>& days) const;

private:
    CycleOptions options_;

    std::optional<CyclicPattern> evaluate(const std::vector<double>& signal,
                                          const std::set<int>& period_candidates) const;
};

} // namespace lpi
