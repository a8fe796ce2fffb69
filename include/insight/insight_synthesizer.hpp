#pragma once

#include "core/types.hpp"
#include "insight/safety_filter.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lpi {

struct SynthesisOptions {
    double trend_epsilon = 0.05;         // Net mood change treated as flat
};

/**
 * @brief Turns the analytic results into micro, macro and predictive statements
 *
 * Micro: one per week (dominant theme + trend). Macro: dominant theme over the
 * whole period and the net trend between the first and last week. Predictive:
 * linear extrapolation of the last week-over-week change, phrased with the
 * detected cycle's phase when there is one, always labelled as a forecast.
 * Safety notes are computed from the generated text plus the source text and
 * appended separately.
 */
class InsightSynthesizer {
public:
    explicit InsightSynthesizer(SynthesisOptions options = SynthesisOptions(),
                                SafetyFilter safety = SafetyFilter());

    InsightBundle synthesize(const std::vector<WeekAggregate>& weeks,
                             const std::vector<ThemeCluster>& clusters,
                             const std::vector<Anomaly>& anomalies,
                             const std::optional<CyclicPattern>& cycle) const;

    // source_texts: original day content, scanned by the safety filter only
    InsightBundle synthesize(const std::vector<WeekAggregate>& weeks,
                             const std::vector<ThemeCluster>& clusters,
                             const std::vector<Anomaly>& anomalies,
                             const std::optional<CyclicPattern>& cycle,
                             const std::vector<std::string>& source_texts) const;

    std::string micro_insight(const WeekAggregate& week, const std::vector<ThemeCluster>& clusters) const;

    std::string macro_insight(const std::vector<WeekAggregate>& weeks,
                              const std::vector<ThemeCluster>& clusters,
                              const std::vector<Anomaly>& anomalies,
                              const std::optional<CyclicPattern>& cycle) const;

    std::string predictive_insight(const std::vector<WeekAggregate>& weeks,
                                   const std::vector<ThemeCluster>& clusters,
                                   const std::optional<CyclicPattern>& cycle) const;

    static const std::string& forecast_prefix();

private:
    SynthesisOptions options_;
    SafetyFilter safety_;

    Trend net_trend(double delta) const;
};

} // namespace lpi
