#include "analysis/cycle_detector.hpp"
#include "core/date.hpp"
#include "core/errors.hpp"
#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace lpi {

namespace {

double mean_of(const std::vector<double>& values) {
    double sum = 0.0;
    for (double v : values) sum += v;
    return values.empty() ? 0.0 : sum / static_cast<double>(values.size());
}

// Unbiased sample variance; 0 for fewer than two values
double sample_variance(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double mean = mean_of(values);
    double ss = 0.0;
    for (double v : values) ss += (v - mean) * (v - mean);
    return ss / static_cast<double>(values.size() - 1);
}

} // anonymous namespace

CycleDetector::CycleDetector(CycleOptions options)
    : options_(options) {
    if (!(options_.ratio_threshold > 0.0 && options_.ratio_threshold < 1.0)) {
        throw InvalidConfigurationError("cycle_ratio_threshold", "must be in the open interval (0, 1)");
    }
}

std::optional<CyclicPattern> CycleDetector::detect_cycles(const std::vector<double>& signal,
                                                          const std::set<int>& period_candidates) const {
    return evaluate(signal, period_candidates);
}

std::optional<CyclicPattern> CycleDetector::detect_cycles(const std::vector<DayRecord>& days,
                                                          const std::set<int>& period_candidates) const {
    std::vector<double> signal;
    signal.reserve(days.size());
    for (const auto& day : days) signal.push_back(day.mood);

    auto pattern = evaluate(signal, period_candidates);
    if (!pattern) return pattern;

    // Weekly periods are phrased in weekday names when dates are available
    if (pattern->period_days == 7) {
        try {
            pattern->peak_label = weekday_name(
                parse_iso_date(days[static_cast<size_t>(pattern->peak_phase)].date).weekday());
            pattern->trough_label = weekday_name(
                parse_iso_date(days[static_cast<size_t>(pattern->trough_phase)].date).weekday());
            pattern->description = "Weekly cycle: mood tends to dip around " + pattern->trough_label +
                                   " and peak around " + pattern->peak_label + ".";
        } catch (const std::invalid_argument&) {
            // Undated records keep the phase-offset wording
        }
    }
    return pattern;
}

std::optional<CyclicPattern> CycleDetector::evaluate(const std::vector<double>& signal,
                                                     const std::set<int>& period_candidates) const {
    const double overall = sample_variance(signal);
    if (overall <= options_.variance_floor) return std::nullopt;

    std::optional<CyclicPattern> best;
    for (int p : period_candidates) {
        if (p < 2) {
            throw InvalidConfigurationError("cycle_periods", "periods must be at least 2 days, got " +
                                            std::to_string(p));
        }
        const size_t period = static_cast<size_t>(p);
        if (signal.size() < 2 * period) continue;

        std::vector<std::vector<double>> groups(period);
        for (size_t i = 0; i < signal.size(); ++i) groups[i % period].push_back(signal[i]);

        double within = 0.0;
        size_t peak = 0, trough = 0;
        double peak_mean = 0.0, trough_mean = 0.0;
        for (size_t g = 0; g < period; ++g) {
            within += sample_variance(groups[g]);
            double m = mean_of(groups[g]);
            if (g == 0 || m > peak_mean) { peak_mean = m; peak = g; }
            if (g == 0 || m < trough_mean) { trough_mean = m; trough = g; }
        }
        within /= static_cast<double>(period);

        const double ratio = within / overall;
        if (!(ratio < options_.ratio_threshold)) continue;
        const double strength = 1.0 - ratio;
        if (strength <= 0.0) continue;
        if (best && strength <= best->strength) continue;

        CyclicPattern pattern;
        pattern.period_days = p;
        pattern.strength = strength;
        pattern.supporting_stat = ratio;
        pattern.peak_phase = static_cast<int>(peak);
        pattern.trough_phase = static_cast<int>(trough);
        pattern.peak_label = "day " + std::to_string(peak + 1) + " of the cycle";
        pattern.trough_label = "day " + std::to_string(trough + 1) + " of the cycle";

        std::stringstream ss;
        ss << "Recurring " << p << "-day cycle (strength " << std::fixed << std::setprecision(2)
           << strength << "): mood dips on " << pattern.trough_label
           << " and peaks on " << pattern.peak_label << ".";
        pattern.description = ss.str();

        best = pattern;
    }
    return best;
}

std::vector<DayOfWeekStat> CycleDetector::day_of_week_profile(const std::vector<DayRecord>& days) const {
    std::array<double, 7> sums{};
    std::array<size_t, 7> counts{};
    for (const auto& day : days) {
        int wd = parse_iso_date(day.date).weekday();
        sums[static_cast<size_t>(wd)] += day.mood;
        counts[static_cast<size_t>(wd)]++;
    }

    std::vector<DayOfWeekStat> profile;
    for (size_t wd = 0; wd < 7; ++wd) {
        if (counts[wd] == 0) continue;
        DayOfWeekStat stat;
        stat.weekday = weekday_name(static_cast<int>(wd));
        stat.samples = counts[wd];
        stat.average = sums[wd] / static_cast<double>(counts[wd]);
        stat.tendency = stat.average > 0.0 ? "positive" : (stat.average < 0.0 ? "negative" : "neutral");
        profile.push_back(stat);
    }
    return profile;
}

} // namespace lpi
