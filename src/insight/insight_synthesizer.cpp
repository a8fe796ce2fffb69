#include "insight/insight_synthesizer.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace lpi {

namespace {

std::string label_of(const std::vector<ThemeCluster>& clusters, int cluster_id) {
    for (const auto& c : clusters) {
        if (c.cluster_id == cluster_id) return c.label;
    }
    return "Theme " + std::to_string(cluster_id + 1);
}

const ThemeCluster* dominant_theme(const std::vector<ThemeCluster>& clusters) {
    const ThemeCluster* best = nullptr;
    for (const auto& c : clusters) {
        if (!best || c.entry_count() > best->entry_count()) best = &c;
    }
    return best;
}

std::string format_score(double value) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

} // anonymous namespace

InsightSynthesizer::InsightSynthesizer(SynthesisOptions options, SafetyFilter safety)
    : options_(options), safety_(std::move(safety)) {}

const std::string& InsightSynthesizer::forecast_prefix() {
    static const std::string prefix = "Forecast (heuristic, not a certainty): ";
    return prefix;
}

Trend InsightSynthesizer::net_trend(double delta) const {
    if (delta > options_.trend_epsilon) return Trend::Improving;
    if (delta < -options_.trend_epsilon) return Trend::Declining;
    return Trend::Stable;
}

InsightBundle InsightSynthesizer::synthesize(const std::vector<WeekAggregate>& weeks,
                                             const std::vector<ThemeCluster>& clusters,
                                             const std::vector<Anomaly>& anomalies,
                                             const std::optional<CyclicPattern>& cycle) const {
    return synthesize(weeks, clusters, anomalies, cycle, {});
}

InsightBundle InsightSynthesizer::synthesize(const std::vector<WeekAggregate>& weeks,
                                             const std::vector<ThemeCluster>& clusters,
                                             const std::vector<Anomaly>& anomalies,
                                             const std::optional<CyclicPattern>& cycle,
                                             const std::vector<std::string>& source_texts) const {
    InsightBundle bundle;
    for (const auto& week : weeks) {
        bundle.micro.push_back(micro_insight(week, clusters));
    }
    bundle.macro = macro_insight(weeks, clusters, anomalies, cycle);
    bundle.predictive = predictive_insight(weeks, clusters, cycle);

    std::vector<std::string> scanned = bundle.micro;
    scanned.push_back(bundle.macro);
    scanned.push_back(bundle.predictive);
    scanned.insert(scanned.end(), source_texts.begin(), source_texts.end());
    bundle.safety_notes = safety_.scan(scanned);

    return bundle;
}

std::string InsightSynthesizer::micro_insight(const WeekAggregate& week,
                                              const std::vector<ThemeCluster>& clusters) const {
    const std::string label = label_of(clusters, week.dominant_cluster);

    std::stringstream ss;
    ss << "Week " << week.week_index << " (" << week.start_date;
    if (week.end_date != week.start_date) ss << " to " << week.end_date;
    ss << "): ";

    switch (week.trend) {
        case Trend::Improving:
            ss << label << " shows positive progression. Consider maintaining current strategies.";
            break;
        case Trend::Declining:
            ss << label << " indicates increasing challenges. Consider seeking support or adjusting approach.";
            break;
        case Trend::Stable:
        default:
            ss << label << " remains consistent. Current balance appears sustainable.";
            break;
    }
    return ss.str();
}

std::string InsightSynthesizer::macro_insight(const std::vector<WeekAggregate>& weeks,
                                              const std::vector<ThemeCluster>& clusters,
                                              const std::vector<Anomaly>& anomalies,
                                              const std::optional<CyclicPattern>& cycle) const {
    if (weeks.empty()) {
        return "No weekly data was available for a period summary.";
    }

    size_t total_days = 0;
    for (const auto& week : weeks) total_days += week.day_count();

    std::stringstream ss;
    const ThemeCluster* dominant = dominant_theme(clusters);
    ss << "Over the " << total_days << "-day period, life patterns were primarily characterized by "
       << (dominant ? to_lower_copy(dominant->label) : std::string("no single theme")) << ".";

    switch (net_trend(weeks.back().mood_score - weeks.front().mood_score)) {
        case Trend::Improving:
            ss << " Overall emotional trajectory shows positive growth.";
            break;
        case Trend::Declining:
            ss << " Some challenging periods were observed, suggesting need for additional support strategies.";
            break;
        case Trend::Stable:
        default:
            ss << " Emotional patterns remained relatively balanced throughout the period.";
            break;
    }

    if (cycle) {
        ss << " " << cycle->description;
    }

    if (!anomalies.empty()) {
        const Anomaly& top = anomalies.front();
        ss << " " << anomalies.size() << " significant emotional event"
           << (anomalies.size() == 1 ? " was" : "s were") << " identified, most notably "
           << (top.date.empty() ? top.day_id : top.date) << " (" << top.category << ").";
    }

    return ss.str();
}

std::string InsightSynthesizer::predictive_insight(const std::vector<WeekAggregate>& weeks,
                                                   const std::vector<ThemeCluster>& clusters,
                                                   const std::optional<CyclicPattern>& cycle) const {
    if (weeks.size() < 2) {
        return forecast_prefix() + "insufficient data for a reliable projection.";
    }

    const WeekAggregate& last = weeks.back();
    const WeekAggregate& prev = weeks[weeks.size() - 2];
    const double delta = last.mood_score - prev.mood_score;
    const double projected = std::max(-1.0, std::min(1.0, last.mood_score + delta));
    const int next_week = last.week_index + 1;

    std::stringstream ss;
    ss << forecast_prefix();
    switch (net_trend(delta)) {
        case Trend::Improving:
            ss << "if the recent momentum continues, week " << next_week
               << " is likely to show a sustained positive trajectory (projected mood "
               << format_score(projected) << ").";
            break;
        case Trend::Declining:
            ss << "if the current pattern continues, week " << next_week
               << " may show continued challenges (projected mood " << format_score(projected)
               << "). Consider stress-reduction strategies proactively.";
            break;
        case Trend::Stable:
        default:
            ss << "week " << next_week << " may resemble recent weeks with typical fluctuations (projected mood "
               << format_score(projected) << ").";
            break;
    }

    if (cycle) {
        if (cycle->period_days == 7) {
            ss << " Given the weekly cycle, expect lower mood around " << cycle->trough_label
               << ", easing toward " << cycle->peak_label << ".";
        } else {
            ss << " Given the recurring " << cycle->period_days << "-day cycle, expect a low around "
               << cycle->trough_label << " and recovery around " << cycle->peak_label << ".";
        }
    }

    if (last.dominant_cluster == prev.dominant_cluster && !last.theme_distribution.empty()) {
        ss << " " << label_of(clusters, last.dominant_cluster) << " is likely to remain a central focus.";
    }

    return ss.str();
}

} // namespace lpi
