#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lpi {

using Vector = std::vector<float>;

// Raw daily record as delivered by the ingestion collaborator
struct EntryRecord {
    std::string entry_id;
    std::string date;                  // ISO-8601 "YYYY-MM-DD"
    std::string text;
    std::string voice_transcript;
    std::string image_caption;
    std::string location_city;

    nlohmann::json to_json() const {
        return {
            {"entry_id", entry_id},
            {"date", date},
            {"text", text},
            {"voice_transcript", voice_transcript},
            {"image_caption", image_caption},
            {"location_city", location_city}
        };
    }

    static EntryRecord from_json(const nlohmann::json& j) {
        EntryRecord e;
        e.entry_id = j.value("entry_id", "");
        e.date = j.value("date", "");
        e.text = j.value("text", "");
        e.voice_transcript = j.value("voice_transcript", "");
        e.image_caption = j.value("image_caption", "");
        e.location_city = j.value("location_city", "");
        return e;
    }
};

// One embedded day. Immutable once built from an EntryRecord.
struct DayRecord {
    std::string id;
    std::string date;
    Vector embedding;
    double mood = 0.0;                 // externally supplied valence scalar in [-1, 1]
    std::string text;                  // fused modality text, used for keywords and safety scan
};

struct ThemeCluster {
    int cluster_id = 0;
    std::string label;
    Vector centroid;
    std::set<std::string> member_ids;
    double confidence = 0.0;           // mean member confidence, [0, 1]
    std::vector<std::string> keywords;
    std::vector<std::string> exemplar_ids;

    size_t entry_count() const { return member_ids.size(); }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["cluster_id"] = cluster_id;
        j["theme_label"] = label;
        j["keywords"] = keywords;
        j["cluster_confidence"] = confidence;
        j["representative_entries"] = exemplar_ids;
        j["member_ids"] = member_ids;
        j["entry_count"] = entry_count();
        return j;
    }
};

enum class Trend {
    Improving,
    Declining,
    Stable
};

inline std::string trend_to_string(Trend trend) {
    switch (trend) {
        case Trend::Improving: return "improving";
        case Trend::Declining: return "declining";
        case Trend::Stable: return "stable";
        default: return "stable";
    }
}

struct WeekAggregate {
    int week_index = 1;                // 1-based
    std::string start_date;
    std::string end_date;
    std::vector<std::string> day_ids;
    std::map<int, int> theme_distribution;  // cluster_id -> day count
    int dominant_cluster = 0;
    double mood_score = 0.0;
    Trend trend = Trend::Stable;

    size_t day_count() const { return day_ids.size(); }

    nlohmann::json to_json() const {
        nlohmann::json dist = nlohmann::json::object();
        for (const auto& [cid, count] : theme_distribution) {
            dist[std::to_string(cid)] = count;
        }
        return {
            {"week", week_index},
            {"start_date", start_date},
            {"end_date", end_date},
            {"entry_count", day_count()},
            {"theme_distribution", dist},
            {"dominant_cluster", dominant_cluster},
            {"mood_score", mood_score},
            {"mood_trend", trend_to_string(trend)}
        };
    }
};

struct Anomaly {
    std::string day_id;
    std::string date;
    double score = 0.0;                // (0, 1], higher is more anomalous
    int rank = 0;                      // 1-based
    std::string category;
    std::string description;
    int nearest_cluster = -1;

    nlohmann::json to_json() const {
        return {
            {"entry_id", day_id},
            {"date", date},
            {"anomaly_score", score},
            {"rank", rank},
            {"anomaly_type", category},
            {"description", description},
            {"nearest_cluster", nearest_cluster}
        };
    }
};

struct CyclicPattern {
    std::string description;
    int period_days = 7;
    double strength = 0.0;             // 1 - supporting_stat
    double supporting_stat = 0.0;      // mean within-phase variance / overall variance
    int peak_phase = 0;                // offset within the period with the highest mean signal
    int trough_phase = 0;
    std::string peak_label;
    std::string trough_label;

    nlohmann::json to_json() const {
        return {
            {"description", description},
            {"period_days", period_days},
            {"strength", strength},
            {"variance_ratio", supporting_stat},
            {"peak_phase", peak_phase},
            {"trough_phase", trough_phase},
            {"peak_label", peak_label},
            {"trough_label", trough_label}
        };
    }
};

// Mean signal per weekday, Monday first
struct DayOfWeekStat {
    std::string weekday;
    double average = 0.0;
    size_t samples = 0;
    std::string tendency;              // "positive", "negative", "neutral"
};

struct InsightBundle {
    std::vector<std::string> micro;    // one per week
    std::string macro;
    std::string predictive;
    std::vector<std::string> safety_notes;

    nlohmann::json to_json() const {
        return {
            {"micro_insights", micro},
            {"macro_insight", macro},
            {"predictive_insight", predictive},
            {"safety_notes", safety_notes}
        };
    }
};

} // namespace lpi
