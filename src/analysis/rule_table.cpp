#include "analysis/rule_table.hpp"
#include "core/text_utils.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace lpi {

std::string RuleTable::best_match(const std::vector<std::string>& keywords) const {
    size_t best_hits = 0;
    const KeywordRule* best = nullptr;

    for (const auto& rule : rules_) {
        size_t hits = 0;
        for (const auto& kw : keywords) {
            if (std::find(rule.terms.begin(), rule.terms.end(), kw) != rule.terms.end()) {
                ++hits;
            }
        }
        if (hits > best_hits) {
            best_hits = hits;
            best = &rule;
        }
    }

    return best ? best->label : fallback_;
}

std::string RuleTable::first_match(const std::string& text) const {
    std::string lower = to_lower_copy(text);
    for (const auto& rule : rules_) {
        for (const auto& term : rule.terms) {
            if (contains_term(lower, term)) return rule.label;
        }
    }
    return fallback_;
}

std::string RuleTable::first_keyword_match(const std::vector<std::string>& keywords) const {
    for (const auto& rule : rules_) {
        for (const auto& kw : keywords) {
            for (const auto& term : rule.terms) {
                if (contains_term(kw, term)) return rule.label;
            }
        }
    }
    return "";
}

json RuleTable::to_json() const {
    json rules = json::array();
    for (const auto& rule : rules_) {
        rules.push_back({{"label", rule.label}, {"terms", rule.terms}});
    }
    return {{"rules", rules}, {"fallback", fallback_}};
}

RuleTable RuleTable::from_json(const json& j) {
    std::vector<KeywordRule> rules;
    if (j.contains("rules")) {
        for (const auto& r : j["rules"]) {
            KeywordRule rule;
            rule.label = r.value("label", "");
            rule.terms = r.value("terms", std::vector<std::string>{});
            rules.push_back(std::move(rule));
        }
    }
    return RuleTable(std::move(rules), j.value("fallback", ""));
}

std::string DescriptionTable::describe(const std::string& category, const std::string& date) const {
    auto it = templates_.find(category);
    std::string text = it != templates_.end() ? it->second : fallback_;

    static const std::string placeholder = "{date}";
    for (size_t pos = text.find(placeholder); pos != std::string::npos;
         pos = text.find(placeholder, pos + date.size())) {
        text.replace(pos, placeholder.size(), date);
    }
    return text;
}

RuleTable default_theme_label_rules() {
    return RuleTable({
        {"Work Performance", {"work", "project", "deadline", "meeting", "team", "review",
                              "presentation", "client", "office"}},
        {"Social Connection", {"friends", "family", "conversation", "together", "people",
                               "colleague", "bonding"}},
        {"Rest & Recovery", {"weekend", "relax", "rest", "sleep", "tired", "recharged",
                             "break", "vacation"}},
        {"Health & Wellness", {"exercise", "health", "sick", "recover", "energy", "running",
                               "wellness"}},
        {"Personal Growth", {"learning", "mentor", "creative", "goal", "reflection", "journey",
                             "growth"}},
        {"Leisure & Recreation", {"beach", "hiking", "music", "concert", "movie", "fun",
                                  "entertainment"}}
    }, "");
}

RuleTable default_category_rules() {
    return RuleTable({
        {"stress surge", {"stress", "pressure", "anxious", "nervous", "overwhelm", "deadline"}},
        {"fatigue spike", {"sick", "tired", "exhausted", "drained", "fatigue", "sleepless"}},
        {"confidence dip", {"unprepared", "worry", "worried", "uncertain", "doubt"}}
    }, "unclassified");
}

DescriptionTable default_category_descriptions() {
    return DescriptionTable({
        {"stress surge", "Elevated stress levels detected on {date}"},
        {"fatigue spike", "Significant fatigue indicators on {date}"},
        {"confidence dip", "Confidence or self-doubt concerns on {date}"}
    }, "Anomaly detected on {date}");
}

} // namespace lpi
