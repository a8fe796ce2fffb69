#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace lpi {

// A label and the vocabulary that selects it
struct KeywordRule {
    std::string label;
    std::vector<std::string> terms;
};

/**
 * @brief Ordered keyword rules with a fallback label
 *
 * Rule order is significant: earlier rules win ties (best_match) or are
 * tried first (first_match).
 */
class RuleTable {
public:
    RuleTable() = default;
    RuleTable(std::vector<KeywordRule> rules, std::string fallback)
        : rules_(std::move(rules)), fallback_(std::move(fallback)) {}

    // Rule whose terms overlap the most keywords; fallback if no rule hits
    std::string best_match(const std::vector<std::string>& keywords) const;

    // First rule with any term present in text; fallback if none
    std::string first_match(const std::string& text) const;

    // Label of the first rule that any keyword selects, or empty
    std::string first_keyword_match(const std::vector<std::string>& keywords) const;

    const std::vector<KeywordRule>& rules() const { return rules_; }
    const std::string& fallback() const { return fallback_; }

    nlohmann::json to_json() const;
    static RuleTable from_json(const nlohmann::json& j);

private:
    std::vector<KeywordRule> rules_;
    std::string fallback_;
};

/**
 * @brief Category -> readable sentence, "{date}" replaced by the day's date
 */
class DescriptionTable {
public:
    DescriptionTable() = default;
    DescriptionTable(std::map<std::string, std::string> templates, std::string fallback)
        : templates_(std::move(templates)), fallback_(std::move(fallback)) {}

    // Template for the category, or the fallback template
    std::string describe(const std::string& category, const std::string& date) const;

    const std::map<std::string, std::string>& templates() const { return templates_; }
    const std::string& fallback() const { return fallback_; }

private:
    std::map<std::string, std::string> templates_;
    std::string fallback_;
};

// Theme label vocabulary (Work Performance, Social Connection, ...); fallback empty
RuleTable default_theme_label_rules();

// Anomaly categories (stress surge, fatigue spike, confidence dip); fallback "unclassified"
RuleTable default_category_rules();

// One sentence per default category; fallback "Anomaly detected on {date}"
DescriptionTable default_category_descriptions();

} // namespace lpi
