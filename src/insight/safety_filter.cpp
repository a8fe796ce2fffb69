#include "insight/safety_filter.hpp"
#include "core/text_utils.hpp"

namespace lpi {

SafetyFilter::SafetyFilter()
    : risk_terms_({"hopeless", "worthless", "give up", "can't go on", "cannot go on",
                   "suicide", "suicidal", "self-harm", "self harm", "end it all"}),
      ambiguous_terms_({"uncertain", "doubt", "worried", "unprepared"}) {}

SafetyFilter::SafetyFilter(std::vector<std::string> risk_terms,
                           std::vector<std::string> ambiguous_terms)
    : risk_terms_(std::move(risk_terms)), ambiguous_terms_(std::move(ambiguous_terms)) {}

const std::string& SafetyFilter::risk_note() {
    static const std::string note =
        "High-risk emotional indicators detected. Professional consultation strongly recommended.";
    return note;
}

const std::string& SafetyFilter::clear_note() {
    static const std::string note = "No critical risk indicators detected.";
    return note;
}

const std::string& SafetyFilter::disclaimer() {
    static const std::string note =
        "All insights are observational and non-diagnostic. "
        "This analysis does not replace professional mental health assessment.";
    return note;
}

bool SafetyFilter::has_risk_language(const std::string& text) const {
    std::string lower = to_lower_copy(text);
    for (const auto& term : risk_terms_) {
        if (contains_term(lower, term)) return true;
    }
    return false;
}

size_t SafetyFilter::count_ambiguous(const std::vector<std::string>& texts) const {
    size_t count = 0;
    for (const auto& text : texts) {
        std::string lower = to_lower_copy(text);
        for (const auto& term : ambiguous_terms_) {
            if (contains_term(lower, term)) {
                ++count;
                break;
            }
        }
    }
    return count;
}

std::vector<std::string> SafetyFilter::scan(const std::vector<std::string>& texts) const {
    std::vector<std::string> notes;

    bool risk = false;
    for (const auto& text : texts) {
        if (has_risk_language(text)) {
            risk = true;
            break;
        }
    }
    notes.push_back(risk ? risk_note() : clear_note());

    size_t ambiguous = count_ambiguous(texts);
    if (ambiguous > 0) {
        notes.push_back("Ambiguous self-doubt language detected on " + std::to_string(ambiguous) +
                        (ambiguous == 1 ? " occasion. " : " occasions. ") +
                        "Interpretations should consider broader context.");
    }

    notes.push_back(disclaimer());
    return notes;
}

} // namespace lpi
