#pragma once

#include <string>
#include <vector>

namespace lpi {

/**
 * @brief Advisory scan for distress and ambiguity language
 *
 * Produces notes to append to an insight bundle. It only ever adds text; the
 * insights it scans are left as they are.
 */
class SafetyFilter {
public:
    SafetyFilter();
    SafetyFilter(std::vector<std::string> risk_terms, std::vector<std::string> ambiguous_terms);

    // Notes for the given texts: risk note (or all-clear), ambiguity note, disclaimer
    std::vector<std::string> scan(const std::vector<std::string>& texts) const;

    bool has_risk_language(const std::string& text) const;
    size_t count_ambiguous(const std::vector<std::string>& texts) const;

    static const std::string& risk_note();
    static const std::string& clear_note();
    static const std::string& disclaimer();

private:
    std::vector<std::string> risk_terms_;
    std::vector<std::string> ambiguous_terms_;
};

} // namespace lpi
