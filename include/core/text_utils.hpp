#pragma once

#include <string>
#include <vector>

namespace lpi {

std::string to_lower_copy(const std::string& s);

// Lowercase alphabetic runs of at least min_length characters, in order of appearance
std::vector<std::string> tokenize_words(const std::string& text, size_t min_length = 1);

// True if any token of lower_text equals term, or starts with it for terms of
// five letters or more ("stress" matches "stressed"). Multi-word terms are
// matched as substrings.
bool contains_term(const std::string& lower_text, const std::string& term);

/**
 * @brief Most frequent salient words across texts
 *
 * Words shorter than four letters and stop words are ignored. Ties are broken by
 * first appearance so the result is stable for a given input order.
 */
std::vector<std::string> extract_keywords(const std::vector<std::string>& texts, size_t max_keywords);

std::string title_case(const std::string& s);

} // namespace lpi
