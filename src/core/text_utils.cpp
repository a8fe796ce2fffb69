#include "core/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace lpi {

namespace {

const std::unordered_set<std::string>& stop_words() {
    static const std::unordered_set<std::string> words = {
        "the", "a", "an", "and", "or", "but", "in", "on", "at", "to",
        "for", "of", "with", "by", "from", "up", "about", "is", "was",
        "are", "were", "been", "be", "have", "has", "had", "do", "does",
        "did", "will", "would", "could", "should", "may", "might", "can",
        "diary", "voice", "scene", "this", "that", "i", "my", "me",
        "just", "really", "very", "then", "than", "them", "they", "there",
        "their", "what", "when", "which", "while", "some", "into", "after",
        "today", "feel", "felt", "like", "also", "much", "more", "over"
    };
    return words;
}

} // anonymous namespace

std::string to_lower_copy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> tokenize_words(const std::string& text, size_t min_length) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalpha(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else {
            if (current.size() >= min_length && !current.empty()) tokens.push_back(current);
            current.clear();
        }
    }
    if (current.size() >= min_length && !current.empty()) tokens.push_back(current);
    return tokens;
}

bool contains_term(const std::string& lower_text, const std::string& term) {
    if (term.empty()) return false;
    if (term.find_first_not_of("abcdefghijklmnopqrstuvwxyz") != std::string::npos) {
        return lower_text.find(term) != std::string::npos;
    }
    for (const auto& token : tokenize_words(lower_text)) {
        if (token == term) return true;
        if (term.size() >= 5 && token.compare(0, term.size(), term) == 0) return true;
    }
    return false;
}

std::vector<std::string> extract_keywords(const std::vector<std::string>& texts, size_t max_keywords) {
    std::unordered_map<std::string, size_t> counts;
    std::unordered_map<std::string, size_t> first_seen;
    size_t position = 0;

    for (const auto& text : texts) {
        for (const auto& word : tokenize_words(text, 4)) {
            if (stop_words().count(word)) continue;
            if (counts[word]++ == 0) first_seen[word] = position;
            ++position;
        }
    }

    std::vector<std::string> words;
    words.reserve(counts.size());
    for (const auto& [word, count] : counts) words.push_back(word);

    std::sort(words.begin(), words.end(), [&](const std::string& a, const std::string& b) {
        if (counts[a] != counts[b]) return counts[a] > counts[b];
        return first_seen[a] < first_seen[b];
    });

    if (words.size() > max_keywords) words.resize(max_keywords);
    return words;
}

std::string title_case(const std::string& s) {
    std::string out = s;
    bool start = true;
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalpha(c)) {
            ch = static_cast<char>(start ? std::toupper(c) : std::tolower(c));
            start = false;
        } else {
            start = true;
        }
    }
    return out;
}

} // namespace lpi
