#include "analysis/mood_scorer.hpp"
#include "core/text_utils.hpp"

namespace lpi {

LexiconMoodScorer::LexiconMoodScorer()
    : positive_({"good", "great", "happy", "wonderful", "amazing", "love",
                 "better", "accomplished", "grateful", "fun", "excited",
                 "relieved", "positive", "motivated", "confident", "inspired",
                 "recharged", "energetic", "optimistic", "fulfilling", "rewarding",
                 "calm", "peaceful", "proud", "joy"}),
      negative_({"stress", "pressure", "anxious", "nervous", "worry", "tough",
                 "exhausted", "tired", "drained", "difficult", "hard", "sick",
                 "worried", "unprepared", "uncertain", "struggling", "frustrated",
                 "sad", "lonely", "overwhelmed", "angry"}) {}

LexiconMoodScorer::LexiconMoodScorer(std::vector<std::string> positive,
                                     std::vector<std::string> negative)
    : positive_(std::move(positive)), negative_(std::move(negative)) {}

double LexiconMoodScorer::score(const std::string& text) const {
    std::string lower = to_lower_copy(text);

    int pos = 0;
    for (const auto& term : positive_) {
        if (contains_term(lower, term)) ++pos;
    }
    int neg = 0;
    for (const auto& term : negative_) {
        if (contains_term(lower, term)) ++neg;
    }

    int total = pos + neg;
    if (total == 0) return 0.0;
    return static_cast<double>(pos - neg) / static_cast<double>(total);
}

} // namespace lpi
