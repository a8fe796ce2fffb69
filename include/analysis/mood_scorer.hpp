#pragma once

#include <string>
#include <vector>

namespace lpi {

/**
 * @brief Lexicon valence score in [-1, 1]
 *
 * (positive hits - negative hits) / (positive hits + negative hits), 0 when
 * neither lexicon matches. Supplies the per-day mood scalar that the temporal
 * aggregator and cycle detector aggregate.
 */
class LexiconMoodScorer {
public:
    LexiconMoodScorer();
    LexiconMoodScorer(std::vector<std::string> positive, std::vector<std::string> negative);

    double score(const std::string& text) const;

    const std::vector<std::string>& positive_terms() const { return positive_; }
    const std::vector<std::string>& negative_terms() const { return negative_; }

private:
    std::vector<std::string> positive_;
    std::vector<std::string> negative_;
};

} // namespace lpi
