#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mirror_for_plex {
namespace core {

struct MatchResult {
    double score = 0.0;                 // best score seen, accepted or not
    std::optional<std::size_t> index;   // set only when score clears the threshold

    bool matched() const { return index.has_value(); }
};

/**
 * Fuzzy title comparison used to pair local folders with catalog entries.
 *
 * Scores lie in [0, 1]. Identical normalized titles score 1.0; anything
 * else is a Dice coefficient over word tokens, lifted to 0.5 + 0.5 * dice
 * when one token set contains the other, and capped at 0.99.
 *
 * All members are pure and deterministic.
 */
class TitleMatcher {
public:
    static constexpr double DEFAULT_THRESHOLD = 0.6;

    explicit TitleMatcher(double threshold = DEFAULT_THRESHOLD);

    double threshold() const { return m_threshold; }

    // Lowercase, drop bracketed tags and punctuation, collapse whitespace,
    // drop one leading article
    static std::string normalize_title(std::string_view title);

    // normalize_title plus removal of trailing season, release and year markers
    static std::string normalize_folder_name(std::string_view folder_name);

    static double score(std::string_view a, std::string_view b);

    // Best score of any query against any title
    static double best_score(const std::vector<std::string>& queries, const std::vector<std::string>& titles);

    // Highest-scoring candidate; the earliest one wins a tie
    MatchResult match(std::string_view remote_title, const std::vector<std::string>& candidates) const;

    // Same as match, with each candidate given as a set of title variants
    // and scored against every query
    MatchResult match_sets(const std::vector<std::string>& queries,
                           const std::vector<std::vector<std::string>>& candidate_titles) const;

private:
    double m_threshold;
};

} // namespace core
} // namespace mirror_for_plex
