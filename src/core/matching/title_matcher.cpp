#include "mirror_for_plex/core/title_matcher.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <set>
#include <sstream>

namespace mirror_for_plex {
namespace core {

namespace {

constexpr double NON_EXACT_CAP = 0.99;

bool is_ascii(char c) {
    return (static_cast<unsigned char>(c) & 0x80) == 0;
}

std::vector<std::string> split_tokens(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::istringstream stream(normalized);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string joined;
    for (const auto& token : tokens) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += token;
    }
    return joined;
}

bool is_release_marker(const std::string& token) {
    static constexpr std::array<std::string_view, 12> markers = {
        "1080p", "720p", "2160p", "480p", "4k", "hevc", "x264", "x265", "bluray", "bd", "web", "10bit"
    };
    return std::find(markers.begin(), markers.end(), token) != markers.end();
}

// Removes one trailing marker; returns false when nothing matched
bool strip_trailing_marker(std::vector<std::string>& tokens) {
    static const std::regex short_season(R"(s\d{1,2})");
    static const std::regex number(R"(\d{1,2})");
    static const std::regex ordinal(R"(\d{1,2}(st|nd|rd|th))");
    static const std::regex year(R"((19|20)\d{2})");

    if (tokens.size() < 2) {
        return false;
    }

    const std::string& last = tokens.back();
    const std::string& previous = tokens[tokens.size() - 2];

    auto pop = [&tokens](std::size_t count) {
        // Keep at least one token so the folder still has a name
        if (tokens.size() <= count) {
            return false;
        }
        tokens.resize(tokens.size() - count);
        return true;
    };

    if (std::regex_match(last, short_season) || is_release_marker(last) || std::regex_match(last, year)) {
        return pop(1);
    }
    if (std::regex_match(last, number) &&
        (previous == "season" || previous == "part" || previous == "cour")) {
        return pop(2);
    }
    if (last == "season" && std::regex_match(previous, ordinal)) {
        return pop(2);
    }
    if (last == "dl" && previous == "web") {
        return pop(2);
    }
    return false;
}

std::set<std::string> token_set(const std::string& normalized) {
    auto tokens = split_tokens(normalized);
    return {tokens.begin(), tokens.end()};
}

} // namespace

TitleMatcher::TitleMatcher(double threshold)
    : m_threshold(threshold) {
}

std::string TitleMatcher::normalize_title(std::string_view title) {
    std::string cleaned;
    cleaned.reserve(title.size());

    int depth = 0;
    for (char c : title) {
        if (c == '[' || c == '(' || c == '{') {
            ++depth;
            cleaned += ' ';
            continue;
        }
        if (c == ']' || c == ')' || c == '}') {
            if (depth > 0) {
                --depth;
            }
            cleaned += ' ';
            continue;
        }
        if (depth > 0) {
            continue;
        }

        if (!is_ascii(c)) {
            cleaned += c;
        } else if (c == '\'') {
            // "Frieren's" -> "frierens"
        } else if (std::isalnum(static_cast<unsigned char>(c))) {
            cleaned += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            cleaned += ' ';
        }
    }

    auto tokens = split_tokens(cleaned);
    if (tokens.size() > 1 && (tokens.front() == "the" || tokens.front() == "a" || tokens.front() == "an")) {
        tokens.erase(tokens.begin());
    }
    return join_tokens(tokens);
}

std::string TitleMatcher::normalize_folder_name(std::string_view folder_name) {
    auto tokens = split_tokens(normalize_title(folder_name));
    while (strip_trailing_marker(tokens)) {
    }
    return join_tokens(tokens);
}

double TitleMatcher::score(std::string_view a, std::string_view b) {
    std::string left = normalize_title(a);
    std::string right = normalize_title(b);
    if (left.empty() || right.empty()) {
        return 0.0;
    }
    if (left == right) {
        return 1.0;
    }

    auto left_tokens = token_set(left);
    auto right_tokens = token_set(right);

    std::size_t common = 0;
    for (const auto& token : left_tokens) {
        common += right_tokens.count(token);
    }
    if (common == 0) {
        return 0.0;
    }

    double dice = 2.0 * static_cast<double>(common) /
                  static_cast<double>(left_tokens.size() + right_tokens.size());

    bool contained = common == std::min(left_tokens.size(), right_tokens.size());
    double result = contained ? 0.5 + 0.5 * dice : dice;
    return std::min(result, NON_EXACT_CAP);
}

double TitleMatcher::best_score(const std::vector<std::string>& queries, const std::vector<std::string>& titles) {
    double best = 0.0;
    for (const auto& query : queries) {
        for (const auto& title : titles) {
            best = std::max(best, score(query, title));
        }
    }
    return best;
}

MatchResult TitleMatcher::match(std::string_view remote_title, const std::vector<std::string>& candidates) const {
    std::vector<std::vector<std::string>> sets;
    sets.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        sets.push_back({candidate});
    }
    return match_sets({std::string(remote_title)}, sets);
}

MatchResult TitleMatcher::match_sets(const std::vector<std::string>& queries,
                                     const std::vector<std::vector<std::string>>& candidate_titles) const {
    MatchResult result;
    std::optional<std::size_t> best_index;

    for (std::size_t i = 0; i < candidate_titles.size(); ++i) {
        double candidate_score = best_score(queries, candidate_titles[i]);
        // Strictly greater, so the earliest candidate keeps a tie
        if (!best_index || candidate_score > result.score) {
            result.score = candidate_score;
            best_index = i;
        }
    }

    if (best_index && result.score >= m_threshold && result.score > 0.0) {
        result.index = best_index;
    }
    return result;
}

} // namespace core
} // namespace mirror_for_plex
