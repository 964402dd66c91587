#include "mirror_for_plex/services/identity/metadata_resolver.hpp"
#include "mirror_for_plex/services/artwork/cover_art_cache.hpp"
#include "mirror_for_plex/services/catalog/catalog_client.hpp"
#include "mirror_for_plex/services/identity/identity_cache.hpp"
#include "mirror_for_plex/utils/logger.hpp"

#include <sstream>

namespace mirror_for_plex {
namespace services {

namespace {

struct Candidate {
    std::string catalog;
    CatalogEntry entry;
};

void collect(CatalogClient& catalog, const std::string& term, std::vector<Candidate>& candidates) {
    auto result = catalog.search_titles(term);
    if (!result) {
        MIRROR_LOG_WARNING("MetadataResolver", catalog.name() + " unavailable (" + core::to_string(result.error()) +
                           "), treating as no candidates");
        return;
    }
    for (auto& entry : result.value()) {
        candidates.push_back({catalog.name(), std::move(entry)});
    }
}

core::MatchResult best_match(const core::TitleMatcher& matcher,
                             const std::vector<std::string>& queries,
                             const std::vector<Candidate>& candidates) {
    std::vector<std::vector<std::string>> title_sets;
    title_sets.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        title_sets.push_back(candidate.entry.titles);
    }
    return matcher.match_sets(queries, title_sets);
}

std::string format_score(double score) {
    std::ostringstream oss;
    oss.precision(3);
    oss << score;
    return oss.str();
}

} // namespace

MetadataResolver::MetadataResolver(std::shared_ptr<IdentityCache> cache,
                                   std::shared_ptr<CatalogClient> primary,
                                   std::shared_ptr<CatalogClient> secondary,
                                   core::TitleMatcher matcher)
    : m_cache(std::move(cache)),
      m_primary(std::move(primary)),
      m_secondary(std::move(secondary)),
      m_matcher(matcher) {
}

core::FolderIdentity MetadataResolver::resolve(const std::filesystem::path& folder, const std::string& remote_title) {
    if (auto cached = m_cache->lookup(folder)) {
        MIRROR_LOG_DEBUG("MetadataResolver", "Cache hit for " + cached->folder_path +
                         (cached->is_resolved() ? " (" + cached->catalog + ":" + cached->source_id + ")" : " (unresolved)"));
        return *cached;
    }

    const std::string key = IdentityCache::normalize_key(folder);
    const std::string folder_name = std::filesystem::path(key).filename().string();

    std::string term = core::TitleMatcher::normalize_folder_name(folder_name);
    if (term.empty()) {
        term = core::TitleMatcher::normalize_title(remote_title);
    }

    std::vector<std::string> queries;
    if (!term.empty()) {
        queries.push_back(term);
    }
    if (!remote_title.empty()) {
        queries.push_back(remote_title);
    }

    MIRROR_LOG_INFO("MetadataResolver", "Resolving " + key + " as '" + term + "'");

    std::vector<Candidate> candidates;
    core::MatchResult match;

    if (!term.empty()) {
        if (m_primary) {
            collect(*m_primary, term, candidates);
            match = best_match(m_matcher, queries, candidates);
        }

        // Secondary candidates go after the primary ones so the primary keeps ties
        if (!match.matched() && m_secondary) {
            collect(*m_secondary, term, candidates);
            match = best_match(m_matcher, queries, candidates);
        }
    }

    core::FolderIdentity identity;
    identity.folder_path = key;
    identity.resolved_at = std::chrono::system_clock::now();

    if (match.matched()) {
        const auto& winner = candidates[*match.index];
        identity.source_id = winner.entry.id;
        identity.catalog = winner.catalog;
        identity.romaji_title = winner.entry.romaji_title;
        identity.english_title = winner.entry.english_title;
        identity.synopsis = winner.entry.synopsis;
        identity.image_url = winner.entry.image_url;
        if (!identity.image_url.empty()) {
            identity.image_file_name = CoverArtCache::image_file_name(winner.catalog, winner.entry.id);
        }
        MIRROR_LOG_INFO("MetadataResolver", "Matched " + folder_name + " to " + winner.catalog + ":" +
                        winner.entry.id + " '" + identity.display_title() + "' (score " + format_score(match.score) + ")");
    } else {
        MIRROR_LOG_WARNING("MetadataResolver", "No catalog match for " + folder_name +
                           " among " + std::to_string(candidates.size()) + " candidates (best score " +
                           format_score(match.score) + "), caching as unresolved");
    }

    if (auto stored = m_cache->store(identity); !stored) {
        MIRROR_LOG_ERROR("MetadataResolver", "Identity for " + identity.folder_path + " kept in memory only: " +
                         core::to_string(stored.error()));
    }

    return identity;
}

} // namespace services
} // namespace mirror_for_plex
