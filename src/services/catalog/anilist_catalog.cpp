#include "mirror_for_plex/services/catalog/catalog_client.hpp"
#include "mirror_for_plex/services/network/http_client.hpp"
#include "mirror_for_plex/utils/format_utils.hpp"
#include "mirror_for_plex/utils/json_helper.hpp"
#include "mirror_for_plex/utils/logger.hpp"

#include <algorithm>

namespace mirror_for_plex {
namespace services {

using utils::JsonHelper;

namespace {

constexpr const char* SEARCH_QUERY = R"(query ($search: String, $perPage: Int) {
  Page(perPage: $perPage) {
    media(search: $search, type: ANIME) {
      id
      title { romaji english native }
      synonyms
      description(asHtml: false)
      coverImage { extraLarge large }
    }
  }
})";

void add_title(std::vector<std::string>& titles, const std::string& title) {
    if (!title.empty() && std::find(titles.begin(), titles.end(), title) == titles.end()) {
        titles.push_back(title);
    }
}

} // namespace

AniListCatalog::AniListCatalog(std::shared_ptr<HttpClient> http_client, std::chrono::seconds timeout)
    : m_http_client(std::move(http_client)), m_timeout(timeout) {
}

std::expected<std::vector<CatalogEntry>, core::SyncError>
AniListCatalog::search_titles(const std::string& term) {
    MIRROR_LOG_DEBUG("AniList", "Searching for: " + term);

    nlohmann::json payload = {
        {"query", SEARCH_QUERY},
        {"variables", {{"search", term}, {"perPage", MAX_RESULTS}}}
    };

    auto response = m_http_client->post_json(ANILIST_GRAPHQL_URL, payload.dump(),
                                             {{"Accept", "application/json"}}, m_timeout);
    if (!response) {
        MIRROR_LOG_WARNING("AniList", "Search failed for '" + term + "': " + to_string(response.error()));
        return std::unexpected(core::SyncError::TransientNetworkError);
    }
    if (!response->is_success()) {
        MIRROR_LOG_WARNING("AniList", "AniList returned " + std::to_string(response->status()) +
                           " for search '" + term + "'");
        return std::unexpected(core::SyncError::TransientNetworkError);
    }

    auto entries = parse_search_response(response->body);
    MIRROR_LOG_INFO("AniList", "Search for '" + term + "' returned " + std::to_string(entries.size()) + " candidates");
    return entries;
}

std::vector<CatalogEntry> AniListCatalog::parse_search_response(const std::string& body) {
    std::vector<CatalogEntry> entries;

    auto json_result = JsonHelper::safe_parse(body);
    if (!json_result) {
        MIRROR_LOG_WARNING("AniList", "Error parsing search response: " + json_result.error());
        return entries;
    }

    const auto& json_response = json_result.value();
    if (!JsonHelper::has_field(json_response, "data") ||
        !JsonHelper::has_field(json_response["data"], "Page") ||
        !JsonHelper::has_array(json_response["data"]["Page"], "media")) {
        return entries;
    }

    for (const auto& media : json_response["data"]["Page"]["media"]) {
        CatalogEntry entry;
        entry.id = JsonHelper::get_id(media, "id");
        if (entry.id.empty()) {
            continue;
        }

        if (JsonHelper::has_field(media, "title")) {
            const auto& title = media["title"];
            entry.romaji_title = JsonHelper::get_string(title, "romaji");
            entry.english_title = JsonHelper::get_string(title, "english");
            add_title(entry.titles, entry.romaji_title);
            add_title(entry.titles, entry.english_title);
            add_title(entry.titles, JsonHelper::get_string(title, "native"));
        }
        for (const auto& synonym : JsonHelper::get_string_list(media, "synonyms")) {
            add_title(entry.titles, synonym);
        }

        entry.synopsis = utils::strip_html(JsonHelper::get_string(media, "description"));

        if (JsonHelper::has_field(media, "coverImage")) {
            const auto& cover = media["coverImage"];
            entry.image_url = JsonHelper::get_string(cover, "extraLarge");
            if (entry.image_url.empty()) {
                entry.image_url = JsonHelper::get_string(cover, "large");
            }
        }

        entries.push_back(std::move(entry));
    }

    return entries;
}

} // namespace services
} // namespace mirror_for_plex
