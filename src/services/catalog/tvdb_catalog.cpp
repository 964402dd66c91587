#include "mirror_for_plex/services/catalog/catalog_client.hpp"
#include "mirror_for_plex/services/network/http_client.hpp"
#include "mirror_for_plex/services/network/request_builder.hpp"
#include "mirror_for_plex/utils/format_utils.hpp"
#include "mirror_for_plex/utils/json_helper.hpp"
#include "mirror_for_plex/utils/logger.hpp"
#include "mirror_for_plex/utils/url_utils.hpp"

#include <algorithm>

namespace mirror_for_plex {
namespace services {

using utils::JsonHelper;

TvdbCatalog::TvdbCatalog(std::shared_ptr<HttpClient> http_client, std::string api_key, std::chrono::seconds timeout)
    : m_http_client(std::move(http_client)), m_api_key(std::move(api_key)), m_timeout(timeout) {
}

std::expected<std::vector<CatalogEntry>, core::SyncError>
TvdbCatalog::search_titles(const std::string& term) {
    std::string url = std::string(TVDB_API_URL) + "/search?type=series&query=" + utils::UrlUtils::encode(term);

    // A rejected token is refreshed once
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto token = ensure_token();
        if (!token) {
            return std::unexpected(token.error());
        }

        auto request = RequestBuilder(url)
            .header("Accept", "application/json")
            .bearer_token(token.value())
            .timeout(m_timeout)
            .build();

        auto response = m_http_client->execute(request);
        if (!response) {
            MIRROR_LOG_WARNING("TVDB", "Search failed for '" + term + "': " + to_string(response.error()));
            return std::unexpected(core::SyncError::TransientNetworkError);
        }

        if (response->status_code == HttpStatus::Unauthorized) {
            MIRROR_LOG_INFO("TVDB", "Token rejected, logging in again");
            std::lock_guard lock(m_token_mutex);
            m_token.clear();
            continue;
        }

        if (!response->is_success()) {
            MIRROR_LOG_WARNING("TVDB", "TVDB returned " + std::to_string(response->status()) +
                               " for search '" + term + "'");
            return std::unexpected(core::SyncError::TransientNetworkError);
        }

        auto entries = parse_search_response(response->body);
        MIRROR_LOG_INFO("TVDB", "Search for '" + term + "' returned " + std::to_string(entries.size()) + " candidates");
        return entries;
    }

    return std::unexpected(core::SyncError::TransientNetworkError);
}

std::expected<std::string, core::SyncError> TvdbCatalog::ensure_token() {
    std::lock_guard lock(m_token_mutex);
    if (!m_token.empty()) {
        return m_token;
    }

    nlohmann::json payload = {{"apikey", m_api_key}};
    auto response = m_http_client->post_json(std::string(TVDB_API_URL) + "/login", payload.dump(),
                                             {{"Accept", "application/json"}}, m_timeout);
    if (!response) {
        MIRROR_LOG_WARNING("TVDB", "Login failed: " + to_string(response.error()));
        return std::unexpected(core::SyncError::TransientNetworkError);
    }
    if (!response->is_success()) {
        MIRROR_LOG_WARNING("TVDB", "Login returned HTTP " + std::to_string(response->status()));
        return std::unexpected(core::SyncError::TransientNetworkError);
    }

    auto json_result = JsonHelper::safe_parse(response->body);
    if (!json_result || !JsonHelper::has_field(json_result.value(), "data")) {
        MIRROR_LOG_WARNING("TVDB", "Login response has no data");
        return std::unexpected(core::SyncError::TransientNetworkError);
    }

    m_token = JsonHelper::get_string(json_result.value()["data"], "token");
    if (m_token.empty()) {
        MIRROR_LOG_WARNING("TVDB", "Login response has no token");
        return std::unexpected(core::SyncError::TransientNetworkError);
    }

    MIRROR_LOG_DEBUG("TVDB", "Obtained API token");
    return m_token;
}

std::vector<CatalogEntry> TvdbCatalog::parse_search_response(const std::string& body) {
    std::vector<CatalogEntry> entries;

    auto json_result = JsonHelper::safe_parse(body);
    if (!json_result) {
        MIRROR_LOG_WARNING("TVDB", "Error parsing search response: " + json_result.error());
        return entries;
    }
    if (!JsonHelper::has_array(json_result.value(), "data")) {
        return entries;
    }

    for (const auto& item : json_result.value()["data"]) {
        CatalogEntry entry;
        entry.id = JsonHelper::get_id(item, "tvdb_id");
        if (entry.id.empty()) {
            entry.id = JsonHelper::get_id(item, "id");
        }

        std::string name = JsonHelper::get_string(item, "name");
        if (entry.id.empty() || name.empty()) {
            continue;
        }

        entry.romaji_title = name;
        entry.titles.push_back(name);

        if (JsonHelper::has_field(item, "translations")) {
            entry.english_title = JsonHelper::get_string(item["translations"], "eng");
            if (!entry.english_title.empty() &&
                std::find(entry.titles.begin(), entry.titles.end(), entry.english_title) == entry.titles.end()) {
                entry.titles.push_back(entry.english_title);
            }
        }
        for (const auto& alias : JsonHelper::get_string_list(item, "aliases")) {
            if (std::find(entry.titles.begin(), entry.titles.end(), alias) == entry.titles.end()) {
                entry.titles.push_back(alias);
            }
        }

        std::string overview;
        if (JsonHelper::has_field(item, "overviews")) {
            overview = JsonHelper::get_string(item["overviews"], "eng");
        }
        if (overview.empty()) {
            overview = JsonHelper::get_string(item, "overview");
        }
        entry.synopsis = utils::strip_html(overview);

        entry.image_url = JsonHelper::get_string(item, "image_url");
        if (entry.image_url.empty()) {
            entry.image_url = JsonHelper::get_string(item, "thumbnail");
        }

        entries.push_back(std::move(entry));
    }

    return entries;
}

} // namespace services
} // namespace mirror_for_plex
