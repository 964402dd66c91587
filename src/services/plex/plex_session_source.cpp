#include "mirror_for_plex/services/plex/session_source.hpp"
#include "mirror_for_plex/services/network/http_client.hpp"
#include "mirror_for_plex/utils/json_helper.hpp"
#include "mirror_for_plex/utils/logger.hpp"
#include "mirror_for_plex/utils/url_utils.hpp"
#include "version.h"

#include <algorithm>
#include <cctype>

namespace mirror_for_plex {
namespace services {

using utils::JsonHelper;

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](unsigned char x, unsigned char y) {
                          return std::tolower(x) == std::tolower(y);
                      });
}

std::string session_file_path(const nlohmann::json& session) {
    if (!JsonHelper::has_array(session, "Media")) {
        return {};
    }
    const auto& media = session["Media"][0];
    if (!JsonHelper::has_array(media, "Part")) {
        return {};
    }
    return JsonHelper::get_string(media["Part"][0], "file");
}

} // namespace

PlexSessionSource::PlexSessionSource(std::shared_ptr<HttpClient> http_client,
                                     std::string server_url,
                                     std::string token,
                                     std::chrono::seconds timeout)
    : m_http_client(std::move(http_client)),
      m_server_url(std::move(server_url)),
      m_token(std::move(token)),
      m_timeout(timeout) {
}

std::expected<std::optional<core::RemoteSession>, core::SyncError>
PlexSessionSource::get_active_session(const std::string& username, const std::vector<std::string>& libraries) {
    std::string url = utils::UrlUtils::join_path(m_server_url, SESSION_ENDPOINT);
    auto headers_map = get_standard_headers();
    HttpHeaders headers(headers_map.begin(), headers_map.end());

    auto response = m_http_client->get(url, headers, m_timeout);
    if (!response) {
        MIRROR_LOG_WARNING("PlexSessionSource", "Session query failed: " + to_string(response.error()));
        return std::unexpected(core::SyncError::TransientNetworkError);
    }
    if (!response->is_success()) {
        MIRROR_LOG_WARNING("PlexSessionSource", "Session query returned HTTP " + std::to_string(response->status()));
        return std::unexpected(core::SyncError::TransientNetworkError);
    }

    auto json_result = JsonHelper::safe_parse(response->body);
    if (!json_result) {
        MIRROR_LOG_WARNING("PlexSessionSource", "Error parsing session data: " + json_result.error());
        return std::unexpected(core::SyncError::TransientNetworkError);
    }

    auto session = select_session(json_result.value(), username, libraries);
    if (session) {
        MIRROR_LOG_DEBUG("PlexSessionSource", "Active session " + session->session_key + ": " +
                         session->item_title + " [" + session->library_name + "]");
    }
    return session;
}

std::optional<core::RemoteSession> PlexSessionSource::select_session(
    const nlohmann::json& document,
    const std::string& username,
    const std::vector<std::string>& libraries) {

    if (!JsonHelper::has_field(document, "MediaContainer")) {
        return std::nullopt;
    }
    const auto& container = document["MediaContainer"];
    if (!JsonHelper::has_array(container, "Metadata")) {
        return std::nullopt;
    }

    for (const auto& entry : container["Metadata"]) {
        if (!entry.is_object()) {
            continue;
        }

        std::string user;
        if (JsonHelper::has_field(entry, "User")) {
            user = JsonHelper::get_string(entry["User"], "title");
        }
        if (!iequals(user, username)) {
            continue;
        }

        std::string library = JsonHelper::get_string(entry, "librarySectionTitle");
        if (std::find(libraries.begin(), libraries.end(), library) == libraries.end()) {
            MIRROR_LOG_DEBUG("PlexSessionSource", "Ignoring session from library '" + library + "'");
            continue;
        }

        core::RemoteSession session;
        session.library_name = library;
        session.show_title = JsonHelper::get_string(entry, "grandparentTitle");
        session.item_title = session.show_title.empty()
            ? JsonHelper::get_string(entry, "title")
            : session.show_title;
        session.file_path = session_file_path(entry);
        session.session_key = JsonHelper::get_id(entry, "sessionKey");
        session.season = JsonHelper::get_optional<int>(entry, "parentIndex", 0);
        session.episode = JsonHelper::get_optional<int>(entry, "index", 0);

        if (JsonHelper::has_field(entry, "Player")) {
            session.is_playing = JsonHelper::get_string(entry["Player"], "state") == "playing";
        }
        return session;
    }

    return std::nullopt;
}

std::map<std::string, std::string> PlexSessionSource::get_standard_headers() const {
    std::map<std::string, std::string> headers = {
        {"X-Plex-Product", "Mirror For Plex"},
        {"X-Plex-Version", VERSION_STRING},
        {"X-Plex-Client-Identifier", "mirror-for-plex"},
        {"X-Plex-Platform", "Linux"},
        {"X-Plex-Device", "PC"},
        {"Accept", "application/json"}
    };

    if (!m_token.empty()) {
        headers["X-Plex-Token"] = m_token;
    }

    return headers;
}

} // namespace services
} // namespace mirror_for_plex
