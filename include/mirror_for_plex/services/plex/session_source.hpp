#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <chrono>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mirror_for_plex {
namespace services {

class HttpClient;

// Source of the configured user's active playback on the media server
class RemoteSessionSource {
public:
    virtual ~RemoteSessionSource() = default;

    // Empty optional when the user has no session in one of the given libraries
    virtual std::expected<std::optional<core::RemoteSession>, core::SyncError>
    get_active_session(const std::string& username, const std::vector<std::string>& libraries) = 0;
};

class PlexSessionSource : public RemoteSessionSource {
public:
    PlexSessionSource(std::shared_ptr<HttpClient> http_client,
                      std::string server_url,
                      std::string token,
                      std::chrono::seconds timeout);

    std::expected<std::optional<core::RemoteSession>, core::SyncError>
    get_active_session(const std::string& username, const std::vector<std::string>& libraries) override;

    // Picks the first session in a /status/sessions document owned by the user
    // and playing from one of the libraries
    static std::optional<core::RemoteSession> select_session(
        const nlohmann::json& document,
        const std::string& username,
        const std::vector<std::string>& libraries);

private:
    std::map<std::string, std::string> get_standard_headers() const;

    std::shared_ptr<HttpClient> m_http_client;
    std::string m_server_url;
    std::string m_token;
    std::chrono::seconds m_timeout;

    static constexpr const char* SESSION_ENDPOINT = "/status/sessions";
};

} // namespace services
} // namespace mirror_for_plex
