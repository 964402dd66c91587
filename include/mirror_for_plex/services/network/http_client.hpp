#pragma once

#include "mirror_for_plex/services/network/http_types.hpp"
#include <filesystem>
#include <memory>
#include <expected>
#include <stop_token>

namespace mirror_for_plex {
namespace services {

// HTTP client interface
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Synchronous request; aborts early once the cancel token is triggered
    virtual std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) = 0;

    // Convenience methods
    virtual std::expected<HttpResponse, NetworkError> get(
        const std::string& url,
        const HttpHeaders& headers = {},
        std::chrono::seconds timeout = std::chrono::seconds{0}) = 0;

    virtual std::expected<HttpResponse, NetworkError> post_json(
        const std::string& url,
        const std::string& json_body,
        const HttpHeaders& headers = {},
        std::chrono::seconds timeout = std::chrono::seconds{0}) = 0;

    // Downloads into a temporary sibling and renames it into place on success
    virtual std::expected<void, NetworkError> download_file(
        const std::string& url,
        const std::filesystem::path& file_path,
        std::chrono::seconds timeout = std::chrono::seconds{0}) = 0;

    // Configuration
    virtual void set_default_timeout(std::chrono::seconds timeout) = 0;
    virtual void set_cancel_token(std::stop_token token) = 0;
};

// HTTP client configuration
struct HttpClientConfig {
    std::chrono::seconds default_timeout{30};
    std::chrono::seconds connect_timeout{10};
    HttpHeaders default_headers;
    std::string user_agent = "MirrorForPlex/1.0";
    bool follow_redirects = true;
    int max_redirects = 5;
    bool verify_ssl = true;

    bool is_valid() const;
};

// Factory function for creating HTTP clients
std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config = {});

} // namespace services
} // namespace mirror_for_plex
