#pragma once

#include <string>
#include <unordered_map>
#include <chrono>
#include <optional>

namespace mirror_for_plex {
namespace services {

// HTTP method enumeration
enum class HttpMethod {
    GET,
    POST
};

// HTTP status codes
enum class HttpStatus {
    OK = 200,
    NoContent = 204,
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    TooManyRequests = 429,
    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504
};

// Network error types
enum class NetworkError {
    ConnectionFailed,
    Timeout,
    DNSResolutionFailed,
    SSLError,
    InvalidUrl,
    TooManyRedirects,
    BadResponse,
    FileError,
    Cancelled
};

// HTTP headers type
using HttpHeaders = std::unordered_map<std::string, std::string>;

// HTTP request structure
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::chrono::seconds timeout{30};
    bool follow_redirects = true;
    int max_redirects = 5;

    std::optional<std::string> bearer_token;
    bool verify_ssl = true;

    bool is_valid() const;
};

// HTTP response structure
struct HttpResponse {
    HttpStatus status_code = HttpStatus::OK;
    HttpHeaders headers;
    std::string body;
    std::chrono::milliseconds response_time{0};
    std::string final_url; // After redirects

    // Convenience methods
    bool is_success() const;
    bool is_client_error() const;
    bool is_server_error() const;
    int status() const { return static_cast<int>(status_code); }
    std::optional<std::string> get_header(const std::string& name) const;
};

std::string to_string(NetworkError error);

} // namespace services
} // namespace mirror_for_plex
