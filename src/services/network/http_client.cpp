#include "mirror_for_plex/services/network/http_types.hpp"
#include "mirror_for_plex/services/network/http_client.hpp"
#include "mirror_for_plex/services/network/request_builder.hpp"
#include "mirror_for_plex/utils/url_utils.hpp"

#include <algorithm>
#include <cctype>

namespace mirror_for_plex {
namespace services {

// HttpRequest validation
bool HttpRequest::is_valid() const {
    return !url.empty() && utils::UrlUtils::is_valid_url(url);
}

// HttpResponse convenience methods
bool HttpResponse::is_success() const {
    return status() >= 200 && status() < 300;
}

bool HttpResponse::is_client_error() const {
    return status() >= 400 && status() < 500;
}

bool HttpResponse::is_server_error() const {
    return status() >= 500 && status() < 600;
}

std::optional<std::string> HttpResponse::get_header(const std::string& name) const {
    auto it = std::find_if(headers.begin(), headers.end(),
        [&name](const auto& pair) {
            return std::equal(pair.first.begin(), pair.first.end(),
                              name.begin(), name.end(),
                              [](unsigned char a, unsigned char b) {
                                  return std::tolower(a) == std::tolower(b);
                              });
        });
    return it != headers.end() ? std::make_optional(it->second) : std::nullopt;
}

std::string to_string(NetworkError error) {
    switch (error) {
        case NetworkError::ConnectionFailed: return "Connection failed";
        case NetworkError::Timeout: return "Timeout";
        case NetworkError::DNSResolutionFailed: return "DNS resolution failed";
        case NetworkError::SSLError: return "SSL error";
        case NetworkError::InvalidUrl: return "Invalid URL";
        case NetworkError::TooManyRedirects: return "Too many redirects";
        case NetworkError::BadResponse: return "Bad response";
        case NetworkError::FileError: return "File error";
        case NetworkError::Cancelled: return "Cancelled";
    }
    return "Unknown error";
}

// HttpClientConfig validation
bool HttpClientConfig::is_valid() const {
    return default_timeout.count() > 0 && connect_timeout.count() > 0 && max_redirects >= 0;
}

// RequestBuilder implementation
RequestBuilder::RequestBuilder(const std::string& url) {
    m_request.url = url;
}

RequestBuilder& RequestBuilder::method(HttpMethod method) {
    m_request.method = method;
    return *this;
}

RequestBuilder& RequestBuilder::header(const std::string& name, const std::string& value) {
    m_request.headers[name] = value;
    return *this;
}

RequestBuilder& RequestBuilder::json_body(const std::string& json) {
    m_request.method = HttpMethod::POST;
    m_request.body = json;
    m_request.headers["Content-Type"] = "application/json";
    return *this;
}

RequestBuilder& RequestBuilder::timeout(std::chrono::seconds timeout) {
    m_request.timeout = timeout;
    return *this;
}

RequestBuilder& RequestBuilder::bearer_token(const std::string& token) {
    m_request.bearer_token = token;
    return *this;
}

HttpRequest RequestBuilder::build() const {
    return m_request;
}

} // namespace services
} // namespace mirror_for_plex
