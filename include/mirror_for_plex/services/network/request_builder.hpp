#pragma once

#include "mirror_for_plex/services/network/http_types.hpp"
#include <string>
#include <chrono>

namespace mirror_for_plex {
namespace services {

// Request builder for fluent API
class RequestBuilder {
public:
    RequestBuilder() = default;
    explicit RequestBuilder(const std::string& url);

    RequestBuilder& method(HttpMethod method);
    RequestBuilder& header(const std::string& name, const std::string& value);
    RequestBuilder& json_body(const std::string& json);
    RequestBuilder& timeout(std::chrono::seconds timeout);
    RequestBuilder& bearer_token(const std::string& token);

    HttpRequest build() const;

private:
    HttpRequest m_request;
};

} // namespace services
} // namespace mirror_for_plex
