#include "mirror_for_plex/services/network/http_client.hpp"
#include "mirror_for_plex/utils/logger.hpp"
#include <curl/curl.h>
#include <fstream>
#include <chrono>
#include <mutex>
#include <system_error>

namespace mirror_for_plex {
namespace services {

// Callback for writing HTTP response data
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Callback for writing to file
static size_t WriteFileCallback(void* contents, size_t size, size_t nmemb, std::ofstream* file) {
    size_t total_size = size * nmemb;
    file->write(static_cast<char*>(contents), static_cast<std::streamsize>(total_size));
    return file->good() ? total_size : 0;
}

// Collects "Name: value" response header lines
static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, HttpHeaders* headers) {
    size_t total_size = size * nitems;
    std::string line(buffer, total_size);

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t\r\n");
        value = first == std::string::npos ? std::string{} : value.substr(first, last - first + 1);
        (*headers)[name] = value;
    }
    return total_size;
}

// Progress callback that aborts the transfer once stop is requested
static int ProgressCallbackForStop(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                   curl_off_t ultotal, curl_off_t ulnow) {
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;
    auto* stop_token = static_cast<std::stop_token*>(clientp);
    return (stop_token && stop_token->stop_requested()) ? 1 : 0;
}

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const HttpClientConfig& config = {}) : m_config(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~CurlHttpClient() override {
        curl_global_cleanup();
    }

    std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) override {
        MIRROR_LOG_DEBUG("CurlHttpClient", "Starting HTTP request to: " + request.url);

        if (!request.is_valid()) {
            MIRROR_LOG_ERROR("CurlHttpClient", "Invalid URL provided: " + request.url);
            return std::unexpected<NetworkError>(NetworkError::InvalidUrl);
        }

        std::stop_token stop_token = current_cancel_token();
        if (stop_token.stop_requested()) {
            return std::unexpected<NetworkError>(NetworkError::Cancelled);
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            MIRROR_LOG_ERROR("CurlHttpClient", "Failed to initialize curl handle");
            return std::unexpected<NetworkError>(NetworkError::ConnectionFailed);
        }

        HttpResponse response;
        std::string response_body;
        auto start_time = std::chrono::steady_clock::now();

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        setup_method_and_body(curl, request);

        struct curl_slist* header_list = setup_headers(request);
        if (header_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        }

        setup_common(curl, request.timeout, &stop_token);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(request.max_redirects));
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);

        CURLcode res = curl_easy_perform(curl);

        long response_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

        char* final_url = nullptr;
        curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &final_url);
        response.final_url = final_url ? std::string(final_url) : request.url;

        if (header_list) {
            curl_slist_free_all(header_list);
        }
        curl_easy_cleanup(curl);

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (res != CURLE_OK) {
            MIRROR_LOG_WARNING("CurlHttpClient", "HTTP request to " + request.url + " failed: " +
                               std::string(curl_easy_strerror(res)));
            return std::unexpected<NetworkError>(curl_error_to_network_error(res));
        }

        MIRROR_LOG_DEBUG("CurlHttpClient", "HTTP request completed in " + std::to_string(duration.count()) +
                         "ms with status " + std::to_string(response_code));

        response.status_code = static_cast<HttpStatus>(response_code);
        response.body = std::move(response_body);
        response.response_time = duration;
        return response;
    }

    std::expected<HttpResponse, NetworkError> get(
        const std::string& url,
        const HttpHeaders& headers,
        std::chrono::seconds timeout) override {
        HttpRequest request;
        request.method = HttpMethod::GET;
        request.url = url;
        request.headers = headers;
        request.timeout = effective_timeout(timeout);
        return execute(request);
    }

    std::expected<HttpResponse, NetworkError> post_json(
        const std::string& url,
        const std::string& json_body,
        const HttpHeaders& headers,
        std::chrono::seconds timeout) override {
        HttpRequest request;
        request.method = HttpMethod::POST;
        request.url = url;
        request.body = json_body;
        request.headers = headers;
        request.headers["Content-Type"] = "application/json";
        request.timeout = effective_timeout(timeout);
        return execute(request);
    }

    std::expected<void, NetworkError> download_file(
        const std::string& url,
        const std::filesystem::path& file_path,
        std::chrono::seconds timeout) override {
        MIRROR_LOG_DEBUG("CurlHttpClient", "Starting file download from: " + url + " to: " + file_path.string());

        std::stop_token stop_token = current_cancel_token();
        if (stop_token.stop_requested()) {
            return std::unexpected<NetworkError>(NetworkError::Cancelled);
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            MIRROR_LOG_ERROR("CurlHttpClient", "Failed to initialize curl handle for file download");
            return std::unexpected<NetworkError>(NetworkError::ConnectionFailed);
        }

        auto partial_path = file_path;
        partial_path += ".part";

        std::ofstream file(partial_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            MIRROR_LOG_ERROR("CurlHttpClient", "Failed to open file for writing: " + partial_path.string());
            curl_easy_cleanup(curl);
            return std::unexpected<NetworkError>(NetworkError::FileError);
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteFileCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &file);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        if (!m_config.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, m_config.user_agent.c_str());
        }
        setup_common(curl, effective_timeout(timeout), &stop_token);

        CURLcode res = curl_easy_perform(curl);
        curl_easy_cleanup(curl);
        file.close();

        std::error_code ec;
        if (res != CURLE_OK) {
            MIRROR_LOG_WARNING("CurlHttpClient", "File download failed: " + std::string(curl_easy_strerror(res)));
            std::filesystem::remove(partial_path, ec);
            return std::unexpected<NetworkError>(curl_error_to_network_error(res));
        }

        std::filesystem::rename(partial_path, file_path, ec);
        if (ec) {
            MIRROR_LOG_ERROR("CurlHttpClient", "Failed to move download into place: " + ec.message());
            std::filesystem::remove(partial_path, ec);
            return std::unexpected<NetworkError>(NetworkError::FileError);
        }

        MIRROR_LOG_DEBUG("CurlHttpClient", "File download completed successfully");
        return {};
    }

    void set_default_timeout(std::chrono::seconds timeout) override {
        std::lock_guard lock(m_mutex);
        m_config.default_timeout = timeout;
    }

    void set_cancel_token(std::stop_token token) override {
        std::lock_guard lock(m_mutex);
        m_cancel_token = std::move(token);
    }

private:
    HttpClientConfig m_config;
    std::stop_token m_cancel_token;
    mutable std::mutex m_mutex;

    std::stop_token current_cancel_token() const {
        std::lock_guard lock(m_mutex);
        return m_cancel_token;
    }

    std::chrono::seconds effective_timeout(std::chrono::seconds requested) const {
        if (requested.count() > 0) {
            return requested;
        }
        std::lock_guard lock(m_mutex);
        return m_config.default_timeout;
    }

    void setup_common(CURL* curl, std::chrono::seconds timeout, std::stop_token* stop_token) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(m_config.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallbackForStop);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, stop_token);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    void setup_method_and_body(CURL* curl, const HttpRequest& request) {
        switch (request.method) {
            case HttpMethod::GET:
                break;
            case HttpMethod::POST:
                MIRROR_LOG_DEBUG("CurlHttpClient", "Setting up POST request with body size: " +
                                 std::to_string(request.body.length()));
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.length()));
                break;
        }
    }

    struct curl_slist* setup_headers(const HttpRequest& request) {
        struct curl_slist* header_list = nullptr;

        // Request headers override defaults with the same name
        for (const auto& [key, value] : m_config.default_headers) {
            if (request.headers.contains(key)) {
                continue;
            }
            std::string header = key + ": " + value;
            header_list = curl_slist_append(header_list, header.c_str());
        }

        for (const auto& [key, value] : request.headers) {
            std::string header = key + ": " + value;
            header_list = curl_slist_append(header_list, header.c_str());
        }

        if (request.bearer_token) {
            std::string auth_header = "Authorization: Bearer " + *request.bearer_token;
            header_list = curl_slist_append(header_list, auth_header.c_str());
        }

        if (!m_config.user_agent.empty()) {
            std::string ua_header = "User-Agent: " + m_config.user_agent;
            header_list = curl_slist_append(header_list, ua_header.c_str());
        }

        return header_list;
    }

    static NetworkError curl_error_to_network_error(CURLcode code) {
        switch (code) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
                return NetworkError::DNSResolutionFailed;
            case CURLE_COULDNT_CONNECT:
                return NetworkError::ConnectionFailed;
            case CURLE_OPERATION_TIMEDOUT:
                return NetworkError::Timeout;
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_SSL_CERTPROBLEM:
            case CURLE_SSL_CIPHER:
                return NetworkError::SSLError;
            case CURLE_TOO_MANY_REDIRECTS:
                return NetworkError::TooManyRedirects;
            case CURLE_URL_MALFORMAT:
                return NetworkError::InvalidUrl;
            case CURLE_WRITE_ERROR:
                return NetworkError::FileError;
            case CURLE_ABORTED_BY_CALLBACK:
                return NetworkError::Cancelled;
            default:
                return NetworkError::BadResponse;
        }
    }
};

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config) {
    return std::make_unique<CurlHttpClient>(config);
}

} // namespace services
} // namespace mirror_for_plex
