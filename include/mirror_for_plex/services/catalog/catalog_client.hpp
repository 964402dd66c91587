#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mirror_for_plex {
namespace services {

class HttpClient;

// One search hit from an external metadata catalog
struct CatalogEntry {
    std::string id;
    std::vector<std::string> titles;    // every title variant, primary first
    std::string romaji_title;
    std::string english_title;
    std::string synopsis;               // plain text
    std::string image_url;
};

// Interface for external metadata catalogs (AniList, TVDB)
class CatalogClient {
public:
    virtual ~CatalogClient() = default;

    // Short lowercase name, used in image file names and the identity record
    virtual std::string name() const = 0;

    virtual std::expected<std::vector<CatalogEntry>, core::SyncError>
    search_titles(const std::string& term) = 0;
};

class AniListCatalog : public CatalogClient {
public:
    AniListCatalog(std::shared_ptr<HttpClient> http_client, std::chrono::seconds timeout);

    std::string name() const override { return "anilist"; }

    std::expected<std::vector<CatalogEntry>, core::SyncError>
    search_titles(const std::string& term) override;

    static std::vector<CatalogEntry> parse_search_response(const std::string& body);

private:
    std::shared_ptr<HttpClient> m_http_client;
    std::chrono::seconds m_timeout;

    static constexpr const char* ANILIST_GRAPHQL_URL = "https://graphql.anilist.co";
    static constexpr int MAX_RESULTS = 10;
};

class TvdbCatalog : public CatalogClient {
public:
    TvdbCatalog(std::shared_ptr<HttpClient> http_client, std::string api_key, std::chrono::seconds timeout);

    std::string name() const override { return "tvdb"; }

    std::expected<std::vector<CatalogEntry>, core::SyncError>
    search_titles(const std::string& term) override;

    static std::vector<CatalogEntry> parse_search_response(const std::string& body);

private:
    std::expected<std::string, core::SyncError> ensure_token();

    std::shared_ptr<HttpClient> m_http_client;
    std::string m_api_key;
    std::chrono::seconds m_timeout;

    std::mutex m_token_mutex;
    std::string m_token;

    static constexpr const char* TVDB_API_URL = "https://api4.thetvdb.com/v4";
};

} // namespace services
} // namespace mirror_for_plex
