#include "mirror_for_plex/services/artwork/cover_art_cache.hpp"
#include "mirror_for_plex/services/network/http_client.hpp"
#include "mirror_for_plex/utils/logger.hpp"

#include <system_error>

namespace mirror_for_plex {
namespace services {

CoverArtCache::CoverArtCache(std::shared_ptr<HttpClient> http_client,
                             std::filesystem::path thumbs_dir,
                             std::chrono::seconds timeout)
    : m_http_client(std::move(http_client)),
      m_thumbs_dir(std::move(thumbs_dir)),
      m_timeout(timeout) {
}

std::string CoverArtCache::image_file_name(const std::string& catalog, const std::string& source_id) {
    if (catalog.empty() || source_id.empty()) {
        return {};
    }
    return catalog + "_" + source_id + ".jpg";
}

std::filesystem::path CoverArtCache::path_for(const std::string& image_file_name) const {
    return m_thumbs_dir / image_file_name;
}

std::expected<std::filesystem::path, core::SyncError>
CoverArtCache::ensure_image(const core::FolderIdentity& identity) {
    if (identity.image_file_name.empty() || identity.image_url.empty()) {
        return std::unexpected(core::SyncError::NoMatchFound);
    }

    auto destination = path_for(identity.image_file_name);
    std::error_code ec;
    if (std::filesystem::exists(destination, ec) && std::filesystem::file_size(destination, ec) > 0) {
        return destination;
    }

    std::filesystem::create_directories(m_thumbs_dir, ec);
    if (ec) {
        MIRROR_LOG_ERROR("CoverArtCache", "Cannot create thumbs directory " + m_thumbs_dir.string() + ": " + ec.message());
        return std::unexpected(core::SyncError::CacheWriteFailed);
    }

    auto result = m_http_client->download_file(identity.image_url, destination, m_timeout);
    if (!result) {
        MIRROR_LOG_WARNING("CoverArtCache", "Could not download cover for " + identity.image_file_name + ": " +
                           to_string(result.error()));
        return std::unexpected(result.error() == NetworkError::FileError
            ? core::SyncError::CacheWriteFailed
            : core::SyncError::TransientNetworkError);
    }

    MIRROR_LOG_INFO("CoverArtCache", "Cached cover " + destination.string());
    return destination;
}

} // namespace services
} // namespace mirror_for_plex
