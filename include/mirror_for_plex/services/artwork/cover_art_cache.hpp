#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

namespace mirror_for_plex {
namespace services {

class HttpClient;

// Local store of cover images referenced by FolderIdentity::image_file_name
class ImageStore {
public:
    virtual ~ImageStore() = default;

    // Makes sure the identity's image is on disk and returns its path
    virtual std::expected<std::filesystem::path, core::SyncError>
    ensure_image(const core::FolderIdentity& identity) = 0;

    virtual std::filesystem::path path_for(const std::string& image_file_name) const = 0;
};

// Downloads each cover once into the thumbs directory
class CoverArtCache : public ImageStore {
public:
    CoverArtCache(std::shared_ptr<HttpClient> http_client,
                  std::filesystem::path thumbs_dir,
                  std::chrono::seconds timeout);

    std::expected<std::filesystem::path, core::SyncError>
    ensure_image(const core::FolderIdentity& identity) override;

    std::filesystem::path path_for(const std::string& image_file_name) const override;

    // "<catalog>_<id>.jpg"
    static std::string image_file_name(const std::string& catalog, const std::string& source_id);

private:
    std::shared_ptr<HttpClient> m_http_client;
    std::filesystem::path m_thumbs_dir;
    std::chrono::seconds m_timeout;
};

} // namespace services
} // namespace mirror_for_plex
