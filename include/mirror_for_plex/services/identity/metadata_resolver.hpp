#pragma once

#include "mirror_for_plex/core/models.hpp"
#include "mirror_for_plex/core/title_matcher.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace mirror_for_plex {
namespace services {

class CatalogClient;
class IdentityCache;

// Resolves a local media folder to its catalog identity, cache first
class MetadataResolver {
public:
    MetadataResolver(std::shared_ptr<IdentityCache> cache,
                     std::shared_ptr<CatalogClient> primary,
                     std::shared_ptr<CatalogClient> secondary,
                     core::TitleMatcher matcher = core::TitleMatcher{});

    // Never fails: catalogs that cannot be reached count as having no
    // candidates, and a folder nobody matches is cached as unresolved.
    core::FolderIdentity resolve(const std::filesystem::path& folder, const std::string& remote_title = {});

private:
    std::shared_ptr<IdentityCache> m_cache;
    std::shared_ptr<CatalogClient> m_primary;
    std::shared_ptr<CatalogClient> m_secondary;
    core::TitleMatcher m_matcher;
};

} // namespace services
} // namespace mirror_for_plex
