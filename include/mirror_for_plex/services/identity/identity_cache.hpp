#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace mirror_for_plex {
namespace services {

/**
 * Durable map from local folder path to its catalog identity.
 *
 * The whole document is kept in memory and rewritten through a temporary
 * file and a rename on every store, so a crash never leaves a truncated
 * cache behind. Entries never expire; only invalidate() and clear()
 * remove them.
 */
class IdentityCache {
public:
    explicit IdentityCache(std::filesystem::path storage_path);

    // Reads the cache file; a missing file is an empty cache
    std::expected<void, core::SyncError> load();

    std::optional<core::FolderIdentity> lookup(const std::filesystem::path& folder) const;

    // Records the identity in memory, then persists. The in-memory entry is
    // kept even when persisting fails.
    std::expected<void, core::SyncError> store(core::FolderIdentity identity);

    // Forget one folder so the next resolution queries the catalogs again
    bool invalidate(const std::filesystem::path& folder);
    void clear();

    std::size_t size() const;
    const std::filesystem::path& storage_path() const { return m_storage_path; }

    // Absolute, lexically normalized, no trailing separator
    static std::string normalize_key(const std::filesystem::path& folder);

    static constexpr int FORMAT_VERSION = 1;

private:
    std::expected<void, core::SyncError> persist_locked() const;

    std::filesystem::path m_storage_path;
    mutable std::shared_mutex m_mutex;
    std::map<std::string, core::FolderIdentity> m_entries;
};

} // namespace services
} // namespace mirror_for_plex
