#include "mirror_for_plex/services/identity/identity_cache.hpp"
#include "mirror_for_plex/utils/json_helper.hpp"
#include "mirror_for_plex/utils/logger.hpp"

#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace mirror_for_plex {
namespace services {

using utils::JsonHelper;

namespace {

nlohmann::json to_json(const core::FolderIdentity& identity) {
    return {
        {"source_id", identity.source_id},
        {"catalog", identity.catalog},
        {"romaji_title", identity.romaji_title},
        {"english_title", identity.english_title},
        {"synopsis", identity.synopsis},
        {"image_file_name", identity.image_file_name},
        {"image_url", identity.image_url},
        {"resolved_at", std::chrono::duration_cast<std::chrono::seconds>(
            identity.resolved_at.time_since_epoch()).count()}
    };
}

core::FolderIdentity from_json(const std::string& folder_path, const nlohmann::json& json) {
    core::FolderIdentity identity;
    identity.folder_path = folder_path;
    identity.source_id = JsonHelper::get_id(json, "source_id");
    identity.catalog = JsonHelper::get_string(json, "catalog");
    identity.romaji_title = JsonHelper::get_string(json, "romaji_title");
    identity.english_title = JsonHelper::get_string(json, "english_title");
    identity.synopsis = JsonHelper::get_string(json, "synopsis");
    identity.image_file_name = JsonHelper::get_string(json, "image_file_name");
    identity.image_url = JsonHelper::get_string(json, "image_url");
    identity.resolved_at = std::chrono::system_clock::time_point(
        std::chrono::seconds(JsonHelper::get_optional<long long>(json, "resolved_at", 0)));
    return identity;
}

} // namespace

IdentityCache::IdentityCache(std::filesystem::path storage_path)
    : m_storage_path(std::move(storage_path)) {
}

std::string IdentityCache::normalize_key(const std::filesystem::path& folder) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(folder, ec);
    auto normalized = (ec ? folder : absolute).lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

std::expected<void, core::SyncError> IdentityCache::load() {
    std::unique_lock lock(m_mutex);
    m_entries.clear();

    if (!std::filesystem::exists(m_storage_path)) {
        MIRROR_LOG_DEBUG("IdentityCache", "No cache file at " + m_storage_path.string() + ", starting empty");
        return {};
    }

    std::ifstream file(m_storage_path);
    if (!file) {
        MIRROR_LOG_ERROR("IdentityCache", "Cannot read cache file: " + m_storage_path.string());
        return std::unexpected(core::SyncError::ConfigurationError);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto json_result = JsonHelper::safe_parse(buffer.str());
    if (!json_result) {
        MIRROR_LOG_WARNING("IdentityCache", "Ignoring unreadable cache file: " + json_result.error());
        return {};
    }

    const auto& document = json_result.value();
    int version = JsonHelper::get_optional<int>(document, "version", 0);
    if (version != FORMAT_VERSION) {
        MIRROR_LOG_WARNING("IdentityCache", "Unsupported cache version " + std::to_string(version) + ", starting empty");
        return {};
    }

    if (JsonHelper::has_field(document, "folders") && document["folders"].is_object()) {
        for (const auto& [path, entry] : document["folders"].items()) {
            if (!entry.is_object()) {
                continue;
            }
            m_entries[path] = from_json(path, entry);
        }
    }

    MIRROR_LOG_INFO("IdentityCache", "Loaded " + std::to_string(m_entries.size()) + " folder identities");
    return {};
}

std::optional<core::FolderIdentity> IdentityCache::lookup(const std::filesystem::path& folder) const {
    std::shared_lock lock(m_mutex);
    auto it = m_entries.find(normalize_key(folder));
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::expected<void, core::SyncError> IdentityCache::store(core::FolderIdentity identity) {
    std::unique_lock lock(m_mutex);
    identity.folder_path = normalize_key(identity.folder_path);
    std::string key = identity.folder_path;
    m_entries[key] = std::move(identity);
    return persist_locked();
}

bool IdentityCache::invalidate(const std::filesystem::path& folder) {
    std::unique_lock lock(m_mutex);
    if (m_entries.erase(normalize_key(folder)) == 0) {
        return false;
    }
    if (auto result = persist_locked(); !result) {
        MIRROR_LOG_WARNING("IdentityCache", "Invalidation of " + folder.string() + " not persisted");
    }
    return true;
}

void IdentityCache::clear() {
    std::unique_lock lock(m_mutex);
    m_entries.clear();
    if (auto result = persist_locked(); !result) {
        MIRROR_LOG_WARNING("IdentityCache", "Cleared cache not persisted");
    }
}

std::size_t IdentityCache::size() const {
    std::shared_lock lock(m_mutex);
    return m_entries.size();
}

std::expected<void, core::SyncError> IdentityCache::persist_locked() const {
    nlohmann::json folders = nlohmann::json::object();
    for (const auto& [path, identity] : m_entries) {
        folders[path] = to_json(identity);
    }
    nlohmann::json document = {{"version", FORMAT_VERSION}, {"folders", folders}};

    std::error_code ec;
    auto dir = m_storage_path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            MIRROR_LOG_ERROR("IdentityCache", "Cannot create " + dir.string() + ": " + ec.message());
            return std::unexpected(core::SyncError::CacheWriteFailed);
        }
    }

    auto temp_path = m_storage_path;
    temp_path += ".tmp." + std::to_string(::getpid());

    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            MIRROR_LOG_ERROR("IdentityCache", "Failed to open cache file for writing: " + temp_path.string());
            return std::unexpected(core::SyncError::CacheWriteFailed);
        }
        file << document.dump(2) << '\n';
        file.flush();
        if (!file) {
            MIRROR_LOG_ERROR("IdentityCache", "Failed to write cache file: " + temp_path.string());
            file.close();
            std::filesystem::remove(temp_path, ec);
            return std::unexpected(core::SyncError::CacheWriteFailed);
        }
    }

    std::filesystem::rename(temp_path, m_storage_path, ec);
    if (ec) {
        MIRROR_LOG_ERROR("IdentityCache", "Failed to replace cache file: " + ec.message());
        std::filesystem::remove(temp_path, ec);
        return std::unexpected(core::SyncError::CacheWriteFailed);
    }

    MIRROR_LOG_DEBUG("IdentityCache", "Saved " + std::to_string(m_entries.size()) + " folder identities");
    return {};
}

} // namespace services
} // namespace mirror_for_plex
