#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

namespace mirror_for_plex {
namespace core {

class SnapshotSlot;

// Configuration manager
class ConfigManager {
public:
    // An empty path means the default location (or MIRROR_FOR_PLEX_CONFIG)
    explicit ConfigManager(const std::filesystem::path& config_path = {});
    ~ConfigManager();

    // Core operations. A missing file is written with defaults and a
    // documentation header, then reported as FileNotFound.
    std::expected<void, ConfigError> load();
    std::expected<void, ConfigError> save();

    // Configuration access
    const ApplicationConfig& get() const;
    const std::filesystem::path& config_path() const;

    // Directory holding the config, the log, the identity cache and thumbs
    std::filesystem::path data_directory() const;

    static std::filesystem::path default_config_path();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// Main application interface
class Application {
public:
    virtual ~Application() = default;

    // Lifecycle management
    virtual std::expected<void, ApplicationError> initialize() = 0;
    virtual void shutdown() = 0;

    // Sync control; stopping also closes the local player
    virtual std::expected<void, ApplicationError> start_sync() = 0;
    virtual void stop_sync() = 0;
    // Asks the sync thread to finish without waiting; is_syncing() turns
    // false once it has stopped the player
    virtual void request_stop_sync() = 0;
    virtual bool is_syncing() const = 0;

    // State management
    virtual ApplicationState get_state() const = 0;

    virtual std::shared_ptr<SnapshotSlot> get_snapshot_slot() const = 0;
    virtual const ApplicationConfig& get_config() const = 0;

    // Resolves a cover image name to its file in the thumbs directory
    virtual std::filesystem::path image_path(const std::string& image_file_name) const = 0;
};

// Application creation. data_dir supplies default storage locations.
std::expected<std::unique_ptr<Application>, ApplicationError>
create_application(ApplicationConfig config, std::filesystem::path data_dir);

} // namespace core
} // namespace mirror_for_plex
