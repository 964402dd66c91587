#pragma once

#include "mirror_for_plex/core/models.hpp"
#include "mirror_for_plex/core/path_mapper.hpp"
#include "mirror_for_plex/core/snapshot_slot.hpp"
#include "mirror_for_plex/services/player/player_controller.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace mirror_for_plex {
namespace services {
class RemoteSessionSource;
class MetadataResolver;
class ImageStore;
}

namespace core {

struct LoopSettings {
    std::string username;
    std::vector<std::string> libraries;
    std::chrono::seconds poll_interval{3};
};

// Outcome of one cycle, for logging and tests
struct CycleReport {
    SyncState state = SyncState::Idle;
    std::optional<SyncError> error;
    std::optional<services::PlayerAction> action;
    std::string local_file;
};

/**
 * One fixed-interval poll, resolve and drive cycle.
 *
 * Each cycle asks the media server for the user's session, maps its file
 * to a local path, resolves the folder identity, publishes a snapshot and
 * makes the player show the same file. Failures are logged and retried on
 * the next cycle; none of them ends the loop.
 */
class ReconciliationLoop {
public:
    using FileProbe = std::function<bool(const std::filesystem::path&)>;

    ReconciliationLoop(LoopSettings settings,
                       std::shared_ptr<services::RemoteSessionSource> session_source,
                       PathMapper path_mapper,
                       std::shared_ptr<services::MetadataResolver> resolver,
                       std::shared_ptr<services::ImageStore> image_store,
                       std::shared_ptr<services::PlayerController> player,
                       std::shared_ptr<SnapshotSlot> snapshot_slot,
                       FileProbe file_exists = {});

    CycleReport run_cycle();

    // Runs cycles until stop is requested, then stops the player
    void run(std::stop_token stop_token);

private:
    CycleReport reconcile();
    CycleReport publish_error(SyncError error, const std::string& message);

    LoopSettings m_settings;
    std::shared_ptr<services::RemoteSessionSource> m_session_source;
    PathMapper m_path_mapper;
    std::shared_ptr<services::MetadataResolver> m_resolver;
    std::shared_ptr<services::ImageStore> m_image_store;
    std::shared_ptr<services::PlayerController> m_player;
    std::shared_ptr<SnapshotSlot> m_snapshot_slot;
    FileProbe m_file_exists;

    // Shown again while the server cannot be reached
    std::optional<PlaybackSnapshot> m_last_good;
    std::set<std::string> m_failed_images;
};

} // namespace core
} // namespace mirror_for_plex
