#include "mirror_for_plex/core/reconciliation_loop.hpp"
#include "mirror_for_plex/services/artwork/cover_art_cache.hpp"
#include "mirror_for_plex/services/identity/metadata_resolver.hpp"
#include "mirror_for_plex/services/plex/session_source.hpp"
#include "mirror_for_plex/utils/logger.hpp"
#include "mirror_for_plex/utils/threading.hpp"

#include <system_error>

namespace mirror_for_plex {
namespace core {

ReconciliationLoop::ReconciliationLoop(LoopSettings settings,
                                       std::shared_ptr<services::RemoteSessionSource> session_source,
                                       PathMapper path_mapper,
                                       std::shared_ptr<services::MetadataResolver> resolver,
                                       std::shared_ptr<services::ImageStore> image_store,
                                       std::shared_ptr<services::PlayerController> player,
                                       std::shared_ptr<SnapshotSlot> snapshot_slot,
                                       FileProbe file_exists)
    : m_settings(std::move(settings)),
      m_session_source(std::move(session_source)),
      m_path_mapper(std::move(path_mapper)),
      m_resolver(std::move(resolver)),
      m_image_store(std::move(image_store)),
      m_player(std::move(player)),
      m_snapshot_slot(std::move(snapshot_slot)),
      m_file_exists(std::move(file_exists)) {
    if (!m_file_exists) {
        m_file_exists = [](const std::filesystem::path& path) {
            std::error_code ec;
            return std::filesystem::is_regular_file(path, ec);
        };
    }
}

void ReconciliationLoop::run(std::stop_token stop_token) {
    MIRROR_LOG_INFO("ReconciliationLoop", "Sync started for user '" + m_settings.username + "', polling every " +
                    std::to_string(m_settings.poll_interval.count()) + "s");
    m_player->set_stop_token(stop_token);

    while (!stop_token.stop_requested()) {
        auto report = run_cycle();
        if (stop_token.stop_requested()) {
            break;
        }
        MIRROR_LOG_DEBUG("ReconciliationLoop", "Cycle finished: " + to_string(report.state));

        if (!utils::sleep_for(m_settings.poll_interval, stop_token)) {
            break;
        }
    }

    m_player->stop();
    m_snapshot_slot->publish(PlaybackSnapshot{SyncState::Idle, std::nullopt, {}, {}, false, "Sync stopped"});
    MIRROR_LOG_INFO("ReconciliationLoop", "Sync stopped");
}

CycleReport ReconciliationLoop::run_cycle() {
    try {
        return reconcile();
    } catch (const std::exception& e) {
        MIRROR_LOG_ERROR("ReconciliationLoop", "Unexpected error in sync cycle: " + std::string(e.what()));
        return publish_error(SyncError::TransientNetworkError, e.what());
    }
}

CycleReport ReconciliationLoop::reconcile() {
    CycleReport report;

    // Notices a player the user closed
    m_player->check_health();

    auto session_result = m_session_source->get_active_session(m_settings.username, m_settings.libraries);
    if (!session_result) {
        return publish_error(session_result.error(), "Media server unreachable");
    }

    const auto& session = session_result.value();
    if (!session) {
        if (m_player->state() != services::PlayerState::Absent) {
            MIRROR_LOG_INFO("ReconciliationLoop", "No active session, stopping player");
            m_player->stop();
        }
        m_last_good.reset();
        m_failed_images.clear();
        m_snapshot_slot->publish(PlaybackSnapshot{SyncState::Idle, std::nullopt, {}, {}, false, {}});
        report.state = SyncState::Idle;
        return report;
    }

    PlaybackSnapshot snapshot;
    snapshot.library_name = session->library_name;
    snapshot.is_playing = session->is_playing;
    snapshot.display_title = session->item_title;

    auto local_file = m_path_mapper.map(session->file_path);
    if (!local_file || !m_file_exists(*local_file)) {
        MIRROR_LOG_WARNING("ReconciliationLoop", "No local file for '" + session->file_path + "'");
        // The previous episode must not stay on screen
        if (m_player->state() != services::PlayerState::Absent) {
            MIRROR_LOG_INFO("ReconciliationLoop", "Stopping player, current item is not available locally");
            m_player->stop();
        }
        snapshot.state = SyncState::Unmatched;
        snapshot.message = local_file ? "Local file not found" : "No path mapping for the server path";
        m_last_good = snapshot;
        m_snapshot_slot->publish(snapshot);
        report.state = SyncState::Unmatched;
        return report;
    }
    report.local_file = *local_file;

    auto folder = PathMapper::identity_folder(*local_file);
    auto identity = m_resolver->resolve(folder, session->item_title);

    if (identity.is_resolved() && !identity.image_file_name.empty() &&
        !m_failed_images.contains(identity.image_file_name)) {
        if (auto image = m_image_store->ensure_image(identity); !image) {
            // Not retried until the session ends
            MIRROR_LOG_WARNING("ReconciliationLoop", "Cover art unavailable for " + identity.image_file_name +
                               ": " + to_string(image.error()));
            m_failed_images.insert(identity.image_file_name);
        }
    }

    snapshot.state = SyncState::Playing;
    snapshot.display_title = identity.display_title(session->item_title);
    if (!identity.is_resolved()) {
        snapshot.message = "No catalog match";
    }
    snapshot.identity = std::move(identity);

    auto action = m_player->ensure_playing(*local_file);
    if (action) {
        report.action = action.value();
        if (action.value() != services::PlayerAction::None) {
            MIRROR_LOG_INFO("ReconciliationLoop", "Player now showing " + *local_file);
        }
    } else {
        report.error = action.error();
        snapshot.message = "Player: " + to_string(action.error());
        MIRROR_LOG_WARNING("ReconciliationLoop", "Could not drive player: " + to_string(action.error()) +
                           ", retrying next cycle");
    }

    m_last_good = snapshot;
    m_snapshot_slot->publish(snapshot);
    report.state = SyncState::Playing;
    return report;
}

CycleReport ReconciliationLoop::publish_error(SyncError error, const std::string& message) {
    MIRROR_LOG_WARNING("ReconciliationLoop", message + " (" + to_string(error) + "), keeping last state");

    PlaybackSnapshot snapshot = m_last_good.value_or(PlaybackSnapshot{});
    snapshot.state = SyncState::Error;
    snapshot.message = message;
    m_snapshot_slot->publish(snapshot);

    CycleReport report;
    report.state = SyncState::Error;
    report.error = error;
    return report;
}

} // namespace core
} // namespace mirror_for_plex
