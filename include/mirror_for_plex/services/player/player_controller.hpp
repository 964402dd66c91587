#pragma once

#include "mirror_for_plex/core/models.hpp"
#include "mirror_for_plex/services/player/control_channel.hpp"
#include "mirror_for_plex/services/player/player_process.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace mirror_for_plex {
namespace services {

enum class PlayerState {
    Absent,
    Launching,
    Attached,
    Terminating
};

enum class PlayerAction {
    None,
    Launched,
    Loaded
};

// The player process currently owned by the controller
struct PlayerSession {
    pid_t pid = -1;
    std::string playing_path;
    std::chrono::system_clock::time_point launched_at;
};

/**
 * Owns at most one local player and its control channel.
 *
 * ensure_playing() is idempotent: asking for the file that is already
 * playing sends nothing to the player. The destructor stops the player,
 * so no process outlives the controller.
 */
class PlayerController {
public:
    // Waits between connection attempts; returns false to abandon the launch
    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    PlayerController(core::PlayerConfig config,
                     std::unique_ptr<PlayerProcess> process,
                     std::unique_ptr<ControlChannel> channel,
                     Sleeper sleeper = {});
    ~PlayerController();

    PlayerController(const PlayerController&) = delete;
    PlayerController& operator=(const PlayerController&) = delete;

    std::expected<PlayerAction, core::SyncError> ensure_playing(const std::string& file);

    // Tears the session down when the player exited or stopped answering.
    // Returns true while a healthy player is attached.
    bool check_health();

    // Quit, then SIGTERM, then SIGKILL. Safe in any state.
    void stop();

    // Cancels pending connection retries
    void set_stop_token(std::stop_token token);

    PlayerState state() const { return m_state; }
    std::optional<PlayerSession> session() const { return m_session; }

    const std::string& endpoint() const { return m_endpoint; }
    std::vector<std::string> build_arguments(const std::string& file) const;

    static std::string default_ipc_endpoint();

private:
    std::expected<PlayerAction, core::SyncError> launch(const std::string& file);
    std::expected<void, core::SyncError> attach();
    void teardown();

    core::PlayerConfig m_config;
    std::string m_endpoint;
    std::unique_ptr<PlayerProcess> m_process;
    std::unique_ptr<ControlChannel> m_channel;
    Sleeper m_sleeper;
    std::stop_token m_stop_token;

    PlayerState m_state = PlayerState::Absent;
    std::optional<PlayerSession> m_session;
};

std::string to_string(PlayerState state);

} // namespace services
} // namespace mirror_for_plex
