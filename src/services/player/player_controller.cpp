#include "mirror_for_plex/services/player/player_controller.hpp"
#include "mirror_for_plex/utils/logger.hpp"
#include "mirror_for_plex/utils/threading.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace mirror_for_plex {
namespace services {

PlayerController::PlayerController(core::PlayerConfig config,
                                   std::unique_ptr<PlayerProcess> process,
                                   std::unique_ptr<ControlChannel> channel,
                                   Sleeper sleeper)
    : m_config(std::move(config)),
      m_endpoint(m_config.ipc_endpoint.empty() ? default_ipc_endpoint() : m_config.ipc_endpoint),
      m_process(std::move(process)),
      m_channel(std::move(channel)),
      m_sleeper(std::move(sleeper)) {
    if (!m_sleeper) {
        m_sleeper = [this](std::chrono::milliseconds delay) {
            return utils::sleep_for(delay, m_stop_token);
        };
    }
}

PlayerController::~PlayerController() {
    stop();
}

void PlayerController::set_stop_token(std::stop_token token) {
    m_stop_token = std::move(token);
}

std::string PlayerController::default_ipc_endpoint() {
    if (const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR"); runtime_dir && *runtime_dir) {
        return (std::filesystem::path(runtime_dir) / "mirror-for-plex-mpv.sock").string();
    }
    // /tmp is shared between users
    return (std::filesystem::temp_directory_path() /
            ("mirror-for-plex-mpv-" + std::to_string(getuid()) + ".sock")).string();
}

std::vector<std::string> PlayerController::build_arguments(const std::string& file) const {
    std::vector<std::string> args = {
        "--input-ipc-server=" + m_endpoint,
        "--mute=yes",
        "--force-window=yes",
        "--keep-open=yes",
        "--geometry=" + m_config.geometry
    };
    args.insert(args.end(), m_config.extra_args.begin(), m_config.extra_args.end());
    args.push_back("--");
    args.push_back(file);
    return args;
}

std::expected<PlayerAction, core::SyncError> PlayerController::ensure_playing(const std::string& file) {
    if (m_state == PlayerState::Attached && m_session) {
        if (m_session->playing_path == file) {
            return PlayerAction::None;
        }

        MIRROR_LOG_INFO("PlayerController", "Loading " + file);
        if (auto loaded = m_channel->load_file(file); !loaded) {
            MIRROR_LOG_WARNING("PlayerController", "Load failed, tearing the player down");
            teardown();
            return std::unexpected(core::SyncError::ControlChannelUnavailable);
        }
        m_session->playing_path = file;
        return PlayerAction::Loaded;
    }

    if (m_state != PlayerState::Absent) {
        // Leftover from an interrupted launch or stop
        teardown();
    }
    return launch(file);
}

std::expected<PlayerAction, core::SyncError> PlayerController::launch(const std::string& file) {
    m_state = PlayerState::Launching;
    MIRROR_LOG_INFO("PlayerController", "Launching " + m_config.executable + " for " + file);

    // A stale socket from an earlier player would accept our connection
    std::error_code ec;
    std::filesystem::remove(m_endpoint, ec);

    if (auto spawned = m_process->spawn(m_config.executable, build_arguments(file)); !spawned) {
        m_state = PlayerState::Absent;
        return std::unexpected(core::SyncError::PlayerLaunchFailure);
    }

    if (auto attached = attach(); !attached) {
        teardown();
        return std::unexpected(attached.error());
    }

    m_session = PlayerSession{m_process->pid(), file, std::chrono::system_clock::now()};
    m_state = PlayerState::Attached;
    MIRROR_LOG_INFO("PlayerController", "Player attached (pid " + std::to_string(m_session->pid) + ")");
    return PlayerAction::Launched;
}

std::expected<void, core::SyncError> PlayerController::attach() {
    auto delay = m_config.retry_delay;

    for (int attempt = 1; attempt <= m_config.launch_attempts; ++attempt) {
        if (!m_process->is_running()) {
            MIRROR_LOG_WARNING("PlayerController", "Player exited during startup");
            return std::unexpected(core::SyncError::PlayerLaunchFailure);
        }

        if (m_channel->connect(m_endpoint)) {
            return {};
        }

        MIRROR_LOG_DEBUG("PlayerController", "Control channel not ready (attempt " + std::to_string(attempt) +
                         "/" + std::to_string(m_config.launch_attempts) + ")");

        if (attempt == m_config.launch_attempts) {
            break;
        }
        if (!m_sleeper(delay)) {
            MIRROR_LOG_INFO("PlayerController", "Launch cancelled");
            break;
        }
        delay = std::min(delay * 2, m_config.max_retry_delay);
    }

    MIRROR_LOG_ERROR("PlayerController", "Control channel " + m_endpoint + " unavailable after " +
                     std::to_string(m_config.launch_attempts) + " attempts");
    return std::unexpected(core::SyncError::ControlChannelUnavailable);
}

bool PlayerController::check_health() {
    if (m_state != PlayerState::Attached) {
        return false;
    }

    if (!m_process->is_running()) {
        MIRROR_LOG_INFO("PlayerController", "Player is gone, clearing session");
        teardown();
        return false;
    }

    if (auto path = m_channel->current_path(); !path) {
        MIRROR_LOG_WARNING("PlayerController", "Player stopped answering, tearing it down");
        teardown();
        return false;
    }

    return true;
}

void PlayerController::stop() {
    if (m_state == PlayerState::Absent && !m_process->is_running()) {
        m_channel->disconnect();
        m_session.reset();
        return;
    }
    MIRROR_LOG_INFO("PlayerController", "Stopping player");
    teardown();
}

void PlayerController::teardown() {
    m_state = PlayerState::Terminating;

    if (m_channel->is_connected()) {
        if (auto sent = m_channel->quit(); !sent) {
            MIRROR_LOG_DEBUG("PlayerController", "Quit command not delivered");
        }
    }

    if (m_process->is_running() && !m_process->wait_for_exit(m_config.quit_grace)) {
        MIRROR_LOG_WARNING("PlayerController", "Player ignored quit, sending SIGTERM");
        m_process->terminate();
        if (!m_process->wait_for_exit(m_config.quit_grace)) {
            MIRROR_LOG_WARNING("PlayerController", "Player ignored SIGTERM, sending SIGKILL");
            m_process->kill();
            if (!m_process->wait_for_exit(std::chrono::milliseconds(500))) {
                MIRROR_LOG_ERROR("PlayerController", "Player pid " + std::to_string(m_process->pid()) +
                                 " survived SIGKILL");
            }
        }
    }

    m_channel->disconnect();
    m_session.reset();
    m_state = PlayerState::Absent;
}

std::string to_string(PlayerState state) {
    switch (state) {
        case PlayerState::Absent: return "Absent";
        case PlayerState::Launching: return "Launching";
        case PlayerState::Attached: return "Attached";
        case PlayerState::Terminating: return "Terminating";
    }
    return "Unknown";
}

} // namespace services
} // namespace mirror_for_plex
