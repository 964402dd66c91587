#include "mirror_for_plex/platform/console_ui_service.hpp"
#include "mirror_for_plex/core/application.hpp"
#include "mirror_for_plex/core/snapshot_slot.hpp"
#include "mirror_for_plex/utils/format_utils.hpp"
#include "mirror_for_plex/utils/logger.hpp"
#include <iostream>
#include <thread>

namespace mirror_for_plex::platform {

ConsoleUiService::ConsoleUiService(std::chrono::milliseconds refresh_interval)
    : m_refresh_interval(refresh_interval) {}

std::expected<void, UiError> ConsoleUiService::initialize() {
    m_initialized = true;
    return {};
}

void ConsoleUiService::shutdown() {
    m_initialized = false;
}

int ConsoleUiService::run(core::Application& app, const std::atomic<bool>& shutdown_requested) {
    if (!m_initialized) {
        MIRROR_LOG_ERROR("ConsoleUi", "Not initialized");
        return 1;
    }

    if (auto started = app.start_sync(); !started) {
        MIRROR_LOG_ERROR("ConsoleUi", "Could not start sync");
        return 1;
    }

    std::cout << "\nMirror for Plex " << app.get_config().version_string() << " running\n"
              << "Press Ctrl+C to exit\n" << std::endl;

    auto slot = app.get_snapshot_slot();
    while (!shutdown_requested) {
        if (auto snapshot = slot->read_if_newer(m_last_seen)) {
            MIRROR_LOG_INFO("Status", utils::format_snapshot(*snapshot));
        }
        std::this_thread::sleep_for(m_refresh_interval);
    }

    app.stop_sync();
    return 0;
}

} // namespace mirror_for_plex::platform
