#pragma once

#include "mirror_for_plex/platform/ui_service.hpp"
#include <chrono>
#include <cstdint>

namespace mirror_for_plex::platform {

// Headless view: logs every new snapshot
class ConsoleUiService : public UiService {
public:
    explicit ConsoleUiService(std::chrono::milliseconds refresh_interval = std::chrono::milliseconds(250));

    std::expected<void, UiError> initialize() override;
    void shutdown() override;
    int run(core::Application& app, const std::atomic<bool>& shutdown_requested) override;

private:
    std::chrono::milliseconds m_refresh_interval;
    std::uint64_t m_last_seen = 0;
    bool m_initialized = false;
};

} // namespace mirror_for_plex::platform
