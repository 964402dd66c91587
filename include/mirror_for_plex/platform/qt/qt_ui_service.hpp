#pragma once

#include "mirror_for_plex/platform/ui_service.hpp"
#include <QApplication>
#include <memory>
#include <string>

namespace mirror_for_plex::platform::qt {

class LogLineQueue;

class QtUiService : public UiService {
public:
    QtUiService();
    ~QtUiService() override;

    std::expected<void, UiError> initialize() override;
    void shutdown() override;
    int run(core::Application& app, const std::atomic<bool>& shutdown_requested) override;

private:
    QApplication* m_app = nullptr;
    std::shared_ptr<LogLineQueue> m_log_queue;
    bool m_initialized = false;
    std::string m_component_name = "QtUiService";
};

} // namespace mirror_for_plex::platform::qt
