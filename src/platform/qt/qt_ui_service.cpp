#include "mirror_for_plex/platform/qt/qt_ui_service.hpp"
#include "mirror_for_plex/core/application.hpp"
#include "mirror_for_plex/platform/qt/qt_info_window.hpp"
#include "mirror_for_plex/utils/logger.hpp"
#include <QCoreApplication>
#include <QTimer>

namespace mirror_for_plex::platform::qt {

QtUiService::QtUiService() {
    MIRROR_LOG_DEBUG(m_component_name, "QtUiService constructed");
}

QtUiService::~QtUiService() {
    shutdown();
}

std::expected<void, UiError> QtUiService::initialize() {
    if (m_initialized) {
        return {};
    }

    // Use the existing QApplication instance created in main
    m_app = qobject_cast<QApplication*>(QCoreApplication::instance());
    if (!m_app) {
        MIRROR_LOG_ERROR(m_component_name, "QApplication not available - ensure Qt is initialized in main");
        return std::unexpected(UiError::InitializationFailed);
    }

    m_log_queue = std::make_shared<LogLineQueue>();
    utils::LoggerManager::get_instance().add_sink(std::make_unique<utils::CallbackSink>(
        [queue = m_log_queue](utils::LogLevel, const std::string& line) {
            queue->push(line);
        }));

    m_initialized = true;
    MIRROR_LOG_DEBUG(m_component_name, "Qt UI service initialized");
    return {};
}

void QtUiService::shutdown() {
    if (!m_initialized) {
        return;
    }

    // Don't delete QApplication - it's managed by main
    m_app = nullptr;
    m_initialized = false;
}

int QtUiService::run(core::Application& app, const std::atomic<bool>& shutdown_requested) {
    if (!m_initialized || !m_app) {
        MIRROR_LOG_ERROR(m_component_name, "UI service not initialized");
        return 1;
    }

    QtInfoWindow window(app, m_log_queue);
    window.show();

    if (!app.start_sync()) {
        MIRROR_LOG_ERROR(m_component_name, "Could not start sync");
    }

    QTimer shutdown_timer;
    QObject::connect(&shutdown_timer, &QTimer::timeout, [this, &shutdown_requested]() {
        if (shutdown_requested) {
            MIRROR_LOG_INFO(m_component_name, "Requesting Qt event loop to quit");
            m_app->quit();
        }
    });
    shutdown_timer.start(100);

    const int exit_code = m_app->exec();
    app.stop_sync();
    return exit_code;
}

} // namespace mirror_for_plex::platform::qt
