#include "mirror_for_plex/core/application.hpp"
#include "mirror_for_plex/platform/system_service.hpp"
#include "mirror_for_plex/platform/ui_service.hpp"
#include "mirror_for_plex/utils/logger.hpp"

#ifdef USE_QT_UI
#include <QApplication>
#include <QMessageBox>
#endif

#include <atomic>
#include <csignal>
#include <iostream>

namespace {
    std::atomic<bool> g_shutdown_requested{false};

    void handle_shutdown_signal(int /*signal*/) {
        g_shutdown_requested = true;
    }

    void register_signal_handlers() {
        std::signal(SIGINT, handle_shutdown_signal);
        std::signal(SIGTERM, handle_shutdown_signal);
        // A dead player socket must not kill the mirror
        std::signal(SIGPIPE, SIG_IGN);
    }

    std::unique_ptr<mirror_for_plex::utils::Logger> setup_logging(
        mirror_for_plex::utils::LogLevel log_level, const std::filesystem::path& data_dir) {
        using namespace mirror_for_plex::utils;

        auto logger = std::make_unique<Logger>(log_level);
        logger->add_sink(std::make_unique<ConsoleSink>(true));

        if (!data_dir.empty()) {
            auto log_path = data_dir / "mirror-for-plex.log";
            auto file_sink = std::make_unique<FileSink>(log_path, false);
            if (file_sink->is_open()) {
                logger->add_sink(std::move(file_sink));
                std::cerr << "Logging to: " << log_path << std::endl;
            }
        }

        return logger;
    }

    void report_fatal(const std::string& message) {
        MIRROR_LOG_ERROR("Main", message);
#ifdef USE_QT_UI
        QMessageBox::critical(nullptr, "Mirror for Plex", QString::fromStdString(message));
#else
        std::cerr << message << std::endl;
#endif
    }

    std::unique_ptr<mirror_for_plex::platform::SingleInstanceManager> acquire_single_instance() {
        auto single_instance = mirror_for_plex::platform::SingleInstanceManager::create("MirrorForPlex");
        auto result = single_instance->try_acquire_instance();

        if (!result || !*result) {
            report_fatal("Another instance of Mirror for Plex is already running.");
            return nullptr;
        }

        return single_instance;
    }

#ifdef USE_QT_UI
    void setup_qt_application(QApplication& app) {
        app.setApplicationName("Mirror for Plex");
        app.setApplicationDisplayName("Mirror for Plex");
#ifdef Q_OS_LINUX
        app.setDesktopFileName("mirror-for-plex.desktop");
#endif
    }
#endif
} // anonymous namespace

int main(int argc, char* argv[]) {
#ifdef USE_QT_UI
    QApplication qt_app(argc, argv);
    setup_qt_application(qt_app);
#else
    (void)argc;
    (void)argv;
#endif

    using namespace mirror_for_plex;

    core::ConfigManager config_manager;
    auto loaded = config_manager.load();

    const auto& config = config_manager.get();
    utils::LoggerManager::set_instance(setup_logging(config.log_level, config_manager.data_directory()));

    if (!loaded) {
        if (loaded.error() == core::ConfigError::FileNotFound) {
            report_fatal("Configuration written to " + config_manager.config_path().string() +
                         ". Fill in the Plex settings and start again.");
        } else {
            report_fatal("Cannot read configuration " + config_manager.config_path().string() + ": " +
                         core::to_string(loaded.error()));
        }
        return 1;
    }

    MIRROR_LOG_INFO("Main", "Mirror for Plex " + config.version_string() + " starting...");
    MIRROR_LOG_DEBUG("Main", "Log level: " + utils::to_string(config.log_level));

    if (auto valid = config.validate(); !valid) {
        report_fatal("Invalid configuration in " + config_manager.config_path().string() + ": " +
                     core::to_string(valid.error()));
        return 1;
    }

    register_signal_handlers();

    try {
        auto single_instance = acquire_single_instance();
        if (!single_instance) {
            return 1;
        }

        auto app_result = core::create_application(config, config_manager.data_directory());
        if (!app_result) {
            report_fatal("Application creation failed");
            return 1;
        }
        auto app = std::move(*app_result);

        if (auto initialized = app->initialize(); !initialized) {
            report_fatal("Application initialization failed");
            return 1;
        }

        auto ui = platform::UiService::create_default();
        if (!ui || !ui->initialize()) {
            report_fatal("User interface initialization failed");
            return 1;
        }

        const int exit_code = ui->run(*app, g_shutdown_requested);

        MIRROR_LOG_INFO("Main", "Shutting down...");
        ui->shutdown();
        app->shutdown();
        single_instance->release_instance();

        MIRROR_LOG_INFO("Main", "Shutdown complete");
        return exit_code;

    } catch (const std::exception& e) {
        report_fatal("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
