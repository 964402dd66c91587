#include "mirror_for_plex/core/application.hpp"
#include "mirror_for_plex/core/reconciliation_loop.hpp"
#include "mirror_for_plex/core/snapshot_slot.hpp"
#include "mirror_for_plex/core/title_matcher.hpp"
#include "mirror_for_plex/services/artwork/cover_art_cache.hpp"
#include "mirror_for_plex/services/catalog/catalog_client.hpp"
#include "mirror_for_plex/services/identity/identity_cache.hpp"
#include "mirror_for_plex/services/identity/metadata_resolver.hpp"
#include "mirror_for_plex/services/network/http_client.hpp"
#include "mirror_for_plex/services/player/player_controller.hpp"
#include "mirror_for_plex/services/plex/session_source.hpp"
#include "mirror_for_plex/utils/logger.hpp"
#include "version.h"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace mirror_for_plex {
namespace core {

class ApplicationImpl : public Application {
public:
    ApplicationImpl(ApplicationConfig config, std::filesystem::path data_dir)
        : m_config(std::move(config)),
          m_data_dir(std::move(data_dir)),
          m_state(ApplicationState::NotInitialized),
          m_snapshot_slot(std::make_shared<SnapshotSlot>()) {
        MIRROR_LOG_DEBUG("Application", "Application created");
    }

    ~ApplicationImpl() override {
        shutdown();
        MIRROR_LOG_DEBUG("Application", "Application destroyed");
    }

    std::expected<void, ApplicationError> initialize() override {
        MIRROR_LOG_INFO("Application", "Initializing " + m_config.version_string());

        if (m_state != ApplicationState::NotInitialized) {
            MIRROR_LOG_WARNING("Application", "Already initialized");
            return std::unexpected(ApplicationError::AlreadyRunning);
        }

        m_state = ApplicationState::Initializing;

        if (auto valid = m_config.validate(); !valid) {
            MIRROR_LOG_ERROR("Application", "Invalid configuration: " + to_string(valid.error()));
            m_state = ApplicationState::Error;
            return std::unexpected(ApplicationError::ConfigurationError);
        }

        try {
            initialize_network();
            initialize_identity();
            initialize_player();
            initialize_loop();

            m_state = ApplicationState::Running;
            MIRROR_LOG_INFO("Application", "Initialization complete");
            return {};

        } catch (const std::exception& e) {
            MIRROR_LOG_ERROR("Application", "Initialization failed: " + std::string(e.what()));
            m_state = ApplicationState::Error;
            return std::unexpected(ApplicationError::InitializationFailed);
        }
    }

    std::expected<void, ApplicationError> start_sync() override {
        std::lock_guard lock(m_sync_mutex);

        if (m_state != ApplicationState::Running) {
            MIRROR_LOG_ERROR("Application", "Not initialized");
            return std::unexpected(ApplicationError::InitializationFailed);
        }
        if (m_sync_thread.joinable()) {
            if (m_syncing) {
                MIRROR_LOG_DEBUG("Application", "Sync already running");
                return {};
            }
            // Finished after request_stop_sync()
            m_sync_thread.join();
        }

        // A fresh stop source per sync session; the same token cancels the
        // poll sleep, in-flight HTTP transfers and player connection retries
        m_stop_source = std::stop_source{};
        auto token = m_stop_source.get_token();
        m_http_client->set_cancel_token(token);
        m_player->set_stop_token(token);

        m_syncing = true;
        m_sync_thread = std::jthread([this, loop = m_loop, token]() {
            loop->run(token);
            m_syncing = false;
        });

        MIRROR_LOG_INFO("Application", "Sync started");
        return {};
    }

    void stop_sync() override {
        std::lock_guard lock(m_sync_mutex);

        if (!m_sync_thread.joinable()) {
            return;
        }

        MIRROR_LOG_INFO("Application", "Stopping sync...");
        m_stop_source.request_stop();
        m_sync_thread.join();
        m_syncing = false;

        // The loop already stopped the player; this covers a loop that died early
        m_player->stop();
        MIRROR_LOG_INFO("Application", "Sync stopped");
    }

    void request_stop_sync() override {
        std::lock_guard lock(m_sync_mutex);

        if (m_sync_thread.joinable() && !m_stop_source.stop_requested()) {
            MIRROR_LOG_INFO("Application", "Stop requested, sync finishing in the background");
            m_stop_source.request_stop();
        }
    }

    bool is_syncing() const override {
        return m_syncing;
    }

    void shutdown() override {
        if (m_state == ApplicationState::Stopped || m_state == ApplicationState::NotInitialized) {
            return;
        }

        MIRROR_LOG_INFO("Application", "Shutting down...");
        m_state = ApplicationState::Stopping;
        stop_sync();

        m_loop.reset();
        m_player.reset();

        m_state = ApplicationState::Stopped;
        MIRROR_LOG_INFO("Application", "Shutdown complete");
    }

    ApplicationState get_state() const override {
        return m_state;
    }

    std::shared_ptr<SnapshotSlot> get_snapshot_slot() const override {
        return m_snapshot_slot;
    }

    const ApplicationConfig& get_config() const override {
        return m_config;
    }

    std::filesystem::path image_path(const std::string& image_file_name) const override {
        if (!m_image_store || image_file_name.empty()) {
            return {};
        }
        return m_image_store->path_for(image_file_name);
    }

private:
    void initialize_network() {
        services::HttpClientConfig http_config;
        http_config.default_timeout = m_config.catalogs.timeout;
        http_config.user_agent = std::string("MirrorForPlex/") + VERSION_STRING;

        m_http_client = services::create_http_client(http_config);
        if (!m_http_client) {
            throw std::runtime_error("HTTP client creation failed");
        }

        m_session_source = std::make_shared<services::PlexSessionSource>(
            m_http_client, m_config.plex.server_url, m_config.plex.token, m_config.plex.timeout);
        MIRROR_LOG_INFO("Application", "Plex session source ready for " + m_config.plex.server_url);
    }

    void initialize_identity() {
        auto cache_path = m_config.storage.identity_cache.empty()
            ? m_data_dir / "matches.json" : m_config.storage.identity_cache;
        auto thumbs_dir = m_config.storage.thumbs_dir.empty()
            ? m_data_dir / "thumbs" : m_config.storage.thumbs_dir;

        auto cache = std::make_shared<services::IdentityCache>(cache_path);
        if (auto loaded = cache->load(); !loaded) {
            MIRROR_LOG_WARNING("Application", "Identity cache unreadable, starting empty: " + cache_path.string());
        }

        std::shared_ptr<services::CatalogClient> primary;
        std::shared_ptr<services::CatalogClient> secondary;
        if (m_config.catalogs.enable_anilist) {
            primary = std::make_shared<services::AniListCatalog>(m_http_client, m_config.catalogs.timeout);
        }
        if (m_config.catalogs.enable_tvdb) {
            auto tvdb = std::make_shared<services::TvdbCatalog>(
                m_http_client, m_config.catalogs.tvdb_api_key, m_config.catalogs.timeout);
            if (primary) {
                secondary = std::move(tvdb);
            } else {
                primary = std::move(tvdb);
            }
        }
        if (!primary) {
            MIRROR_LOG_WARNING("Application", "No catalog enabled, folders will stay unresolved");
        }

        m_resolver = std::make_shared<services::MetadataResolver>(
            std::move(cache), std::move(primary), std::move(secondary),
            TitleMatcher(m_config.catalogs.match_threshold));
        m_image_store = std::make_shared<services::CoverArtCache>(m_http_client, thumbs_dir, m_config.catalogs.timeout);
    }

    void initialize_player() {
        m_player = std::make_shared<services::PlayerController>(
            m_config.player,
            std::make_unique<services::PosixPlayerProcess>(),
            std::make_unique<services::MpvIpcChannel>(m_config.player.ipc_timeout));
        MIRROR_LOG_INFO("Application", "Player controller ready, IPC endpoint " + m_player->endpoint());
    }

    void initialize_loop() {
        LoopSettings settings;
        settings.username = m_config.plex.username;
        settings.libraries = m_config.plex.libraries;
        settings.poll_interval = m_config.plex.poll_interval;

        m_loop = std::make_shared<ReconciliationLoop>(
            std::move(settings), m_session_source, PathMapper(m_config.path_mappings),
            m_resolver, m_image_store, m_player, m_snapshot_slot);
    }

    ApplicationConfig m_config;
    std::filesystem::path m_data_dir;
    std::atomic<ApplicationState> m_state;
    std::atomic<bool> m_syncing{false};

    std::shared_ptr<SnapshotSlot> m_snapshot_slot;
    std::shared_ptr<services::HttpClient> m_http_client;
    std::shared_ptr<services::RemoteSessionSource> m_session_source;
    std::shared_ptr<services::MetadataResolver> m_resolver;
    std::shared_ptr<services::ImageStore> m_image_store;
    std::shared_ptr<services::PlayerController> m_player;
    std::shared_ptr<ReconciliationLoop> m_loop;

    std::mutex m_sync_mutex;
    std::stop_source m_stop_source;
    std::jthread m_sync_thread;
};

std::expected<std::unique_ptr<Application>, ApplicationError>
create_application(ApplicationConfig config, std::filesystem::path data_dir) {
    MIRROR_LOG_DEBUG("Application", "Creating application");

    try {
        return std::make_unique<ApplicationImpl>(std::move(config), std::move(data_dir));
    } catch (const std::exception& e) {
        MIRROR_LOG_ERROR("Application", "Creation failed: " + std::string(e.what()));
        return std::unexpected(ApplicationError::InitializationFailed);
    }
}

} // namespace core
} // namespace mirror_for_plex
