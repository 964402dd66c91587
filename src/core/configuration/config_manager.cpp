#include "mirror_for_plex/core/application.hpp"
#include "mirror_for_plex/utils/logger.hpp"
#include "mirror_for_plex/utils/yaml_config.hpp"
#include <cstdlib>
#include <system_error>

namespace mirror_for_plex {
namespace core {

namespace {

const char* const CONFIG_HEADER =
    "# Mirror for Plex configuration\n"
    "# This file was automatically generated on first run.\n"
    "# Fill in plex.token, plex.username and plex.libraries, then restart.\n"
    "#\n"
    "# log_level: debug, info, warning or error\n"
    "# plex.server_url: Plex Media Server base URL\n"
    "# plex.token: X-Plex-Token used to read /status/sessions\n"
    "# plex.username: Plex user whose playback is mirrored\n"
    "# plex.libraries: library names to mirror, others are ignored\n"
    "# plex.poll_interval: seconds between session checks (1-300)\n"
    "# path_mappings: server path prefix to local path prefix, first match wins\n"
    "# catalogs.match_threshold: minimum title similarity to accept a match (0-1)\n"
    "# catalogs.tvdb.api_key: required when tvdb is enabled\n"
    "# player.executable: mpv binary, looked up on PATH\n"
    "# player.ipc_endpoint: empty uses $XDG_RUNTIME_DIR/mirror-for-plex-mpv.sock\n"
    "# storage.identity_cache / storage.thumbs_dir: empty uses the config directory\n"
    "\n";

} // namespace

class ConfigManager::Impl {
public:
    explicit Impl(const std::filesystem::path& config_path)
        : m_config_path(config_path.empty() ? ConfigManager::default_config_path() : config_path) {
        MIRROR_LOG_DEBUG("ConfigManager", "Using configuration file: " + m_config_path.string());
    }

    std::expected<void, ConfigError> load() {
        std::error_code ec;
        if (!std::filesystem::exists(m_config_path, ec)) {
            MIRROR_LOG_INFO("ConfigManager", "No configuration found, writing defaults to " + m_config_path.string());
            m_config = ApplicationConfig{};
            if (auto saved = save(); !saved) {
                return saved;
            }
            return std::unexpected(ConfigError::FileNotFound);
        }

        auto result = utils::YamlConfigHelper::load_from_file(m_config_path);
        if (!result) {
            MIRROR_LOG_ERROR("ConfigManager", "Failed to load configuration: " + to_string(result.error()));
            return std::unexpected(result.error());
        }

        m_config = std::move(*result);
        MIRROR_LOG_INFO("ConfigManager", "Configuration loaded");
        return {};
    }

    std::expected<void, ConfigError> save() const {
        std::error_code ec;
        auto dir = m_config_path.parent_path();
        if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                MIRROR_LOG_ERROR("ConfigManager", "Cannot create " + dir.string() + ": " + ec.message());
                return std::unexpected(ConfigError::PermissionDenied);
            }
            MIRROR_LOG_DEBUG("ConfigManager", "Created directory: " + dir.string());
        }

        return utils::YamlConfigHelper::save_to_file(m_config, m_config_path, CONFIG_HEADER);
    }

    std::filesystem::path m_config_path;
    ApplicationConfig m_config;
};

ConfigManager::ConfigManager(const std::filesystem::path& config_path)
    : m_impl(std::make_unique<Impl>(config_path)) {}

ConfigManager::~ConfigManager() = default;

std::expected<void, ConfigError> ConfigManager::load() {
    return m_impl->load();
}

std::expected<void, ConfigError> ConfigManager::save() {
    return m_impl->save();
}

const ApplicationConfig& ConfigManager::get() const {
    return m_impl->m_config;
}

const std::filesystem::path& ConfigManager::config_path() const {
    return m_impl->m_config_path;
}

std::filesystem::path ConfigManager::data_directory() const {
    return m_impl->m_config_path.parent_path();
}

std::filesystem::path ConfigManager::default_config_path() {
    if (const char* override_path = std::getenv("MIRROR_FOR_PLEX_CONFIG"); override_path && *override_path) {
        return override_path;
    }

    // $XDG_CONFIG_HOME/mirror-for-plex or ~/.config/mirror-for-plex
    std::filesystem::path config_dir;
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME"); xdg_config && *xdg_config) {
        config_dir = std::filesystem::path(xdg_config) / "mirror-for-plex";
    } else if (const char* home = std::getenv("HOME")) {
        config_dir = std::filesystem::path(home) / ".config" / "mirror-for-plex";
    } else {
        config_dir = std::filesystem::current_path() / "mirror-for-plex";
    }

    return config_dir / "config.yaml";
}

} // namespace core
} // namespace mirror_for_plex
