#include "mirror_for_plex/utils/yaml_config.hpp"
#include "mirror_for_plex/utils/logger.hpp"
#include <fstream>

namespace mirror_for_plex {
namespace utils {

namespace {
    template<typename T>
    void read_if_present(const YAML::Node& node, const char* key, T& target) {
        if (node[key]) {
            target = node[key].as<T>();
        }
    }

    template<typename Duration>
    void read_duration(const YAML::Node& node, const char* key, Duration& target) {
        if (node[key]) {
            target = Duration{node[key].as<long long>()};
        }
    }

    std::vector<std::string> read_string_list(const YAML::Node& node) {
        std::vector<std::string> values;
        if (node.IsSequence()) {
            for (const auto& item : node) {
                values.push_back(item.as<std::string>());
            }
        } else if (node.IsScalar()) {
            values.push_back(node.as<std::string>());
        }
        return values;
    }
}

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        MIRROR_LOG_WARNING("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        if (node.IsNull()) {
            return core::ApplicationConfig{};
        }
        if (!node.IsMap()) {
            MIRROR_LOG_ERROR("YamlConfig", "Top level of " + path.string() + " is not a mapping");
            return std::unexpected(core::ConfigError::InvalidFormat);
        }
        return from_yaml(node);
    } catch (const YAML::BadFile& e) {
        MIRROR_LOG_ERROR("YamlConfig", "Cannot read " + path.string() + ": " + e.what());
        return std::unexpected(core::ConfigError::PermissionDenied);
    } catch (const std::exception& e) {
        MIRROR_LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<void, core::ConfigError>
YamlConfigHelper::save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path,
                               const std::string& header) {
    try {
        auto dir = path.parent_path();
        if (!dir.empty() && !std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }

        YAML::Emitter emitter;
        emitter << to_yaml(config);

        std::ofstream file(path);
        if (!file) {
            MIRROR_LOG_ERROR("YamlConfig", "Cannot open file for writing: " + path.string());
            return std::unexpected(core::ConfigError::PermissionDenied);
        }

        file << header << emitter.c_str() << '\n';
        if (!file) {
            return std::unexpected(core::ConfigError::PermissionDenied);
        }
        return {};
    } catch (const std::exception& e) {
        MIRROR_LOG_ERROR("YamlConfig", "Save error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

core::ApplicationConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::ApplicationConfig config;

    if (node["log_level"]) {
        config.log_level = log_level_from_string(node["log_level"].as<std::string>());
    }

    if (node["plex"]) {
        config.plex = parse_plex_config(node["plex"]);
    }
    if (node["path_mappings"]) {
        config.path_mappings = parse_path_mappings(node["path_mappings"]);
    }
    if (node["catalogs"]) {
        config.catalogs = parse_catalog_config(node["catalogs"]);
    }
    if (node["player"]) {
        config.player = parse_player_config(node["player"]);
    }
    if (node["storage"]) {
        config.storage = parse_storage_config(node["storage"]);
    }

    return config;
}

YAML::Node YamlConfigHelper::to_yaml(const core::ApplicationConfig& config) {
    YAML::Node node;

    node["log_level"] = to_string(config.log_level);

    node["plex"]["server_url"] = config.plex.server_url;
    node["plex"]["token"] = config.plex.token;
    node["plex"]["username"] = config.plex.username;
    node["plex"]["libraries"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& library : config.plex.libraries) {
        node["plex"]["libraries"].push_back(library);
    }
    node["plex"]["poll_interval"] = config.plex.poll_interval.count();
    node["plex"]["timeout"] = config.plex.timeout.count();

    node["path_mappings"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& mapping : config.path_mappings) {
        YAML::Node entry;
        entry["remote"] = mapping.remote_prefix;
        entry["local"] = mapping.local_prefix;
        node["path_mappings"].push_back(entry);
    }

    node["catalogs"]["timeout"] = config.catalogs.timeout.count();
    node["catalogs"]["match_threshold"] = config.catalogs.match_threshold;
    node["catalogs"]["anilist"]["enabled"] = config.catalogs.enable_anilist;
    node["catalogs"]["tvdb"]["enabled"] = config.catalogs.enable_tvdb;
    node["catalogs"]["tvdb"]["api_key"] = config.catalogs.tvdb_api_key;

    node["player"]["executable"] = config.player.executable;
    node["player"]["ipc_endpoint"] = config.player.ipc_endpoint;
    node["player"]["geometry"] = config.player.geometry;
    node["player"]["extra_args"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& arg : config.player.extra_args) {
        node["player"]["extra_args"].push_back(arg);
    }
    node["player"]["launch_attempts"] = config.player.launch_attempts;
    node["player"]["retry_delay_ms"] = config.player.retry_delay.count();
    node["player"]["max_retry_delay_ms"] = config.player.max_retry_delay.count();
    node["player"]["ipc_timeout_ms"] = config.player.ipc_timeout.count();
    node["player"]["quit_grace_ms"] = config.player.quit_grace.count();

    node["storage"]["identity_cache"] = config.storage.identity_cache.string();
    node["storage"]["thumbs_dir"] = config.storage.thumbs_dir.string();

    return node;
}

core::PlexServiceConfig YamlConfigHelper::parse_plex_config(const YAML::Node& node) {
    core::PlexServiceConfig config;

    read_if_present(node, "server_url", config.server_url);
    read_if_present(node, "token", config.token);
    read_if_present(node, "username", config.username);
    if (node["libraries"]) {
        config.libraries = read_string_list(node["libraries"]);
    }
    read_duration(node, "poll_interval", config.poll_interval);
    read_duration(node, "timeout", config.timeout);

    return config;
}

std::vector<core::PathMapping> YamlConfigHelper::parse_path_mappings(const YAML::Node& node) {
    std::vector<core::PathMapping> mappings;
    if (!node.IsSequence()) {
        return mappings;
    }

    for (const auto& entry : node) {
        if (!entry["remote"] || !entry["local"]) {
            MIRROR_LOG_WARNING("YamlConfig", "Skipping path mapping without remote/local keys");
            continue;
        }
        mappings.push_back({entry["remote"].as<std::string>(), entry["local"].as<std::string>()});
    }
    return mappings;
}

core::CatalogConfig YamlConfigHelper::parse_catalog_config(const YAML::Node& node) {
    core::CatalogConfig config;

    read_duration(node, "timeout", config.timeout);
    read_if_present(node, "match_threshold", config.match_threshold);

    if (node["anilist"]) {
        read_if_present(node["anilist"], "enabled", config.enable_anilist);
    }
    if (node["tvdb"]) {
        read_if_present(node["tvdb"], "enabled", config.enable_tvdb);
        read_if_present(node["tvdb"], "api_key", config.tvdb_api_key);
    }

    return config;
}

core::PlayerConfig YamlConfigHelper::parse_player_config(const YAML::Node& node) {
    core::PlayerConfig config;

    read_if_present(node, "executable", config.executable);
    read_if_present(node, "ipc_endpoint", config.ipc_endpoint);
    read_if_present(node, "geometry", config.geometry);
    if (node["extra_args"]) {
        config.extra_args = read_string_list(node["extra_args"]);
    }
    read_if_present(node, "launch_attempts", config.launch_attempts);
    read_duration(node, "retry_delay_ms", config.retry_delay);
    read_duration(node, "max_retry_delay_ms", config.max_retry_delay);
    read_duration(node, "ipc_timeout_ms", config.ipc_timeout);
    read_duration(node, "quit_grace_ms", config.quit_grace);

    return config;
}

core::StorageConfig YamlConfigHelper::parse_storage_config(const YAML::Node& node) {
    core::StorageConfig config;

    if (node["identity_cache"]) {
        config.identity_cache = node["identity_cache"].as<std::string>();
    }
    if (node["thumbs_dir"]) {
        config.thumbs_dir = node["thumbs_dir"].as<std::string>();
    }

    return config;
}

} // namespace utils
} // namespace mirror_for_plex
