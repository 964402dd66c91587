#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <expected>

namespace mirror_for_plex {
namespace utils {

class YamlConfigHelper {
public:
    // Load configuration from YAML file
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Save configuration to YAML file, optionally preceded by a comment header
    static std::expected<void, core::ConfigError>
    save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path,
                 const std::string& header = {});

    // Convert between YAML nodes and config structures
    static core::ApplicationConfig from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::ApplicationConfig& config);

private:
    static core::PlexServiceConfig parse_plex_config(const YAML::Node& node);
    static std::vector<core::PathMapping> parse_path_mappings(const YAML::Node& node);
    static core::CatalogConfig parse_catalog_config(const YAML::Node& node);
    static core::PlayerConfig parse_player_config(const YAML::Node& node);
    static core::StorageConfig parse_storage_config(const YAML::Node& node);
};

} // namespace utils
} // namespace mirror_for_plex
