#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mirror_for_plex {
namespace core {

// Translates media server file paths into local paths by root prefix
class PathMapper {
public:
    explicit PathMapper(std::vector<PathMapping> mappings = {});

    // First matching prefix wins. Without any configured mapping the server
    // path is taken to be local already.
    std::optional<std::string> map(const std::string& remote_path) const;

    bool empty() const { return m_mappings.empty(); }

    // Folder that carries the show's identity: the file's directory, or its
    // parent when the directory is a season folder
    static std::filesystem::path identity_folder(const std::filesystem::path& local_file);

    static bool is_season_directory(const std::string& name);

private:
    std::vector<PathMapping> m_mappings;
};

} // namespace core
} // namespace mirror_for_plex
