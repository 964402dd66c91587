#include "mirror_for_plex/core/path_mapper.hpp"

#include <algorithm>
#include <regex>

namespace mirror_for_plex {
namespace core {

namespace {

std::string normalize_separators(std::string path) {
    std::replace(path.begin(), path.end(), '\\', '/');
    return path;
}

std::string strip_trailing_slashes(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

PathMapper::PathMapper(std::vector<PathMapping> mappings) {
    for (auto& mapping : mappings) {
        mapping.remote_prefix = strip_trailing_slashes(normalize_separators(mapping.remote_prefix));
        mapping.local_prefix = strip_trailing_slashes(normalize_separators(mapping.local_prefix));
        if (!mapping.remote_prefix.empty()) {
            m_mappings.push_back(std::move(mapping));
        }
    }
}

std::optional<std::string> PathMapper::map(const std::string& remote_path) const {
    if (remote_path.empty()) {
        return std::nullopt;
    }

    std::string path = normalize_separators(remote_path);
    if (m_mappings.empty()) {
        return path;
    }

    for (const auto& mapping : m_mappings) {
        const auto& prefix = mapping.remote_prefix;
        if (!path.starts_with(prefix)) {
            continue;
        }
        // Whole path components only: /data/anime must not match /data/anime2
        if (path.size() > prefix.size() && path[prefix.size()] != '/' && prefix != "/") {
            continue;
        }

        std::string rest = path.substr(prefix.size());
        if (!rest.empty() && rest.front() != '/') {
            rest.insert(rest.begin(), '/');
        }
        return mapping.local_prefix == "/" ? rest : mapping.local_prefix + rest;
    }

    return std::nullopt;
}

bool PathMapper::is_season_directory(const std::string& name) {
    static const std::regex season_pattern(R"(^(season[ ._-]*\d+|s\d{1,2}|specials?)$)", std::regex::icase);
    return std::regex_match(name, season_pattern);
}

std::filesystem::path PathMapper::identity_folder(const std::filesystem::path& local_file) {
    auto folder = local_file.lexically_normal().parent_path();
    if (is_season_directory(folder.filename().string()) && folder.has_parent_path() &&
        folder.parent_path() != folder.root_path()) {
        return folder.parent_path();
    }
    return folder;
}

} // namespace core
} // namespace mirror_for_plex
