#pragma once

#include <string>

namespace mirror_for_plex {
namespace utils {

// URL utilities
class UrlUtils {
public:
    static std::string encode(const std::string& str);
    static std::string join_path(const std::string& base, const std::string& path);
    static bool is_valid_url(const std::string& url);
};

} // namespace utils
} // namespace mirror_for_plex
