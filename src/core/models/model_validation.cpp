#include "mirror_for_plex/core/models.hpp"
#include "version.h"

namespace mirror_for_plex {
namespace core {

std::string FolderIdentity::display_title(const std::string& fallback) const {
    if (!english_title.empty()) {
        return english_title;
    }
    if (!romaji_title.empty()) {
        return romaji_title;
    }
    return fallback;
}

// PlexServiceConfig validation
std::expected<void, ValidationError> PlexServiceConfig::validate() const {
    if (server_url.empty()) {
        return std::unexpected(ValidationError::MissingServerUrl);
    }
    if (token.empty()) {
        return std::unexpected(ValidationError::MissingToken);
    }
    if (username.empty()) {
        return std::unexpected(ValidationError::MissingUsername);
    }
    if (libraries.empty()) {
        return std::unexpected(ValidationError::MissingLibraries);
    }

    // Poll interval should be within configured limits
    if (poll_interval < ConfigLimits::MIN_POLL_INTERVAL ||
        poll_interval > ConfigLimits::MAX_POLL_INTERVAL) {
        return std::unexpected(ValidationError::InvalidPollInterval);
    }

    if (timeout < ConfigLimits::MIN_TIMEOUT || timeout > ConfigLimits::MAX_TIMEOUT) {
        return std::unexpected(ValidationError::InvalidTimeout);
    }

    return {};
}

std::expected<void, ValidationError> CatalogConfig::validate() const {
    if (timeout < ConfigLimits::MIN_TIMEOUT || timeout > ConfigLimits::MAX_TIMEOUT) {
        return std::unexpected(ValidationError::InvalidTimeout);
    }
    if (match_threshold <= 0.0 || match_threshold > 1.0) {
        return std::unexpected(ValidationError::InvalidThreshold);
    }
    if (enable_tvdb && tvdb_api_key.empty()) {
        return std::unexpected(ValidationError::MissingTvdbApiKey);
    }
    return {};
}

std::expected<void, ValidationError> PlayerConfig::validate() const {
    if (executable.empty()) {
        return std::unexpected(ValidationError::MissingPlayerExecutable);
    }
    if (launch_attempts < 1) {
        return std::unexpected(ValidationError::InvalidLaunchAttempts);
    }
    if (retry_delay.count() < 0 || max_retry_delay < retry_delay ||
        ipc_timeout.count() <= 0 || quit_grace.count() < 0) {
        return std::unexpected(ValidationError::InvalidTimeout);
    }
    return {};
}

// ApplicationConfig validation
std::expected<void, ValidationError> ApplicationConfig::validate() const {
    if (auto result = plex.validate(); !result) {
        return result;
    }
    if (auto result = catalogs.validate(); !result) {
        return result;
    }
    return player.validate();
}

std::string ApplicationConfig::version_string() const {
#ifdef VERSION_STRING
    return VERSION_STRING;
#else
    return "0.0.0";
#endif
}

std::string to_string(SyncError error) {
    switch (error) {
        case SyncError::TransientNetworkError: return "transient network error";
        case SyncError::NoMatchFound: return "no match found";
        case SyncError::PlayerLaunchFailure: return "player launch failure";
        case SyncError::ControlChannelUnavailable: return "control channel unavailable";
        case SyncError::ConfigurationError: return "configuration error";
        case SyncError::CacheWriteFailed: return "cache write failed";
    }
    return "unknown error";
}

std::string to_string(ValidationError error) {
    switch (error) {
        case ValidationError::MissingServerUrl: return "plex.server_url is empty";
        case ValidationError::MissingToken: return "plex.token is empty";
        case ValidationError::MissingUsername: return "plex.username is empty";
        case ValidationError::MissingLibraries: return "plex.libraries must list at least one library";
        case ValidationError::MissingPlayerExecutable: return "player.executable is empty";
        case ValidationError::InvalidPollInterval: return "plex.poll_interval must be between 1 and 300 seconds";
        case ValidationError::InvalidTimeout: return "a timeout or delay value is out of range";
        case ValidationError::InvalidThreshold: return "catalogs.match_threshold must be in (0, 1]";
        case ValidationError::InvalidLaunchAttempts: return "player.launch_attempts must be at least 1";
        case ValidationError::MissingTvdbApiKey: return "catalogs.tvdb.api_key is required when tvdb is enabled";
    }
    return "unknown validation error";
}

std::string to_string(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::InvalidFormat: return "invalid format";
        case ConfigError::ValidationError: return "validation failed";
        case ConfigError::PermissionDenied: return "permission denied";
    }
    return "unknown config error";
}

std::string to_string(SyncState state) {
    switch (state) {
        case SyncState::Idle: return "Idle";
        case SyncState::Playing: return "Playing";
        case SyncState::Unmatched: return "Unmatched";
        case SyncState::Error: return "Error";
    }
    return "Unknown";
}

} // namespace core
} // namespace mirror_for_plex
