#pragma once

#include "mirror_for_plex/utils/logger.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mirror_for_plex {
namespace core {

// ============================================================================
// Application-wide types
// ============================================================================

enum class ApplicationState {
    NotInitialized,
    Initializing,
    Running,
    Stopping,
    Stopped,
    Error
};

enum class ApplicationError {
    InitializationFailed,
    ServiceUnavailable,
    ConfigurationError,
    AlreadyRunning
};

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

enum class ValidationError {
    MissingServerUrl,
    MissingToken,
    MissingUsername,
    MissingLibraries,
    MissingPlayerExecutable,
    InvalidPollInterval,
    InvalidTimeout,
    InvalidThreshold,
    InvalidLaunchAttempts,
    MissingTvdbApiKey
};

// Per-cycle and startup failures of the mirror
enum class SyncError {
    TransientNetworkError,
    NoMatchFound,
    PlayerLaunchFailure,
    ControlChannelUnavailable,
    ConfigurationError,
    CacheWriteFailed
};

// ============================================================================
// Domain types
// ============================================================================

// Active playback reported by the media server for the configured user
struct RemoteSession {
    std::string library_name;
    std::string item_title;          // show title for episodes, item title otherwise
    std::string file_path;           // path as seen by the server
    bool is_playing = false;

    std::string session_key;
    std::string show_title;
    int season = 0;
    int episode = 0;

    bool operator==(const RemoteSession&) const = default;
};

// Cached catalog identity of one local media folder
struct FolderIdentity {
    std::string folder_path;
    std::string source_id;           // empty when the folder could not be resolved
    std::string catalog;
    std::string romaji_title;
    std::string english_title;
    std::string synopsis;
    std::string image_file_name;
    std::string image_url;
    std::chrono::system_clock::time_point resolved_at;

    bool is_resolved() const { return !source_id.empty(); }

    // Preferred title for display, falling back to the given title
    std::string display_title(const std::string& fallback = {}) const;

    bool operator==(const FolderIdentity&) const = default;
};

enum class SyncState {
    Idle,
    Playing,
    Unmatched,
    Error
};

// What the UI shows; published once per cycle
struct PlaybackSnapshot {
    SyncState state = SyncState::Idle;
    std::optional<FolderIdentity> identity;
    std::string display_title;
    std::string library_name;
    bool is_playing = false;
    std::string message;
};

// ============================================================================
// Configuration structures
// ============================================================================

struct ConfigLimits {
    static constexpr std::chrono::seconds MIN_POLL_INTERVAL{1};
    static constexpr std::chrono::seconds MAX_POLL_INTERVAL{300};
    static constexpr std::chrono::seconds MIN_TIMEOUT{1};
    static constexpr std::chrono::seconds MAX_TIMEOUT{120};
};

struct PlexServiceConfig {
    std::string server_url = "http://127.0.0.1:32400";
    std::string token;
    std::string username;
    std::vector<std::string> libraries;
    std::chrono::seconds poll_interval{3};
    std::chrono::seconds timeout{10};

    std::expected<void, ValidationError> validate() const;
};

struct PathMapping {
    std::string remote_prefix;
    std::string local_prefix;
};

struct CatalogConfig {
    std::chrono::seconds timeout{6};
    double match_threshold = 0.6;
    bool enable_anilist = true;
    bool enable_tvdb = false;
    std::string tvdb_api_key;

    std::expected<void, ValidationError> validate() const;
};

struct PlayerConfig {
    std::string executable = "mpv";
    std::string ipc_endpoint;        // empty = default socket in the runtime dir
    std::string geometry = "1x1+0+0";
    std::vector<std::string> extra_args{"--osc=no", "--no-sub"};
    int launch_attempts = 10;
    std::chrono::milliseconds retry_delay{200};
    std::chrono::milliseconds max_retry_delay{2000};
    std::chrono::milliseconds ipc_timeout{1000};
    std::chrono::milliseconds quit_grace{2000};

    std::expected<void, ValidationError> validate() const;
};

struct StorageConfig {
    std::filesystem::path identity_cache;   // empty = <config dir>/matches.json
    std::filesystem::path thumbs_dir;       // empty = <config dir>/thumbs
};

struct ApplicationConfig {
    PlexServiceConfig plex;
    std::vector<PathMapping> path_mappings;
    CatalogConfig catalogs;
    PlayerConfig player;
    StorageConfig storage;

    mirror_for_plex::utils::LogLevel log_level = mirror_for_plex::utils::LogLevel::Info;

    std::expected<void, ValidationError> validate() const;

    // Version information
    std::string version_string() const;
};

// ============================================================================
// String conversions for log messages
// ============================================================================

std::string to_string(SyncError error);
std::string to_string(ValidationError error);
std::string to_string(ConfigError error);
std::string to_string(SyncState state);

} // namespace core
} // namespace mirror_for_plex
