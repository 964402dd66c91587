#pragma once

#include <atomic>
#include <expected>
#include <memory>

namespace mirror_for_plex {
namespace core {
class Application;
}

namespace platform {

// UI error types
enum class UiError {
    NotSupported,
    InitializationFailed,
    OperationFailed
};

// Front end that shows the playback snapshot and drives sync start/stop
class UiService {
public:
    virtual ~UiService() = default;

    virtual std::expected<void, UiError> initialize() = 0;
    virtual void shutdown() = 0;

    // Runs the event loop until the user quits or shutdown_requested is set.
    // Returns the process exit code.
    virtual int run(core::Application& app, const std::atomic<bool>& shutdown_requested) = 0;

    // Qt info panel when built with Qt, console view otherwise
    static std::unique_ptr<UiService> create_default();
};

} // namespace platform
} // namespace mirror_for_plex
