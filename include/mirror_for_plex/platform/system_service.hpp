#pragma once

#include <expected>
#include <memory>
#include <string>

namespace mirror_for_plex {
namespace platform {

// System error types
enum class SystemError {
    NotSupported,
    PermissionDenied,
    ResourceNotFound,
    OperationFailed,
    AlreadyExists
};

// Keeps a second mirror from driving the same player endpoint
class SingleInstanceManager {
public:
    virtual ~SingleInstanceManager() = default;

    // true when this process now owns the instance, false when another does
    virtual std::expected<bool, SystemError> try_acquire_instance() = 0;
    virtual void release_instance() = 0;
    virtual bool is_instance_acquired() const = 0;

    // Lock file under lock_dir, or the temp directory when empty
    static std::unique_ptr<SingleInstanceManager> create(const std::string& instance_name,
                                                         const std::string& lock_dir = {});
};

} // namespace platform
} // namespace mirror_for_plex
