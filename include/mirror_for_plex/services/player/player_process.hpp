#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <chrono>
#include <expected>
#include <string>
#include <vector>
#include <sys/types.h>

namespace mirror_for_plex {
namespace services {

// A child process running the local player
class PlayerProcess {
public:
    virtual ~PlayerProcess() = default;

    virtual std::expected<void, core::SyncError> spawn(const std::string& executable,
                                                       const std::vector<std::string>& args) = 0;

    // Reaps the child when it has exited
    virtual bool is_running() = 0;

    // True once the child has exited, false if still running after timeout
    virtual bool wait_for_exit(std::chrono::milliseconds timeout) = 0;

    virtual void terminate() = 0;
    virtual void kill() = 0;

    virtual pid_t pid() const = 0;
};

class PosixPlayerProcess : public PlayerProcess {
public:
    PosixPlayerProcess() = default;
    ~PosixPlayerProcess() override;

    PosixPlayerProcess(const PosixPlayerProcess&) = delete;
    PosixPlayerProcess& operator=(const PosixPlayerProcess&) = delete;

    std::expected<void, core::SyncError> spawn(const std::string& executable,
                                               const std::vector<std::string>& args) override;
    bool is_running() override;
    bool wait_for_exit(std::chrono::milliseconds timeout) override;
    void terminate() override;
    void kill() override;
    pid_t pid() const override { return m_pid; }

private:
    void send_signal(int signal);

    pid_t m_pid = -1;
};

} // namespace services
} // namespace mirror_for_plex
