#include "mirror_for_plex/services/player/player_process.hpp"
#include "mirror_for_plex/utils/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace mirror_for_plex {
namespace services {

PosixPlayerProcess::~PosixPlayerProcess() {
    // Never leave an unreaped child behind
    if (is_running()) {
        kill();
        wait_for_exit(std::chrono::milliseconds(500));
    }
}

std::expected<void, core::SyncError> PosixPlayerProcess::spawn(const std::string& executable,
                                                               const std::vector<std::string>& args) {
    if (is_running()) {
        MIRROR_LOG_WARNING("PlayerProcess", "Spawn requested while pid " + std::to_string(m_pid) + " is running");
        return std::unexpected(core::SyncError::PlayerLaunchFailure);
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(executable);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    // The child reports a failed exec through this pipe; it closes on a successful exec
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        MIRROR_LOG_ERROR("PlayerProcess", "pipe2 failed: " + std::string(strerror(errno)));
        return std::unexpected(core::SyncError::PlayerLaunchFailure);
    }

    pid_t pid = fork();
    if (pid == 0) {
        close(status_pipe[0]);
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) {
                close(devnull);
            }
        }
        setsid();
        execvp(argv[0], argv.data());
        int error = errno;
        ssize_t ignored = write(status_pipe[1], &error, sizeof(error));
        (void)ignored;
        _exit(127);
    }

    close(status_pipe[1]);
    if (pid < 0) {
        close(status_pipe[0]);
        MIRROR_LOG_ERROR("PlayerProcess", "Failed to fork process for " + executable + ": " + strerror(errno));
        return std::unexpected(core::SyncError::PlayerLaunchFailure);
    }

    int child_error = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_error, sizeof(child_error));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n > 0) {
        int status = 0;
        waitpid(pid, &status, 0);
        MIRROR_LOG_ERROR("PlayerProcess", "Cannot execute " + executable + ": " + strerror(child_error));
        return std::unexpected(core::SyncError::PlayerLaunchFailure);
    }

    m_pid = pid;
    MIRROR_LOG_INFO("PlayerProcess", "Started " + executable + " (pid " + std::to_string(m_pid) + ")");
    return {};
}

bool PosixPlayerProcess::is_running() {
    if (m_pid <= 0) {
        return false;
    }

    int status = 0;
    pid_t result = waitpid(m_pid, &status, WNOHANG);
    if (result == 0) {
        return true;
    }

    if (result == m_pid) {
        if (WIFEXITED(status)) {
            MIRROR_LOG_INFO("PlayerProcess", "Player exited with code " + std::to_string(WEXITSTATUS(status)));
        } else if (WIFSIGNALED(status)) {
            MIRROR_LOG_INFO("PlayerProcess", "Player terminated by signal " + std::to_string(WTERMSIG(status)));
        }
    }
    m_pid = -1;
    return false;
}

bool PosixPlayerProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (is_running()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

void PosixPlayerProcess::terminate() {
    send_signal(SIGTERM);
}

void PosixPlayerProcess::kill() {
    send_signal(SIGKILL);
}

void PosixPlayerProcess::send_signal(int signal) {
    if (m_pid <= 0) {
        return;
    }
    if (::kill(m_pid, signal) != 0 && errno != ESRCH) {
        MIRROR_LOG_WARNING("PlayerProcess", "kill(" + std::to_string(m_pid) + ", " + std::to_string(signal) +
                           ") failed: " + strerror(errno));
    }
}

} // namespace services
} // namespace mirror_for_plex
