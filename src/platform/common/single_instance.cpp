#include "mirror_for_plex/platform/system_service.hpp"
#include "mirror_for_plex/utils/logger.hpp"

#ifdef USE_QT_UI
#include <QDir>
#include <QLockFile>
#include <QStandardPaths>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

#include <cstdlib>
#include <filesystem>

namespace mirror_for_plex {
namespace platform {

class SingleInstanceManagerImpl : public SingleInstanceManager {
public:
    SingleInstanceManagerImpl(const std::string& instance_name, const std::string& lock_dir)
        : m_instance_name(instance_name) {
        MIRROR_LOG_DEBUG("SingleInstance", "Creating single instance manager for: " + instance_name);

        std::string dir = lock_dir;
        if (dir.empty()) {
#ifdef USE_QT_UI
            dir = QStandardPaths::writableLocation(QStandardPaths::TempLocation).toStdString();
#else
            const char* tmp_dir = std::getenv("TMPDIR");
            dir = tmp_dir ? tmp_dir : "/tmp";
#endif
        }
        m_lock_file_path = (std::filesystem::path(dir) / (instance_name + ".lock")).string();

#ifdef USE_QT_UI
        m_lock_file = std::make_unique<QLockFile>(QString::fromStdString(m_lock_file_path));
        m_lock_file->setStaleLockTime(0);
#endif
    }

    ~SingleInstanceManagerImpl() override {
        release_instance();
    }

    std::expected<bool, SystemError> try_acquire_instance() override {
        if (m_acquired) {
            return true;
        }

        MIRROR_LOG_DEBUG("SingleInstance", "Attempting to acquire " + m_lock_file_path);

#ifdef USE_QT_UI
        m_acquired = m_lock_file->tryLock(0);
        if (!m_acquired && m_lock_file->error() != QLockFile::LockFailedError) {
            MIRROR_LOG_ERROR("SingleInstance", "Failed to acquire lock: " +
                             std::to_string(static_cast<int>(m_lock_file->error())));
            return std::unexpected(SystemError::OperationFailed);
        }
#else
        m_lock_fd = open(m_lock_file_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (m_lock_fd == -1) {
            const int error = errno;
            MIRROR_LOG_ERROR("SingleInstance", "Failed to create lock file: " + std::string(std::strerror(error)));
            return std::unexpected(error == EACCES ? SystemError::PermissionDenied : SystemError::OperationFailed);
        }

        m_acquired = flock(m_lock_fd, LOCK_EX | LOCK_NB) != -1;
        if (!m_acquired) {
            close(m_lock_fd);
            m_lock_fd = -1;
        }
#endif

        if (m_acquired) {
            MIRROR_LOG_DEBUG("SingleInstance", "Acquired instance " + m_instance_name);
        } else {
            MIRROR_LOG_INFO("SingleInstance", "Another instance is already running");
        }

        return m_acquired;
    }

    void release_instance() override {
        if (!m_acquired) {
            return;
        }

        MIRROR_LOG_DEBUG("SingleInstance", "Releasing instance");

#ifdef USE_QT_UI
        m_lock_file->unlock();
#else
        if (m_lock_fd != -1) {
            flock(m_lock_fd, LOCK_UN);
            close(m_lock_fd);
            m_lock_fd = -1;
            unlink(m_lock_file_path.c_str());
        }
#endif

        m_acquired = false;
    }

    bool is_instance_acquired() const override {
        return m_acquired;
    }

private:
    std::string m_instance_name;
    std::string m_lock_file_path;
    bool m_acquired = false;

#ifdef USE_QT_UI
    std::unique_ptr<QLockFile> m_lock_file;
#else
    int m_lock_fd = -1;
#endif
};

std::unique_ptr<SingleInstanceManager> SingleInstanceManager::create(const std::string& instance_name,
                                                                     const std::string& lock_dir) {
    return std::make_unique<SingleInstanceManagerImpl>(instance_name, lock_dir);
}

} // namespace platform
} // namespace mirror_for_plex
