#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <cstdint>
#include <mutex>
#include <optional>

namespace mirror_for_plex {
namespace core {

// Single-value mailbox between the sync thread and the UI; latest value wins
class SnapshotSlot {
public:
    void publish(PlaybackSnapshot snapshot) {
        std::lock_guard lock(m_mutex);
        m_snapshot = std::move(snapshot);
        ++m_version;
    }

    PlaybackSnapshot current() const {
        std::lock_guard lock(m_mutex);
        return m_snapshot;
    }

    // Returns the snapshot only when it changed since last_seen, updating last_seen
    std::optional<PlaybackSnapshot> read_if_newer(std::uint64_t& last_seen) const {
        std::lock_guard lock(m_mutex);
        if (m_version == last_seen) {
            return std::nullopt;
        }
        last_seen = m_version;
        return m_snapshot;
    }

    std::uint64_t version() const {
        std::lock_guard lock(m_mutex);
        return m_version;
    }

private:
    mutable std::mutex m_mutex;
    PlaybackSnapshot m_snapshot;
    std::uint64_t m_version = 0;
};

} // namespace core
} // namespace mirror_for_plex
