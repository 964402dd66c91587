#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace mirror_for_plex {
namespace utils {

// Sleeps for the given duration or until stop is requested on the token.
// Returns false when the sleep was cut short by a stop request.
template<typename Rep, typename Period>
bool sleep_for(std::chrono::duration<Rep, Period> duration, std::stop_token stop_token) {
    if (stop_token.stop_requested()) {
        return false;
    }
    if (duration <= duration.zero()) {
        return true;
    }

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    const bool stopped = cv.wait_for(lock, stop_token, duration, [] { return false; });
    return !stopped && !stop_token.stop_requested();
}

} // namespace utils
} // namespace mirror_for_plex
