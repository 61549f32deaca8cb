/**
 * @file StopToken.hpp
 * @brief Cooperative cancellation signal shared between a controller and a loop.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace dualtap::application {

/**
 * @class StopToken
 * @brief Set once by requestStop(); waiters wake immediately.
 */
class StopToken {
public:
    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopRequested = true;
        }
        m_cv.notify_all();
    }

    bool stopRequested() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stopRequested;
    }

    /**
     * @brief Sleeps for up to the given duration.
     * @return True if a stop was requested before or during the wait.
     */
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, duration, [this] { return m_stopRequested; });
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopRequested = false;
};

} // namespace dualtap::application
