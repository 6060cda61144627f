#ifndef DLNACAST_TESTS_FIXTURES_RECORDING_BACKOFF_WAITER_H
#define DLNACAST_TESTS_FIXTURES_RECORDING_BACKOFF_WAITER_H

#include "cast/BackoffWaiter.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <vector>

namespace fixtures {

// Records requested delays and returns immediately.
// onWait runs inside waitFor(), before the interrupted flag is read.
class RecordingBackoffWaiter : public IBackoffWaiter {
public:
    RecordingBackoffWaiter() : m_interrupted(false) {}

    bool waitFor(std::chrono::milliseconds delay) override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_delays.push_back(delay);
            hook = m_onWait;
        }
        if (hook) {
            hook();
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        return !m_interrupted;
    }

    void interrupt() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_interrupted = true;
    }

    void setOnWait(const std::function<void()>& hook) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_onWait = hook;
    }

    std::vector<std::chrono::milliseconds> delays() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_delays;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::chrono::milliseconds> m_delays;
    std::function<void()> m_onWait;
    bool m_interrupted;
};

}  // namespace fixtures

#endif  // DLNACAST_TESTS_FIXTURES_RECORDING_BACKOFF_WAITER_H
