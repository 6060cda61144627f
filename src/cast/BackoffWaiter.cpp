#include "BackoffWaiter.h"

bool InterruptibleBackoffWaiter::waitFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return !m_cv.wait_for(lock, delay, [this] { return m_interrupted; });
}

void InterruptibleBackoffWaiter::interrupt() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_interrupted = true;
    }
    m_cv.notify_all();
}
