#ifndef DLNACAST_BACKOFF_WAITER_H
#define DLNACAST_BACKOFF_WAITER_H

#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * Sleeps between cast attempts.
 * Production: InterruptibleBackoffWaiter. Tests record the delays instead.
 */
class IBackoffWaiter {
public:
    virtual ~IBackoffWaiter() = default;

    /**
     * @return false if interrupted before the delay elapsed
     */
    virtual bool waitFor(std::chrono::milliseconds delay) = 0;

    // Wake every current and future waiter
    virtual void interrupt() = 0;
};

class InterruptibleBackoffWaiter : public IBackoffWaiter {
public:
    InterruptibleBackoffWaiter() : m_interrupted(false) {}

    bool waitFor(std::chrono::milliseconds delay) override;
    void interrupt() override;

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_interrupted;
};

#endif // DLNACAST_BACKOFF_WAITER_H
