#ifndef DLNACAST_ACTION_DISPATCHER_H
#define DLNACAST_ACTION_DISPATCHER_H

#include "CastTypes.h"
#include "IActionTransport.h"

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

/**
 * AVTransport actions the control point issues
 */
enum class TransportAction {
    SET_AV_TRANSPORT_URI,
    PLAY,
    PAUSE,
    STOP
};

struct ActionOutcome {
    bool success;
    std::string reason;

    ActionOutcome() : success(false) {}
    ActionOutcome(bool ok, const std::string& why) : success(ok), reason(why) {}
};

using ActionFuture = std::shared_future<ActionOutcome>;

/**
 * An issued action: its id within the dispatcher and its single outcome
 */
struct ActionInvocation {
    uint64_t id;
    ActionFuture future;

    ActionInvocation() : id(0) {}
};

/**
 * @brief Uniform asynchronous front for the action primitive
 *
 * Each invoke() yields exactly one outcome, whatever the transport does:
 * the first report wins and later ones are dropped. No retry and no
 * timeout here; both belong to the caller.
 */
class ActionDispatcher {
public:
    explicit ActionDispatcher(IActionTransport& transport);
    ~ActionDispatcher();

    ActionDispatcher(const ActionDispatcher&) = delete;
    ActionDispatcher& operator=(const ActionDispatcher&) = delete;

    ActionFuture invoke(const RendererDevice& device,
                        TransportAction action,
                        const ActionArgs& args);

    // invoke(), keeping the id for expire()
    ActionInvocation dispatch(const RendererDevice& device,
                              TransportAction action,
                              const ActionArgs& args);

    /**
     * @brief Resolve one invocation as failed before the transport reports
     *
     * The transport report and this call race for the same single outcome.
     * @return true if this call decided the outcome, false if the transport
     *         had already reported (the future then holds its outcome)
     */
    bool expire(uint64_t id, const std::string& reason);

    /**
     * @brief Fail every invocation still waiting on the transport
     */
    void cancelAll(const std::string& reason);

    /**
     * @brief cancelAll(), then fail every later invoke() at once
     */
    void close(const std::string& reason);

    size_t pendingCount() const;

    static const char* actionName(TransportAction action);

    // Standard argument lists (InstanceID 0)
    static ActionArgs setSourceArgs(const std::string& url, const std::string& metadata);
    static ActionArgs playArgs();
    static ActionArgs instanceArgs();

private:
    /**
     * One invocation. complete() is the single writer of the promise.
     */
    class PendingAction {
    public:
        PendingAction() : m_completed(false), m_future(m_promise.get_future().share()) {}

        bool complete(const ActionOutcome& outcome) {
            bool expected = false;
            if (!m_completed.compare_exchange_strong(expected, true)) {
                return false;
            }
            m_promise.set_value(outcome);
            return true;
        }

        ActionFuture future() const { return m_future; }

    private:
        std::atomic<bool> m_completed;
        std::promise<ActionOutcome> m_promise;
        ActionFuture m_future;
    };

    // Shared with transport callbacks so a late report never touches a
    // destroyed dispatcher
    struct PendingTable {
        std::mutex mutex;
        std::map<uint64_t, std::shared_ptr<PendingAction>> actions;
        bool closed = false;
        std::string closeReason;
    };

    static void finish(const std::shared_ptr<PendingTable>& table,
                       uint64_t id,
                       const std::shared_ptr<PendingAction>& pending,
                       const ActionOutcome& outcome,
                       const char* actionName);

    IActionTransport& m_transport;
    std::shared_ptr<PendingTable> m_pending;
    std::atomic<uint64_t> m_nextId;
};

#endif // DLNACAST_ACTION_DISPATCHER_H
