#include "ActionDispatcher.h"
#include "Logging.h"

#include <exception>
#include <vector>

ActionDispatcher::ActionDispatcher(IActionTransport& transport)
    : m_transport(transport)
    , m_pending(std::make_shared<PendingTable>())
    , m_nextId(1)
{
}

ActionDispatcher::~ActionDispatcher() {
    cancelAll("Dispatcher destroyed");
}

const char* ActionDispatcher::actionName(TransportAction action) {
    switch (action) {
        case TransportAction::SET_AV_TRANSPORT_URI: return "SetAVTransportURI";
        case TransportAction::PLAY:                 return "Play";
        case TransportAction::PAUSE:                return "Pause";
        case TransportAction::STOP:                 return "Stop";
    }
    return "Unknown";
}

ActionArgs ActionDispatcher::setSourceArgs(const std::string& url, const std::string& metadata) {
    return {
        {"InstanceID", "0"},
        {"CurrentURI", url},
        {"CurrentURIMetaData", metadata}
    };
}

ActionArgs ActionDispatcher::playArgs() {
    return {
        {"InstanceID", "0"},
        {"Speed", "1"}
    };
}

ActionArgs ActionDispatcher::instanceArgs() {
    return {
        {"InstanceID", "0"}
    };
}

void ActionDispatcher::finish(const std::shared_ptr<PendingTable>& table,
                              uint64_t id,
                              const std::shared_ptr<PendingAction>& pending,
                              const ActionOutcome& outcome,
                              const char* actionName)
{
    if (!pending->complete(outcome)) {
        DEBUG_LOG("[ActionDispatcher] Duplicate " << actionName << " report ignored (#" << id << ")");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(table->mutex);
        table->actions.erase(id);
    }

    if (outcome.success) {
        DEBUG_LOG("[ActionDispatcher] ✓ " << actionName << " #" << id << " succeeded");
    } else {
        DEBUG_LOG("[ActionDispatcher] " << actionName << " #" << id << " failed: " << outcome.reason);
    }
}

ActionFuture ActionDispatcher::invoke(const RendererDevice& device,
                                      TransportAction action,
                                      const ActionArgs& args)
{
    return dispatch(device, action, args).future;
}

ActionInvocation ActionDispatcher::dispatch(const RendererDevice& device,
                                            TransportAction action,
                                            const ActionArgs& args)
{
    const uint64_t id = m_nextId.fetch_add(1);
    const char* name = actionName(action);
    auto pending = std::make_shared<PendingAction>();

    ActionInvocation invocation;
    invocation.id = id;
    invocation.future = pending->future();

    {
        std::lock_guard<std::mutex> lock(m_pending->mutex);
        if (m_pending->closed) {
            pending->complete(ActionOutcome(false, m_pending->closeReason));
            return invocation;
        }
        m_pending->actions[id] = pending;
    }

    DEBUG_LOG("[ActionDispatcher] " << name << " #" << id << " -> " << device.name);

    std::shared_ptr<PendingTable> table = m_pending;
    IActionTransport::Completion completion =
        [table, id, pending, name](bool success, const std::string& error) {
            finish(table, id, pending, ActionOutcome(success, success ? "" : error), name);
        };

    bool sent = false;
    try {
        sent = m_transport.sendAction(device, name, args, completion);
    } catch (const std::exception& e) {
        std::cerr << "[ActionDispatcher] ❌ " << name << " transport error: " << e.what() << std::endl;
        finish(table, id, pending,
               ActionOutcome(false, std::string("Transport error: ") + e.what()), name);
        return invocation;
    }

    if (!sent) {
        finish(table, id, pending,
               ActionOutcome(false, std::string("Could not send ") + name + " to " + device.name), name);
    }

    return invocation;
}

bool ActionDispatcher::expire(uint64_t id, const std::string& reason) {
    std::shared_ptr<PendingAction> pending;
    {
        std::lock_guard<std::mutex> lock(m_pending->mutex);
        auto it = m_pending->actions.find(id);
        if (it == m_pending->actions.end()) {
            return false;
        }
        pending = it->second;
        m_pending->actions.erase(it);
    }

    if (!pending->complete(ActionOutcome(false, reason))) {
        return false;
    }

    DEBUG_LOG("[ActionDispatcher] #" << id << " expired: " << reason);
    return true;
}

void ActionDispatcher::cancelAll(const std::string& reason) {
    std::vector<std::pair<uint64_t, std::shared_ptr<PendingAction>>> cancelled;
    {
        std::lock_guard<std::mutex> lock(m_pending->mutex);
        for (const auto& entry : m_pending->actions) {
            cancelled.push_back(entry);
        }
        m_pending->actions.clear();
    }

    if (!cancelled.empty()) {
        std::cout << "[ActionDispatcher] Cancelling " << cancelled.size()
                  << " pending action(s): " << reason << std::endl;
    }

    for (const auto& entry : cancelled) {
        entry.second->complete(ActionOutcome(false, reason));
    }
}

void ActionDispatcher::close(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(m_pending->mutex);
        m_pending->closed = true;
        m_pending->closeReason = reason;
    }
    cancelAll(reason);
}

size_t ActionDispatcher::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_pending->mutex);
    return m_pending->actions.size();
}
