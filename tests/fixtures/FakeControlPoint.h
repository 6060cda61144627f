#ifndef DLNACAST_TESTS_FIXTURES_FAKE_CONTROL_POINT_H
#define DLNACAST_TESTS_FIXTURES_FAKE_CONTROL_POINT_H

#include "upnp/IControlPoint.h"

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace fixtures {

// How the fake answers one sendAction()
enum class Reply {
    SUCCEED,        // completion(true) before returning
    FAIL,           // completion(false, "UPnP error 701: Transition not available")
    NEVER,          // completion is held; see completeHeld()
    REFUSE_SEND,    // sendAction returns false
    DOUBLE_REPORT,  // completion(true) then completion(false)
    THROW           // sendAction throws std::runtime_error
};

struct SentAction {
    std::string deviceId;
    std::string actionName;
    ActionArgs args;

    std::string arg(const std::string& name) const;
};

// Registry entry for a renderer, with or without an AVTransport service
RegistryEntry makeRenderer(const std::string& udn,
                           const std::string& name,
                           const std::string& manufacturer = "Samsung Electronics",
                           bool withAVTransport = true);

// In-memory registry and scripted action transport.
// Replies are taken per action name from the scripted queue, then from the
// per-device default, then from the global default.
class FakeControlPoint : public IControlPoint {
public:
    FakeControlPoint();

    // IControlPoint
    bool start() override;
    void stop() override;
    bool isRunning() const override;
    bool search() override;

    std::vector<RegistryEntry> snapshot() const override;
    bool lookup(const std::string& udn, RegistryEntry& entry) const override;
    void setListener(const Listener& listener) override;

    bool sendAction(const RendererDevice& device,
                    const std::string& actionName,
                    const ActionArgs& args,
                    const Completion& onComplete) override;

    // Registry scripting (listener is notified)
    void addDevice(const RegistryEntry& entry);
    void removeDevice(const std::string& udn);

    // Transport scripting
    void setDefaultReply(Reply reply);
    void setDeviceReply(const std::string& udn, Reply reply);
    void queueReplies(const std::string& actionName, const std::vector<Reply>& replies);
    void setStartResult(bool result);

    // Fire every held completion; returns how many were fired
    int completeHeld(bool success, const std::string& error = "");

    // Assertion helpers
    std::vector<SentAction> sent() const;
    int countSent(const std::string& actionName) const;
    int startCount() const;
    int stopCount() const;
    int searchCount() const;

private:
    Reply nextReply(const std::string& udn, const std::string& actionName);

    mutable std::mutex m_mutex;
    std::vector<RegistryEntry> m_devices;
    Listener m_listener;

    Reply m_defaultReply;
    std::map<std::string, Reply> m_deviceReplies;
    std::map<std::string, std::deque<Reply>> m_queuedReplies;
    std::vector<Completion> m_held;
    std::vector<SentAction> m_sent;

    bool m_running;
    bool m_startResult;
    int m_startCount;
    int m_stopCount;
    int m_searchCount;
};

}  // namespace fixtures

#endif  // DLNACAST_TESTS_FIXTURES_FAKE_CONTROL_POINT_H
