#pragma once

#include "IControlPoint.h"

#include <upnp/upnp.h>
#include <upnp/ixml.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

/**
 * UPnP control point using libupnp
 *
 * Handles:
 * - SSDP search and advertisements (MediaRenderer devices)
 * - Device description download, renderer table with max-age expiry
 * - Asynchronous SOAP actions (AVTransport)
 */
class UPnPControlPoint : public IControlPoint {
public:
    static constexpr const char* MEDIA_RENDERER_TYPE = "urn:schemas-upnp-org:device:MediaRenderer:1";

    struct Config {
        std::string friendlyName;
        int port;
        std::string networkInterface;
        int searchMX;             // seconds renderers may wait before answering
        int expiryCheckSeconds;   // period of the expiry sweep

        Config()
            : friendlyName("DLNA Cast")
            , port(0)  // 0 = auto
            , networkInterface("")  // Empty = auto-detect
            , searchMX(5)
            , expiryCheckSeconds(30)
        {}
    };

    UPnPControlPoint(const Config& config);
    ~UPnPControlPoint();

    // Lifecycle
    bool start() override;
    void stop() override;
    bool isRunning() const override { return m_running; }
    bool search() override;

    // IRendererRegistry
    std::vector<RegistryEntry> snapshot() const override;
    bool lookup(const std::string& udn, RegistryEntry& entry) const override;
    void setListener(const Listener& listener) override;

    // IActionTransport
    bool sendAction(const RendererDevice& device,
                    const std::string& actionName,
                    const ActionArgs& args,
                    const Completion& onComplete) override;

    // Getters
    std::string getIPAddress() const;
    int getPort() const;

    /**
     * Fill entry from the <device> element whose <UDN> equals udn.
     * Fields and services of other devices in the same description are
     * not read.
     *
     * @return false if the description has no such device
     */
    static bool parseDescription(IXML_Document* doc,
                                 const std::string& udn,
                                 const std::string& location,
                                 RegistryEntry& entry);

private:
    struct TrackedDevice {
        RegistryEntry entry;
        std::chrono::steady_clock::time_point expiresAt;
    };

    // Owned by libupnp between UpnpSendActionAsync and its completion
    struct ActionCookie {
        Completion onComplete;
        std::string actionName;
        std::string deviceName;
    };

    // libupnp callbacks (static)
    static int upnpCallbackStatic(Upnp_EventType eventType,
                                  const void* event,
                                  void* cookie);
    static int actionCallbackStatic(Upnp_EventType eventType,
                                    const void* event,
                                    void* cookie);

    // Instance callback
    int upnpCallback(Upnp_EventType eventType, const void* event);

    // Handlers
    void handleDiscovery(const UpnpDiscovery* discovery);
    void handleByeBye(const UpnpDiscovery* discovery);

    bool fetchDescription(const std::string& location, const std::string& udn, RegistryEntry& entry);
    static bool isRenderer(const RegistryEntry& entry);

    void removeDevice(const std::string& udn, const char* reason);
    void notifyAdded(const RegistryEntry& entry);
    void notifyRemoved(const std::string& udn);

    // Thread functions
    void expiryThreadFunc();

    // Helpers
    static std::string getFirstDocumentItem(IXML_Document* doc, const char* item);
    static IXML_Node* findDeviceNode(IXML_Document* doc, const std::string& udn);
    static IXML_Node* getChild(IXML_Node* parent, const char* name);
    static std::string getChildText(IXML_Node* parent, const char* name);
    static std::string resolveURL(const std::string& base, const std::string& relative);
    static std::string describeActionError(int errCode, IXML_Document* result);

    // Configuration
    Config m_config;

    // libupnp handles
    UpnpClient_Handle m_clientHandle;
    std::atomic<bool> m_running;
    std::string m_ipAddress;
    int m_actualPort;

    // Renderer table, insertion order
    std::vector<TrackedDevice> m_devices;
    std::set<std::string> m_ignored;  // UDNs that are not renderers
    mutable std::mutex m_devicesMutex;

    Listener m_listener;
    std::mutex m_listenerMutex;

    // Expiry sweep
    std::thread m_expiryThread;
    std::mutex m_expiryMutex;
    std::condition_variable m_expiryCv;

    mutable std::mutex m_stateMutex;
};
