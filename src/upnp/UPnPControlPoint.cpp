#include "UPnPControlPoint.h"
#include "Logging.h"

#include <upnp/upnptools.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>

static const char* const AVTRANSPORT_SERVICE_PREFIX = "urn:schemas-upnp-org:service:AVTransport";
static const int DEFAULT_MAX_AGE = 1800;  // seconds, when the announcement carries none

UPnPControlPoint::UPnPControlPoint(const Config& config)
    : m_config(config)
    , m_clientHandle(-1)
    , m_running(false)
    , m_actualPort(0)
{
    DEBUG_LOG("[UPnPControlPoint] Created: " << m_config.friendlyName);
}

UPnPControlPoint::~UPnPControlPoint() {
    stop();
    DEBUG_LOG("[UPnPControlPoint] Destroyed");
}

// ============================================================================
// Lifecycle
// ============================================================================

bool UPnPControlPoint::start() {
    std::lock_guard<std::mutex> lock(m_stateMutex);

    if (m_running) {
        std::cerr << "[UPnPControlPoint] Already running" << std::endl;
        return false;
    }

    std::cout << "[UPnPControlPoint] Starting..." << std::endl;

    // 1. Initialize libupnp
    const char* ifName = m_config.networkInterface.empty() ? nullptr : m_config.networkInterface.c_str();
    int ret = UpnpInit2(ifName, m_config.port);
    if (ret != UPNP_E_SUCCESS) {
        std::cerr << "[UPnPControlPoint] UpnpInit2 failed: " << UpnpGetErrorMessage(ret)
                  << " (" << ret << ")" << std::endl;
        return false;
    }

    // 2. Get server info
    m_ipAddress = UpnpGetServerIpAddress();
    m_actualPort = UpnpGetServerPort();

    std::cout << "[UPnPControlPoint] Listening on " << m_ipAddress
              << ":" << m_actualPort << std::endl;

    // 3. Register as control point
    ret = UpnpRegisterClient(upnpCallbackStatic, this, &m_clientHandle);
    if (ret != UPNP_E_SUCCESS) {
        std::cerr << "[UPnPControlPoint] UpnpRegisterClient failed: "
                  << UpnpGetErrorMessage(ret) << " (" << ret << ")" << std::endl;
        m_clientHandle = -1;
        UpnpFinish();
        return false;
    }

    m_running = true;

    // 4. Expiry sweep
    m_expiryThread = std::thread(&UPnPControlPoint::expiryThreadFunc, this);

    std::cout << "[UPnPControlPoint] ✓ Control point registered (handle="
              << m_clientHandle << ")" << std::endl;

    // 5. First search
    ret = UpnpSearchAsync(m_clientHandle, m_config.searchMX, MEDIA_RENDERER_TYPE, this);
    if (ret != UPNP_E_SUCCESS) {
        std::cerr << "[UPnPControlPoint] ⚠️  UpnpSearchAsync failed: "
                  << UpnpGetErrorMessage(ret) << std::endl;
    }

    return true;
}

void UPnPControlPoint::stop() {
    std::lock_guard<std::mutex> lock(m_stateMutex);

    if (!m_running) {
        return;
    }

    std::cout << "[UPnPControlPoint] Stopping..." << std::endl;

    {
        std::lock_guard<std::mutex> expiryLock(m_expiryMutex);
        m_running = false;
    }
    m_expiryCv.notify_all();

    if (m_expiryThread.joinable()) {
        m_expiryThread.join();
    }

    if (m_clientHandle >= 0) {
        UpnpUnRegisterClient(m_clientHandle);
        m_clientHandle = -1;
    }

    // Cleanup libupnp
    UpnpFinish();

    {
        std::lock_guard<std::mutex> devicesLock(m_devicesMutex);
        m_devices.clear();
        m_ignored.clear();
    }

    std::cout << "[UPnPControlPoint] ✓ Stopped" << std::endl;
}

bool UPnPControlPoint::search() {
    std::lock_guard<std::mutex> lock(m_stateMutex);

    if (!m_running) {
        std::cerr << "[UPnPControlPoint] Cannot search: not running" << std::endl;
        return false;
    }

    int ret = UpnpSearchAsync(m_clientHandle, m_config.searchMX, MEDIA_RENDERER_TYPE, this);
    if (ret != UPNP_E_SUCCESS) {
        std::cerr << "[UPnPControlPoint] UpnpSearchAsync failed: "
                  << UpnpGetErrorMessage(ret) << std::endl;
        return false;
    }

    DEBUG_LOG("[UPnPControlPoint] 🔍 Searching for " << MEDIA_RENDERER_TYPE
              << " (MX=" << m_config.searchMX << "s)");
    return true;
}

std::string UPnPControlPoint::getIPAddress() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_ipAddress;
}

int UPnPControlPoint::getPort() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_actualPort;
}

// ============================================================================
// Registry
// ============================================================================

std::vector<RegistryEntry> UPnPControlPoint::snapshot() const {
    std::lock_guard<std::mutex> lock(m_devicesMutex);
    std::vector<RegistryEntry> entries;
    entries.reserve(m_devices.size());
    for (const auto& tracked : m_devices) {
        entries.push_back(tracked.entry);
    }
    return entries;
}

bool UPnPControlPoint::lookup(const std::string& udn, RegistryEntry& entry) const {
    std::lock_guard<std::mutex> lock(m_devicesMutex);
    for (const auto& tracked : m_devices) {
        if (tracked.entry.udn == udn) {
            entry = tracked.entry;
            return true;
        }
    }
    return false;
}

void UPnPControlPoint::setListener(const Listener& listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listener = listener;
}

void UPnPControlPoint::notifyAdded(const RegistryEntry& entry) {
    DeviceAddedCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        callback = m_listener.onDeviceAdded;
    }
    if (callback) {
        callback(entry);
    }
}

void UPnPControlPoint::notifyRemoved(const std::string& udn) {
    DeviceRemovedCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        callback = m_listener.onDeviceRemoved;
    }
    if (callback) {
        callback(udn);
    }
}

void UPnPControlPoint::removeDevice(const std::string& udn, const char* reason) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(m_devicesMutex);
        for (auto it = m_devices.begin(); it != m_devices.end(); ++it) {
            if (it->entry.udn == udn) {
                m_devices.erase(it);
                removed = true;
                break;
            }
        }
    }

    if (removed) {
        std::cout << "[UPnPControlPoint] Renderer lost (" << reason << "): " << udn << std::endl;
        notifyRemoved(udn);
    }
}

// ============================================================================
// libupnp callbacks
// ============================================================================

// Static callback dispatcher
int UPnPControlPoint::upnpCallbackStatic(Upnp_EventType eventType,
                                         const void* event,
                                         void* cookie)
{
    UPnPControlPoint* controlPoint = static_cast<UPnPControlPoint*>(cookie);
    return controlPoint->upnpCallback(eventType, event);
}

// Instance callback
int UPnPControlPoint::upnpCallback(Upnp_EventType eventType, const void* event) {
    if (!m_running) {
        return UPNP_E_SUCCESS;
    }

    switch (eventType) {
        case UPNP_DISCOVERY_ADVERTISEMENT_ALIVE:
        case UPNP_DISCOVERY_SEARCH_RESULT:
            handleDiscovery(static_cast<const UpnpDiscovery*>(event));
            break;

        case UPNP_DISCOVERY_ADVERTISEMENT_BYEBYE:
            handleByeBye(static_cast<const UpnpDiscovery*>(event));
            break;

        case UPNP_DISCOVERY_SEARCH_TIMEOUT:
            DEBUG_LOG("[UPnPControlPoint] Search window closed");
            break;

        default:
            // Other events ignored
            break;
    }

    return UPNP_E_SUCCESS;
}

void UPnPControlPoint::handleDiscovery(const UpnpDiscovery* discovery) {
    int errCode = UpnpDiscovery_get_ErrCode(discovery);
    if (errCode != UPNP_E_SUCCESS) {
        std::cerr << "[UPnPControlPoint] Discovery error: " << UpnpGetErrorMessage(errCode) << std::endl;
        return;
    }

    std::string udn = UpnpDiscovery_get_DeviceID_cstr(discovery);
    std::string location = UpnpDiscovery_get_Location_cstr(discovery);
    int maxAge = UpnpDiscovery_get_Expires(discovery);

    if (udn.empty() || location.empty()) {
        return;
    }

    auto expiresAt = std::chrono::steady_clock::now() +
                     std::chrono::seconds(maxAge > 0 ? maxAge : DEFAULT_MAX_AGE);

    // Known device: refresh its lease only
    {
        std::lock_guard<std::mutex> lock(m_devicesMutex);
        for (auto& tracked : m_devices) {
            if (tracked.entry.udn == udn) {
                tracked.expiresAt = expiresAt;
                tracked.entry.location = location;
                return;
            }
        }
        if (m_ignored.count(udn)) {
            return;
        }
    }

    RegistryEntry entry;
    if (!fetchDescription(location, udn, entry)) {
        return;
    }

    if (!isRenderer(entry)) {
        DEBUG_LOG("[UPnPControlPoint] Ignoring " << entry.deviceType << " at " << location);
        std::lock_guard<std::mutex> lock(m_devicesMutex);
        m_ignored.insert(udn);
        return;
    }

    // Several announcements of one device may race through the download
    {
        std::lock_guard<std::mutex> lock(m_devicesMutex);
        for (auto& tracked : m_devices) {
            if (tracked.entry.udn == udn) {
                tracked.expiresAt = expiresAt;
                return;
            }
        }
        TrackedDevice tracked;
        tracked.entry = entry;
        tracked.expiresAt = expiresAt;
        m_devices.push_back(tracked);
    }

    std::cout << "[UPnPControlPoint] ✓ Renderer found: " << entry.friendlyName
              << " (" << entry.manufacturer << " " << entry.modelName << ")" << std::endl;
    DEBUG_LOG("[UPnPControlPoint]   UDN: " << udn);
    DEBUG_LOG("[UPnPControlPoint]   Location: " << location);

    notifyAdded(entry);
}

void UPnPControlPoint::handleByeBye(const UpnpDiscovery* discovery) {
    std::string udn = UpnpDiscovery_get_DeviceID_cstr(discovery);
    if (udn.empty()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_devicesMutex);
        m_ignored.erase(udn);
    }
    removeDevice(udn, "byebye");
}

// ============================================================================
// Device description
// ============================================================================

bool UPnPControlPoint::fetchDescription(const std::string& location,
                                        const std::string& udn,
                                        RegistryEntry& entry)
{
    IXML_Document* doc = nullptr;
    int ret = UpnpDownloadXmlDoc(location.c_str(), &doc);
    if (ret != UPNP_E_SUCCESS || !doc) {
        std::cerr << "[UPnPControlPoint] Failed to fetch description " << location
                  << ": " << UpnpGetErrorMessage(ret) << std::endl;
        return false;
    }

    bool parsed = parseDescription(doc, udn, location, entry);
    ixmlDocument_free(doc);

    if (!parsed) {
        std::cerr << "[UPnPControlPoint] ⚠️  No device " << udn << " in description "
                  << location << std::endl;
    }
    return parsed;
}

bool UPnPControlPoint::parseDescription(IXML_Document* doc,
                                        const std::string& udn,
                                        const std::string& location,
                                        RegistryEntry& entry)
{
    // A root description nests embedded devices under <deviceList>; only
    // the <device> carrying the announced UDN describes this entry
    IXML_Node* device = findDeviceNode(doc, udn);
    if (!device) {
        return false;
    }

    entry.udn = udn;
    entry.location = location;
    entry.deviceType = getChildText(device, "deviceType");
    entry.friendlyName = getChildText(device, "friendlyName");
    entry.manufacturer = getChildText(device, "manufacturer");
    entry.modelName = getChildText(device, "modelName");
    entry.services.clear();

    // Relative control URLs resolve against URLBase, else the description URL
    std::string base = getFirstDocumentItem(doc, "URLBase");
    if (base.empty()) {
        base = location;
    }

    IXML_Node* serviceList = getChild(device, "serviceList");
    if (!serviceList) {
        return true;
    }

    for (IXML_Node* node = ixmlNode_getFirstChild(serviceList); node; node = ixmlNode_getNextSibling(node)) {
        if (ixmlNode_getNodeType(node) != eELEMENT_NODE ||
            std::string(ixmlNode_getNodeName(node)) != "service") {
            continue;
        }

        RegistryService service;
        service.serviceType = getChildText(node, "serviceType");
        service.serviceId = getChildText(node, "serviceId");
        service.controlURL = resolveURL(base, getChildText(node, "controlURL"));
        entry.services.push_back(service);
    }

    return true;
}

IXML_Node* UPnPControlPoint::findDeviceNode(IXML_Document* doc, const std::string& udn) {
    IXML_NodeList* devices = ixmlDocument_getElementsByTagName(doc, (char*)"device");
    if (!devices) {
        return nullptr;
    }

    IXML_Node* match = nullptr;
    unsigned long count = ixmlNodeList_length(devices);
    for (unsigned long i = 0; i < count && !match; ++i) {
        IXML_Node* node = ixmlNodeList_item(devices, i);
        if (node && getChildText(node, "UDN") == udn) {
            match = node;
        }
    }

    ixmlNodeList_free(devices);
    return match;
}

bool UPnPControlPoint::isRenderer(const RegistryEntry& entry) {
    if (entry.deviceType.find("MediaRenderer") != std::string::npos) {
        return true;
    }
    for (const auto& service : entry.services) {
        if (service.serviceType.compare(0, std::char_traits<char>::length(AVTRANSPORT_SERVICE_PREFIX),
                                        AVTRANSPORT_SERVICE_PREFIX) == 0) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Expiry
// ============================================================================

void UPnPControlPoint::expiryThreadFunc() {
    DEBUG_LOG("[UPnPControlPoint] Expiry thread started");

    std::unique_lock<std::mutex> lock(m_expiryMutex);
    while (m_running) {
        m_expiryCv.wait_for(lock, std::chrono::seconds(m_config.expiryCheckSeconds),
                            [this] { return !m_running; });
        if (!m_running) {
            break;
        }

        std::vector<std::string> expired;
        {
            std::lock_guard<std::mutex> devicesLock(m_devicesMutex);
            auto now = std::chrono::steady_clock::now();
            for (const auto& tracked : m_devices) {
                if (tracked.expiresAt <= now) {
                    expired.push_back(tracked.entry.udn);
                }
            }
        }

        lock.unlock();
        for (const auto& udn : expired) {
            removeDevice(udn, "max-age elapsed");
        }
        lock.lock();
    }

    DEBUG_LOG("[UPnPControlPoint] Expiry thread stopped");
}

// ============================================================================
// Actions
// ============================================================================

bool UPnPControlPoint::sendAction(const RendererDevice& device,
                                  const std::string& actionName,
                                  const ActionArgs& args,
                                  const Completion& onComplete)
{
    if (!m_running) {
        std::cerr << "[UPnPControlPoint] Cannot send " << actionName << ": not running" << std::endl;
        return false;
    }

    if (device.avTransportControlURL.empty()) {
        std::cerr << "[UPnPControlPoint] Cannot send " << actionName << " to "
                  << device.name << ": no control URL" << std::endl;
        return false;
    }

    const char* serviceType = device.avTransportServiceType.c_str();

    IXML_Document* action = UpnpMakeAction(actionName.c_str(), serviceType, 0, nullptr);
    if (!action) {
        std::cerr << "[UPnPControlPoint] UpnpMakeAction failed for " << actionName << std::endl;
        return false;
    }

    for (const auto& arg : args) {
        int ret = UpnpAddToAction(&action, actionName.c_str(), serviceType,
                                  arg.first.c_str(), arg.second.c_str());
        if (ret != UPNP_E_SUCCESS) {
            std::cerr << "[UPnPControlPoint] UpnpAddToAction(" << arg.first << ") failed: "
                      << UpnpGetErrorMessage(ret) << std::endl;
            ixmlDocument_free(action);
            return false;
        }
    }

    std::unique_ptr<ActionCookie> cookie(new ActionCookie());
    cookie->onComplete = onComplete;
    cookie->actionName = actionName;
    cookie->deviceName = device.name;

    DEBUG_LOG("[UPnPControlPoint] → " << actionName << " to " << device.name
              << " (" << device.avTransportControlURL << ")");

    int ret = UpnpSendActionAsync(m_clientHandle,
                                  device.avTransportControlURL.c_str(),
                                  serviceType,
                                  nullptr,
                                  action,
                                  actionCallbackStatic,
                                  cookie.get());
    ixmlDocument_free(action);

    if (ret != UPNP_E_SUCCESS) {
        std::cerr << "[UPnPControlPoint] UpnpSendActionAsync(" << actionName << ") failed: "
                  << UpnpGetErrorMessage(ret) << std::endl;
        return false;
    }

    // libupnp hands the cookie back to actionCallbackStatic
    cookie.release();
    return true;
}

int UPnPControlPoint::actionCallbackStatic(Upnp_EventType eventType,
                                           const void* event,
                                           void* cookie)
{
    std::unique_ptr<ActionCookie> pending(static_cast<ActionCookie*>(cookie));
    if (!pending) {
        return UPNP_E_SUCCESS;
    }

    if (eventType != UPNP_CONTROL_ACTION_COMPLETE) {
        if (pending->onComplete) {
            pending->onComplete(false, "Unexpected event for " + pending->actionName);
        }
        return UPNP_E_SUCCESS;
    }

    const UpnpActionComplete* complete = static_cast<const UpnpActionComplete*>(event);
    int errCode = UpnpActionComplete_get_ErrCode(complete);

    if (errCode == UPNP_E_SUCCESS) {
        DEBUG_LOG("[UPnPControlPoint] ← " << pending->actionName << " OK (" << pending->deviceName << ")");
        if (pending->onComplete) {
            pending->onComplete(true, "");
        }
        return UPNP_E_SUCCESS;
    }

    std::string error = describeActionError(errCode, UpnpActionComplete_get_ActionResult(complete));
    std::cerr << "[UPnPControlPoint] ← " << pending->actionName << " failed on "
              << pending->deviceName << ": " << error << std::endl;
    if (pending->onComplete) {
        pending->onComplete(false, error);
    }
    return UPNP_E_SUCCESS;
}

// ============================================================================
// Helpers
// ============================================================================

std::string UPnPControlPoint::getFirstDocumentItem(IXML_Document* doc, const char* item) {
    IXML_NodeList* nodeList = ixmlDocument_getElementsByTagName(doc, (char*)item);
    if (!nodeList) return "";

    IXML_Node* node = ixmlNodeList_item(nodeList, 0);
    std::string value;
    if (node) {
        IXML_Node* textNode = ixmlNode_getFirstChild(node);
        if (textNode && ixmlNode_getNodeValue(textNode)) {
            value = ixmlNode_getNodeValue(textNode);
        }
    }

    ixmlNodeList_free(nodeList);
    return value;
}

IXML_Node* UPnPControlPoint::getChild(IXML_Node* parent, const char* name) {
    for (IXML_Node* node = ixmlNode_getFirstChild(parent); node; node = ixmlNode_getNextSibling(node)) {
        if (ixmlNode_getNodeType(node) == eELEMENT_NODE &&
            std::string(ixmlNode_getNodeName(node)) == name) {
            return node;
        }
    }
    return nullptr;
}

std::string UPnPControlPoint::getChildText(IXML_Node* parent, const char* name) {
    IXML_Node* node = getChild(parent, name);
    if (!node) return "";

    IXML_Node* textNode = ixmlNode_getFirstChild(node);
    if (textNode && ixmlNode_getNodeValue(textNode)) {
        return ixmlNode_getNodeValue(textNode);
    }
    return "";
}

std::string UPnPControlPoint::resolveURL(const std::string& base, const std::string& relative) {
    if (relative.empty()) {
        return "";
    }

    char* absolute = nullptr;
    int ret = UpnpResolveURL2(base.c_str(), relative.c_str(), &absolute);
    if (ret != UPNP_E_SUCCESS || !absolute) {
        return relative;
    }

    std::string result(absolute);
    free(absolute);
    return result;
}

std::string UPnPControlPoint::describeActionError(int errCode, IXML_Document* result) {
    std::ostringstream ss;

    // Positive codes are UPnP errors returned in a SOAP fault
    if (errCode > 0) {
        ss << "UPnP error " << errCode;
        if (result) {
            std::string description = getFirstDocumentItem(result, "errorDescription");
            if (!description.empty()) {
                ss << ": " << description;
            }
        }
    } else {
        ss << UpnpGetErrorMessage(errCode) << " (" << errCode << ")";
    }

    return ss.str();
}
