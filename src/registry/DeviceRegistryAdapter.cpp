#include "DeviceRegistryAdapter.h"
#include "EventSurface.h"
#include "Logging.h"

#include <algorithm>
#include <cctype>

static std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

static bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

static std::string orUnknown(const std::string& value) {
    return value.empty() ? DeviceRegistryAdapter::UNKNOWN : value;
}

// "urn:schemas-upnp-org:device:MediaRenderer:1" -> "MediaRenderer"
static std::string shortDeviceType(const std::string& deviceType) {
    static const std::string marker = ":device:";
    size_t pos = deviceType.find(marker);
    if (pos == std::string::npos) {
        return orUnknown(deviceType);
    }

    std::string type = deviceType.substr(pos + marker.size());
    size_t colon = type.find(':');
    if (colon != std::string::npos) {
        type = type.substr(0, colon);
    }
    return orUnknown(type);
}

DeviceRegistryAdapter::DeviceRegistryAdapter(IRendererRegistry& registry, EventSurface& events)
    : m_registry(registry)
    , m_events(events)
{
    IRendererRegistry::Listener listener;

    listener.onDeviceAdded = [this](const RegistryEntry& entry) {
        RendererDevice device = normalize(entry);
        DEBUG_LOG("[DeviceRegistryAdapter] Device found: " << device.name
                  << " (" << device.id << ")");
        m_events.emitDeviceFound(device);
    };

    listener.onDeviceRemoved = [this](const std::string& udn) {
        DEBUG_LOG("[DeviceRegistryAdapter] Device lost: " << udn);
        m_events.emitDeviceLost(udn);
    };

    m_registry.setListener(listener);
}

DeviceRegistryAdapter::~DeviceRegistryAdapter() {
    m_registry.setListener(IRendererRegistry::Listener());
}

RendererDevice DeviceRegistryAdapter::normalize(const RegistryEntry& entry) {
    RendererDevice device;
    device.id = entry.udn;
    device.name = orUnknown(entry.friendlyName);
    device.manufacturer = orUnknown(entry.manufacturer);
    device.modelName = orUnknown(entry.modelName);
    device.type = shortDeviceType(entry.deviceType);

    for (const auto& service : entry.services) {
        if (service.serviceType.find(AVTRANSPORT_SERVICE) == 0 && !service.controlURL.empty()) {
            device.supportsAVTransport = true;
            device.avTransportControlURL = service.controlURL;
            device.avTransportServiceType = service.serviceType;
            break;
        }
    }
    return device;
}

std::vector<RendererDevice> DeviceRegistryAdapter::listRenderers() const {
    std::vector<RendererDevice> renderers;

    for (const auto& entry : m_registry.snapshot()) {
        RendererDevice device = normalize(entry);
        if (device.supportsAVTransport) {
            renderers.push_back(device);
        }
    }

    DEBUG_LOG("[DeviceRegistryAdapter] " << renderers.size() << " MediaRenderer device(s) known");
    return renderers;
}

bool DeviceRegistryAdapter::resolve(const std::string& id, RendererDevice& device) const {
    RegistryEntry entry;
    if (!m_registry.lookup(id, entry)) {
        return false;
    }
    device = normalize(entry);
    return true;
}

std::vector<RendererDevice> DeviceRegistryAdapter::filterRenderers(
    const std::vector<RendererDevice>& devices, const DeviceFilter& filter)
{
    std::vector<RendererDevice> matches;

    for (const auto& device : devices) {
        if (!filter.manufacturer.empty() &&
            !containsIgnoreCase(device.manufacturer, filter.manufacturer)) {
            continue;
        }
        if (!filter.name.empty() && !containsIgnoreCase(device.name, filter.name)) {
            continue;
        }
        matches.push_back(device);
    }
    return matches;
}

bool DeviceRegistryAdapter::findRendererByBrand(const std::vector<RendererDevice>& devices,
                                                const std::string& brand,
                                                RendererDevice& device)
{
    for (const auto& candidate : devices) {
        if (containsIgnoreCase(candidate.name, brand) ||
            containsIgnoreCase(candidate.manufacturer, brand)) {
            device = candidate;
            return true;
        }
    }
    return false;
}
