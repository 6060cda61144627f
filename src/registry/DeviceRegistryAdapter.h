#ifndef DLNACAST_DEVICE_REGISTRY_ADAPTER_H
#define DLNACAST_DEVICE_REGISTRY_ADAPTER_H

#include "IRendererRegistry.h"
#include "cast/CastTypes.h"

#include <string>
#include <vector>

class EventSurface;

/**
 * @brief Filter criteria for filterRenderers()
 *
 * Empty fields match everything; matching is case-insensitive and partial.
 */
struct DeviceFilter {
    std::string manufacturer;
    std::string name;
};

/**
 * @brief Normalized, read-only view of the renderer registry
 *
 * Never mutates the registry and never triggers a re-scan. Registry
 * add/remove notifications are forwarded to the EventSurface.
 */
class DeviceRegistryAdapter {
public:
    static constexpr const char* UNKNOWN = "Unknown";
    static constexpr const char* AVTRANSPORT_SERVICE = "urn:schemas-upnp-org:service:AVTransport";

    DeviceRegistryAdapter(IRendererRegistry& registry, EventSurface& events);
    ~DeviceRegistryAdapter();

    DeviceRegistryAdapter(const DeviceRegistryAdapter&) = delete;
    DeviceRegistryAdapter& operator=(const DeviceRegistryAdapter&) = delete;

    /**
     * @brief Every known device exposing AVTransport, in registry order
     */
    std::vector<RendererDevice> listRenderers() const;

    /**
     * @brief Look a device up by UDN
     * @param id Device identifier
     * @param device Filled in when found (capability flag included)
     * @return false if the registry does not know the identifier
     */
    bool resolve(const std::string& id, RendererDevice& device) const;

    /**
     * @brief Registry record -> normalized device
     */
    static RendererDevice normalize(const RegistryEntry& entry);

    static std::vector<RendererDevice> filterRenderers(const std::vector<RendererDevice>& devices,
                                                       const DeviceFilter& filter);

    /**
     * @brief First device whose name or manufacturer contains brand
     * @return false if none matches
     */
    static bool findRendererByBrand(const std::vector<RendererDevice>& devices,
                                    const std::string& brand,
                                    RendererDevice& device);

private:
    IRendererRegistry& m_registry;
    EventSurface& m_events;
};

#endif // DLNACAST_DEVICE_REGISTRY_ADAPTER_H
