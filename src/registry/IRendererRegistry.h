#pragma once

#include <functional>
#include <string>
#include <vector>

/**
 * One service entry from a device description
 */
struct RegistryService {
    std::string serviceType;   // urn:schemas-upnp-org:service:AVTransport:1
    std::string serviceId;
    std::string controlURL;    // absolute
};

/**
 * Raw registry record, as read from the device description.
 * Vendor fields may be empty; normalization is the adapter's job.
 */
struct RegistryEntry {
    std::string udn;
    std::string friendlyName;
    std::string manufacturer;
    std::string modelName;
    std::string deviceType;    // urn:schemas-upnp-org:device:MediaRenderer:1
    std::string location;
    std::vector<RegistryService> services;
};

/**
 * Process-wide view of the devices the discovery stack currently knows.
 *
 * Read-only for its consumers: the table is populated by network events
 * inside the implementation. Listener callbacks may arrive on any thread.
 */
class IRendererRegistry {
public:
    using DeviceAddedCallback = std::function<void(const RegistryEntry& entry)>;
    using DeviceRemovedCallback = std::function<void(const std::string& udn)>;

    struct Listener {
        DeviceAddedCallback onDeviceAdded;
        DeviceRemovedCallback onDeviceRemoved;
    };

    virtual ~IRendererRegistry() = default;

    // Snapshot of all known devices, in insertion order
    virtual std::vector<RegistryEntry> snapshot() const = 0;

    // Point-in-time lookup by UDN
    virtual bool lookup(const std::string& udn, RegistryEntry& entry) const = 0;

    virtual void setListener(const Listener& listener) = 0;
};
