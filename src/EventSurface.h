#ifndef DLNACAST_EVENT_SURFACE_H
#define DLNACAST_EVENT_SURFACE_H

#include "cast/CastTypes.h"

#include <functional>
#include <mutex>
#include <string>

/**
 * @brief Outbound notification channel consumed by the host application
 *
 * Delivery is best effort: an unset callback drops the event, and an
 * exception thrown by a callback is logged and never reaches the emitter.
 */
class EventSurface {
public:
    using DeviceFoundCallback = std::function<void(const RendererDevice& device)>;
    using DeviceLostCallback = std::function<void(const std::string& deviceId)>;
    using CastProgressCallback = std::function<void(const CastProgress& progress)>;

    struct Callbacks {
        DeviceFoundCallback onDeviceFound;
        DeviceLostCallback onDeviceLost;
        CastProgressCallback onCastProgress;
    };

    EventSurface() = default;

    void setCallbacks(const Callbacks& callbacks);

    void emitDeviceFound(const RendererDevice& device);
    void emitDeviceLost(const std::string& deviceId);
    void emitCastProgress(const CastProgress& progress);

private:
    Callbacks m_callbacks;
    mutable std::mutex m_mutex;
};

#endif // DLNACAST_EVENT_SURFACE_H
