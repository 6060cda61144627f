#include "EventSurface.h"
#include "Logging.h"

#include <exception>

void EventSurface::setCallbacks(const Callbacks& callbacks) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbacks = callbacks;
    DEBUG_LOG("[EventSurface] Callbacks set");
}

// Callbacks are copied under the lock and invoked outside it, so a listener
// may call back into the service without deadlocking.

void EventSurface::emitDeviceFound(const RendererDevice& device) {
    DeviceFoundCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callback = m_callbacks.onDeviceFound;
    }
    if (!callback) {
        return;
    }

    try {
        callback(device);
    } catch (const std::exception& e) {
        std::cerr << "[EventSurface] ⚠️  device-found listener threw: " << e.what() << std::endl;
    }
}

void EventSurface::emitDeviceLost(const std::string& deviceId) {
    DeviceLostCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callback = m_callbacks.onDeviceLost;
    }
    if (!callback) {
        return;
    }

    try {
        callback(deviceId);
    } catch (const std::exception& e) {
        std::cerr << "[EventSurface] ⚠️  device-lost listener threw: " << e.what() << std::endl;
    }
}

void EventSurface::emitCastProgress(const CastProgress& progress) {
    CastProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callback = m_callbacks.onCastProgress;
    }
    if (!callback) {
        DEBUG_LOG("[EventSurface] No progress listener, dropping '"
                  << castStageName(progress.stage) << "'");
        return;
    }

    try {
        callback(progress);
    } catch (const std::exception& e) {
        std::cerr << "[EventSurface] ⚠️  progress listener threw: " << e.what() << std::endl;
    }
}
