#pragma once

#include "EventSurface.h"
#include "cast/CastOrchestrator.h"
#include "cast/CastTypes.h"
#include "upnp/IControlPoint.h"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Forward declarations
class DeviceRegistryAdapter;
class ActionDispatcher;
class IBackoffWaiter;
class PlaybackController;

/**
 * Host-facing cast service.
 *
 * startService()/stopService() bracket the session. Every operation
 * called outside the bracket fails with SERVICE_NOT_STARTED. cast() and
 * control() run on their own worker thread and return a future.
 */
class CastService {
public:
    struct Config {
        std::string name;
        int port;
        std::string networkInterface;  // Empty = auto-detect
        int searchMX;
        CastOrchestrator::Config cast;

        Config();
    };

    /**
     * @param controlPoint Discovery/transport stack; a libupnp control
     *                     point is created when null
     */
    CastService(const Config& config, std::unique_ptr<IControlPoint> controlPoint = nullptr);
    ~CastService();

    CastService(const CastService&) = delete;
    CastService& operator=(const CastService&) = delete;

    bool startService(const std::string& name = "");
    void stopService();

    bool isRunning() const { return m_running; }

    // Re-issue the SSDP search
    bool refreshDiscovery();

    CastResult listRenderers(std::vector<RendererDevice>& devices) const;

    std::future<CastResult> cast(const std::string& deviceId,
                                 const std::string& url,
                                 const std::string& title = "");

    std::future<CastResult> control(const std::string& deviceId, const std::string& action);

    void setEventCallbacks(const EventSurface::Callbacks& callbacks);

    const Config& getConfig() const { return m_config; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::future<CastResult> runWorker(std::packaged_task<CastResult()> task);
    void reapWorkers();

    static std::future<CastResult> notStarted();

    // Configuration
    Config m_config;

    // Components
    std::unique_ptr<IControlPoint> m_controlPoint;
    EventSurface m_events;
    std::unique_ptr<DeviceRegistryAdapter> m_registry;
    std::unique_ptr<ActionDispatcher> m_dispatcher;
    std::unique_ptr<IBackoffWaiter> m_waiter;
    std::unique_ptr<CastOrchestrator> m_orchestrator;
    std::unique_ptr<PlaybackController> m_controller;

    // Worker threads, one per cast/control call
    std::vector<Worker> m_workers;

    // State
    std::atomic<bool> m_running;
    mutable std::mutex m_mutex;       // m_running transitions, components, workers
    std::mutex m_lifecycleMutex;      // serializes start/stop
};
