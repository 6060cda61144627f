/**
 * @file CastService.cpp
 * @brief Session lifecycle and host entry points
 */

#include "CastService.h"
#include "Logging.h"
#include "cast/ActionDispatcher.h"
#include "cast/BackoffWaiter.h"
#include "cast/PlaybackController.h"
#include "registry/DeviceRegistryAdapter.h"
#include "upnp/UPnPControlPoint.h"

#include <iostream>

static const char* const NOT_STARTED_MESSAGE =
    "Cast service is not running. Call startService() first.";

// ============================================================================
// CastService::Config
// ============================================================================

CastService::Config::Config()
    : name("DLNA Cast")
    , port(0)
    , networkInterface("")
    , searchMX(5)
{
}

// ============================================================================
// CastService
// ============================================================================

CastService::CastService(const Config& config, std::unique_ptr<IControlPoint> controlPoint)
    : m_config(config)
    , m_controlPoint(std::move(controlPoint))
    , m_running(false)
{
    if (!m_controlPoint) {
        UPnPControlPoint::Config upnpConfig;
        upnpConfig.friendlyName = m_config.name;
        upnpConfig.port = m_config.port;
        upnpConfig.networkInterface = m_config.networkInterface;
        upnpConfig.searchMX = m_config.searchMX;

        m_controlPoint = std::make_unique<UPnPControlPoint>(upnpConfig);
    }

    DEBUG_LOG("[CastService] Created");
}

CastService::~CastService() {
    stopService();
    DEBUG_LOG("[CastService] Destroyed");
}

bool CastService::startService(const std::string& name) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

    if (m_running) {
        std::cerr << "[CastService] Already running" << std::endl;
        return false;
    }

    if (!name.empty()) {
        m_config.name = name;
    }

    std::cout << "[CastService] Starting '" << m_config.name << "'..." << std::endl;

    // 1. Build components on top of the registry before discovery starts,
    //    so no device-found notification is missed
    auto registry = std::make_unique<DeviceRegistryAdapter>(*m_controlPoint, m_events);
    auto dispatcher = std::make_unique<ActionDispatcher>(*m_controlPoint);
    std::unique_ptr<IBackoffWaiter> waiter = std::make_unique<InterruptibleBackoffWaiter>();
    auto orchestrator = std::make_unique<CastOrchestrator>(m_config.cast, *registry, *dispatcher, m_events, *waiter);
    auto controller = std::make_unique<PlaybackController>(*registry, *dispatcher);

    // 2. Discovery / transport stack
    if (!m_controlPoint->start()) {
        std::cerr << "[CastService] ❌ Failed to start the UPnP control point" << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_registry = std::move(registry);
        m_dispatcher = std::move(dispatcher);
        m_waiter = std::move(waiter);
        m_orchestrator = std::move(orchestrator);
        m_controller = std::move(controller);
        m_running = true;
    }

    std::cout << "[CastService] ✓ Started, searching for media renderers..." << std::endl;
    return true;
}

void CastService::stopService() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }

        DEBUG_LOG("[CastService] Stopping...");
        m_running = false;

        // Wake backoff waits and fail anything still waiting on the network
        m_orchestrator->shutdown();
        m_dispatcher->close("Cast service stopped");

        workers.swap(m_workers);
    }

    // Wait for threads
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    m_controlPoint->stop();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_controller.reset();
        m_orchestrator.reset();
        m_waiter.reset();
        m_dispatcher.reset();
        m_registry.reset();
    }

    std::cout << "[CastService] ✓ Stopped" << std::endl;
}

bool CastService::refreshDiscovery() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running) {
        std::cerr << "[CastService] " << NOT_STARTED_MESSAGE << std::endl;
        return false;
    }
    return m_controlPoint->search();
}

CastResult CastService::listRenderers(std::vector<RendererDevice>& devices) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running) {
        return CastResult::failure(CastErrorKind::SERVICE_NOT_STARTED, NOT_STARTED_MESSAGE);
    }

    devices = m_registry->listRenderers();
    DEBUG_LOG("[CastService] " << devices.size() << " renderer(s) available");
    return CastResult::ok(0);
}

void CastService::setEventCallbacks(const EventSurface::Callbacks& callbacks) {
    m_events.setCallbacks(callbacks);
}

// ============================================================================
// Worker threads
// ============================================================================

std::future<CastResult> CastService::notStarted() {
    std::promise<CastResult> promise;
    promise.set_value(CastResult::failure(CastErrorKind::SERVICE_NOT_STARTED, NOT_STARTED_MESSAGE));
    return promise.get_future();
}

// Called with m_mutex held
void CastService::reapWorkers() {
    for (auto it = m_workers.begin(); it != m_workers.end();) {
        if (*it->done) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }
}

// Called with m_mutex held
std::future<CastResult> CastService::runWorker(std::packaged_task<CastResult()> task) {
    reapWorkers();

    std::future<CastResult> future = task.get_future();

    Worker worker;
    worker.done = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<bool>> done = worker.done;

    worker.thread = std::thread([task = std::move(task), done]() mutable {
        task();
        *done = true;
    });

    m_workers.push_back(std::move(worker));
    return future;
}

std::future<CastResult> CastService::cast(const std::string& deviceId,
                                          const std::string& url,
                                          const std::string& title)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running) {
        std::cerr << "[CastService] ❌ " << NOT_STARTED_MESSAGE << std::endl;
        return notStarted();
    }

    std::cout << "[CastService] 📺 Cast request: " << url << " -> " << deviceId << std::endl;

    CastOrchestrator* orchestrator = m_orchestrator.get();
    std::packaged_task<CastResult()> task([orchestrator, deviceId, url, title]() {
        return orchestrator->cast(deviceId, url, title);
    });
    return runWorker(std::move(task));
}

std::future<CastResult> CastService::control(const std::string& deviceId, const std::string& action) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running) {
        std::cerr << "[CastService] ❌ " << NOT_STARTED_MESSAGE << std::endl;
        return notStarted();
    }

    DEBUG_LOG("[CastService] Control request: " << action << " -> " << deviceId);

    PlaybackController* controller = m_controller.get();
    std::packaged_task<CastResult()> task([controller, deviceId, action]() {
        return controller->control(deviceId, action);
    });
    return runWorker(std::move(task));
}
