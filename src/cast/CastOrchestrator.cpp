/**
 * @file CastOrchestrator.cpp
 * @brief Cast state machine: attempt pipeline, deadline, retry with backoff
 */

#include "CastOrchestrator.h"
#include "DidlLiteBuilder.h"
#include "EventSurface.h"
#include "Logging.h"
#include "registry/DeviceRegistryAdapter.h"

#include <algorithm>
#include <future>

static const char* const HTTP_PREFIX = "http://";
static const char* const HTTPS_PREFIX = "https://";

static bool startsWith(const std::string& text, const char* prefix) {
    return text.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

static int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

CastOrchestrator::CastOrchestrator(const Config& config,
                                   DeviceRegistryAdapter& registry,
                                   ActionDispatcher& dispatcher,
                                   EventSurface& events,
                                   IBackoffWaiter& waiter)
    : m_config(config)
    , m_registry(registry)
    , m_dispatcher(dispatcher)
    , m_events(events)
    , m_waiter(waiter)
    , m_shutdown(false)
{
    if (m_config.maxAttempts < 1) {
        std::cerr << "[CastOrchestrator] ⚠️  maxAttempts " << m_config.maxAttempts
                  << " is invalid, using 1" << std::endl;
        m_config.maxAttempts = 1;
    } else if (m_config.maxAttempts > MAX_ATTEMPTS) {
        std::cerr << "[CastOrchestrator] ⚠️  maxAttempts " << m_config.maxAttempts
                  << " is too large, using " << MAX_ATTEMPTS << std::endl;
        m_config.maxAttempts = MAX_ATTEMPTS;
    }

    if (m_config.initialRetryDelay.count() < 0) {
        m_config.initialRetryDelay = std::chrono::milliseconds(0);
    }
    if (m_config.sourceSettleDelay.count() < 0) {
        m_config.sourceSettleDelay = std::chrono::milliseconds(0);
    }
}

// ============================================================================
// Policy helpers
// ============================================================================

bool CastOrchestrator::validateRequest(const std::string& deviceId,
                                       const std::string& url,
                                       std::string& error)
{
    if (deviceId.empty()) {
        error = "Device ID cannot be empty. Pick a device from the renderer list.";
        return false;
    }

    if (url.empty()) {
        error = "Video URL cannot be empty. Please provide a valid HTTP or HTTPS URL.";
        return false;
    }

    if (!startsWith(url, HTTP_PREFIX) && !startsWith(url, HTTPS_PREFIX)) {
        error = "Invalid video URL: '" + url + "'. URL must start with http:// or https://.";
        return false;
    }

    return true;
}

bool CastOrchestrator::isRetryable(CastErrorKind kind) {
    return kind == CastErrorKind::DEVICE_NOT_FOUND ||
           kind == CastErrorKind::DISPATCH_FAILURE ||
           kind == CastErrorKind::TIMEOUT;
}

std::chrono::milliseconds CastOrchestrator::retryDelay(int attemptNumber) const {
    std::chrono::milliseconds delay = std::min(m_config.initialRetryDelay, MAX_RETRY_DELAY);
    for (int n = 1; n < attemptNumber && delay.count() > 0 && delay < MAX_RETRY_DELAY; ++n) {
        delay *= 2;
    }
    return std::min(delay, MAX_RETRY_DELAY);
}

void CastOrchestrator::shutdown() {
    if (m_shutdown.exchange(true)) {
        return;
    }
    DEBUG_LOG("[CastOrchestrator] Shutting down, interrupting pending retries");
    m_waiter.interrupt();
}

void CastOrchestrator::emitProgress(CastStage stage,
                                    const std::string& message,
                                    const std::string& deviceName)
{
    CastProgress progress;
    progress.stage = stage;
    progress.message = message;
    progress.deviceName = deviceName;
    progress.timestamp = nowMs();

    DEBUG_LOG("[CastOrchestrator] " << castStageName(stage) << ": " << message
              << " (" << deviceName << ")");
    m_events.emitCastProgress(progress);
}

// ============================================================================
// Retry loop
// ============================================================================

CastResult CastOrchestrator::cast(const std::string& deviceId,
                                  const std::string& url,
                                  const std::string& title)
{
    std::string error;
    if (!validateRequest(deviceId, url, error)) {
        std::cerr << "[CastOrchestrator] ❌ " << error << std::endl;
        return CastResult::failure(CastErrorKind::INVALID_INPUT, error);
    }

    if (startsWith(url, HTTPS_PREFIX)) {
        std::cerr << "[CastOrchestrator] ⚠️  HTTPS URLs may not work with some TV models "
                  << "(Samsung in particular). Consider using HTTP." << std::endl;
    }

    CastRequest request(deviceId, url, title.empty() ? DidlLiteBuilder::DEFAULT_TITLE : title);
    AttemptResult last;

    for (request.attempt = 1; ; ++request.attempt) {
        if (m_shutdown) {
            return CastResult::failure(CastErrorKind::SERVICE_NOT_STARTED,
                                       "Cast interrupted: service stopped",
                                       request.attempt - 1);
        }

        DEBUG_LOG("[CastOrchestrator] Attempt " << request.attempt << "/"
                  << m_config.maxAttempts << " for " << deviceId);

        AttemptResult result = runAttempt(request);

        if (result.succeeded()) {
            std::cout << "[CastOrchestrator] ✓ Cast '" << request.title << "' playing on attempt "
                      << request.attempt << std::endl;
            return CastResult::ok(request.attempt);
        }

        if (!isRetryable(result.kind)) {
            std::cerr << "[CastOrchestrator] ❌ " << result.message << std::endl;
            return CastResult::failure(result.kind, result.message, request.attempt);
        }

        last = result;

        if (m_shutdown) {
            return CastResult::failure(CastErrorKind::SERVICE_NOT_STARTED,
                                       "Cast interrupted: service stopped",
                                       request.attempt);
        }

        if (request.attempt >= m_config.maxAttempts) {
            break;
        }

        std::chrono::milliseconds delay = retryDelay(request.attempt);
        std::cerr << "[CastOrchestrator] ⚠️  Cast attempt " << request.attempt << " failed: "
                  << result.message << ". Retrying in " << delay.count() << "ms (attempt "
                  << (request.attempt + 1) << "/" << m_config.maxAttempts << ")" << std::endl;

        if (!m_waiter.waitFor(delay)) {
            return CastResult::failure(CastErrorKind::SERVICE_NOT_STARTED,
                                       "Cast interrupted: service stopped",
                                       request.attempt);
        }
    }

    std::cerr << "[CastOrchestrator] ❌ " << last.message << " - Max retries ("
              << m_config.maxAttempts << ") exceeded" << std::endl;

    CastResult result = CastResult::failure(
        CastErrorKind::MAX_RETRIES_EXCEEDED,
        last.message + " after " + std::to_string(request.attempt) + " attempts",
        request.attempt);
    result.lastErrorKind = last.kind;
    return result;
}

// ============================================================================
// One attempt
// ============================================================================

bool CastOrchestrator::awaitOutcome(const CastRequest& request,
                                    const ActionInvocation& invocation,
                                    ActionOutcome& outcome)
{
    if (invocation.future.wait_until(request.deadline) != std::future_status::ready &&
        m_dispatcher.expire(invocation.id, "Attempt deadline passed")) {
        return false;
    }
    outcome = invocation.future.get();
    return true;
}

CastOrchestrator::AttemptResult CastOrchestrator::timeoutResult(const CastRequest& request,
                                                                const char* step) const
{
    auto seconds = std::chrono::duration_cast<std::chrono::duration<double>>(m_config.attemptTimeout);
    std::cerr << "[CastOrchestrator] ⏱  " << step << " timed out after " << seconds.count()
              << "s on attempt " << request.attempt << std::endl;
    return AttemptResult(CastErrorKind::TIMEOUT,
                         "Operation timed out after " + std::to_string(m_config.attemptTimeout.count()) +
                         "ms waiting for " + step);
}

CastOrchestrator::AttemptResult CastOrchestrator::runAttempt(CastRequest& request) {
    // 1. Resolving
    RendererDevice device;
    if (!m_registry.resolve(request.deviceId, device)) {
        return AttemptResult(CastErrorKind::DEVICE_NOT_FOUND,
                             "Device with ID '" + request.deviceId + "' not found. "
                             "Device may have gone offline or discovery needs to be re-run.");
    }

    if (!device.supportsAVTransport) {
        return AttemptResult(CastErrorKind::CAPABILITY_UNAVAILABLE,
                             "Device '" + device.name + "' does not support the AVTransport service "
                             "and cannot play media via DLNA.");
    }

    // 2. Connecting
    emitProgress(CastStage::CONNECTING, "Connecting to device...", device.name);

    // 3. Setting source - the deadline starts here
    request.deadline = std::chrono::steady_clock::now() + m_config.attemptTimeout;

    const std::string metadata = DidlLiteBuilder::build(request.url, request.title);
    DEBUG_LOG("[CastOrchestrator] DIDL-Lite: " << metadata);

    ActionOutcome outcome;
    ActionInvocation setSource = m_dispatcher.dispatch(device, TransportAction::SET_AV_TRANSPORT_URI,
                                                       ActionDispatcher::setSourceArgs(request.url, metadata));
    if (!awaitOutcome(request, setSource, outcome)) {
        return timeoutResult(request, "SetAVTransportURI");
    }

    if (!outcome.success) {
        return AttemptResult(CastErrorKind::DISPATCH_FAILURE,
                             "Failed to load media: " + outcome.reason +
                             ". Check that the URL is accessible from the renderer's network.");
    }

    // 4. Buffering
    emitProgress(CastStage::BUFFERING, "Loading media on TV...", device.name);

    if (m_config.sourceSettleDelay.count() > 0) {
        DEBUG_LOG("[CastOrchestrator] ⏳ Giving the renderer " << m_config.sourceSettleDelay.count()
                  << "ms to process the URI...");
        if (!m_waiter.waitFor(m_config.sourceSettleDelay)) {
            return AttemptResult(CastErrorKind::SERVICE_NOT_STARTED, "Cast interrupted: service stopped");
        }
    }

    ActionInvocation play = m_dispatcher.dispatch(device, TransportAction::PLAY, ActionDispatcher::playArgs());
    if (!awaitOutcome(request, play, outcome)) {
        return timeoutResult(request, "Play");
    }

    if (!outcome.success) {
        return AttemptResult(CastErrorKind::DISPATCH_FAILURE,
                             "Play command failed: " + outcome.reason +
                             ". Device may not support the media format or is busy.");
    }

    // 5. Playing
    emitProgress(CastStage::PLAYING, "Media is now playing", device.name);
    return AttemptResult();
}
