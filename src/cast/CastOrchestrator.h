#ifndef DLNACAST_CAST_ORCHESTRATOR_H
#define DLNACAST_CAST_ORCHESTRATOR_H

#include "ActionDispatcher.h"
#include "BackoffWaiter.h"
#include "CastTypes.h"

#include <atomic>
#include <chrono>
#include <string>

class DeviceRegistryAdapter;
class EventSurface;

/**
 * @brief Turns (device, url, title) into a confirmed "now playing" state
 *
 * Each attempt runs a flat pipeline:
 *   resolve -> connecting -> SetAVTransportURI -> buffering -> Play -> playing
 *
 * The attempt deadline starts with SetAVTransportURI. Resolution misses,
 * dispatcher failures and deadline expiry are retried with exponential
 * backoff (initialRetryDelay x 2^(attempt-1)) up to maxAttempts, which is
 * clamped to [1, MAX_ATTEMPTS]. Attempts of one call never overlap;
 * separate calls are fully independent.
 *
 * cast() blocks the calling thread until a terminal result.
 */
class CastOrchestrator {
public:
    static constexpr int MAX_ATTEMPTS = 16;
    static constexpr std::chrono::milliseconds MAX_RETRY_DELAY{std::chrono::minutes(10)};

    struct Config {
        int maxAttempts;
        std::chrono::milliseconds attemptTimeout;
        std::chrono::milliseconds initialRetryDelay;
        std::chrono::milliseconds sourceSettleDelay;  // pause between SetAVTransportURI and Play

        Config()
            : maxAttempts(3)
            , attemptTimeout(30000)
            , initialRetryDelay(1000)
            , sourceSettleDelay(0)
        {}
    };

    CastOrchestrator(const Config& config,
                     DeviceRegistryAdapter& registry,
                     ActionDispatcher& dispatcher,
                     EventSurface& events,
                     IBackoffWaiter& waiter);

    CastOrchestrator(const CastOrchestrator&) = delete;
    CastOrchestrator& operator=(const CastOrchestrator&) = delete;

    /**
     * @brief Cast a URL to a renderer
     * @param deviceId Renderer UDN
     * @param url http:// or https:// media URL
     * @param title Item title ("Video" if empty)
     * @return Success, or the terminal failure
     */
    CastResult cast(const std::string& deviceId,
                    const std::string& url,
                    const std::string& title);

    /**
     * @brief Stop scheduling attempts; pending backoff waits return at once
     *
     * Calls still running end with SERVICE_NOT_STARTED.
     */
    void shutdown();

    bool isShutdown() const { return m_shutdown; }

    const Config& getConfig() const { return m_config; }

    /**
     * @brief Delay before the attempt following attemptNumber
     *
     * Doubles per attempt, saturating at MAX_RETRY_DELAY.
     */
    std::chrono::milliseconds retryDelay(int attemptNumber) const;

    /**
     * @brief Synchronous preconditions: non-empty id, http(s) URL
     * @param error Reason when false
     */
    static bool validateRequest(const std::string& deviceId,
                                const std::string& url,
                                std::string& error);

    static bool isRetryable(CastErrorKind kind);

private:
    struct CastRequest {
        std::string deviceId;
        std::string url;
        std::string title;
        int attempt;
        std::chrono::steady_clock::time_point deadline;

        CastRequest(const std::string& id, const std::string& mediaUrl, const std::string& mediaTitle)
            : deviceId(id), url(mediaUrl), title(mediaTitle), attempt(0) {}
    };

    struct AttemptResult {
        CastErrorKind kind;
        std::string message;

        AttemptResult() : kind(CastErrorKind::NONE) {}
        AttemptResult(CastErrorKind k, const std::string& msg) : kind(k), message(msg) {}

        bool succeeded() const { return kind == CastErrorKind::NONE; }
    };

    AttemptResult runAttempt(CastRequest& request);

    // Wait for one dispatcher outcome, bounded by the attempt deadline.
    // At the deadline the invocation is expired; whichever of the expiry and
    // the transport report claims the invocation first decides it.
    // false means the deadline won.
    bool awaitOutcome(const CastRequest& request, const ActionInvocation& invocation, ActionOutcome& outcome);

    AttemptResult timeoutResult(const CastRequest& request, const char* step) const;

    void emitProgress(CastStage stage, const std::string& message, const std::string& deviceName);

    Config m_config;
    DeviceRegistryAdapter& m_registry;
    ActionDispatcher& m_dispatcher;
    EventSurface& m_events;
    IBackoffWaiter& m_waiter;
    std::atomic<bool> m_shutdown;
};

#endif // DLNACAST_CAST_ORCHESTRATOR_H
