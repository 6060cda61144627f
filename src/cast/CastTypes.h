#ifndef DLNACAST_CAST_TYPES_H
#define DLNACAST_CAST_TYPES_H

#include <cstdint>
#include <string>

//=============================================================================
// Renderer device
//=============================================================================

/**
 * @brief A media renderer as seen by the control point
 *
 * Fields are already normalized: missing vendor strings read "Unknown".
 * The AVTransport endpoint is only meaningful when supportsAVTransport is set.
 */
struct RendererDevice {
    std::string id;            // UDN, e.g. "uuid:5f9ec1b3-..."
    std::string name;
    std::string manufacturer;
    std::string modelName;
    std::string type;          // "MediaRenderer"
    bool supportsAVTransport;

    std::string avTransportControlURL;
    std::string avTransportServiceType;

    RendererDevice() : supportsAVTransport(false) {}
};

//=============================================================================
// Progress notifications
//=============================================================================

enum class CastStage { CONNECTING, BUFFERING, PLAYING };

struct CastProgress {
    CastStage stage;
    std::string message;
    std::string deviceName;
    int64_t timestamp;  // ms since epoch

    CastProgress() : stage(CastStage::CONNECTING), timestamp(0) {}
};

const char* castStageName(CastStage stage);

//=============================================================================
// Results
//=============================================================================

enum class CastErrorKind {
    NONE,
    INVALID_INPUT,
    SERVICE_NOT_STARTED,
    DEVICE_NOT_FOUND,
    CAPABILITY_UNAVAILABLE,
    DISPATCH_FAILURE,
    TIMEOUT,
    MAX_RETRIES_EXCEEDED,
    INVALID_ACTION
};

const char* castErrorKindName(CastErrorKind kind);

/**
 * @brief Outcome of a cast or control request
 *
 * For MAX_RETRIES_EXCEEDED, lastErrorKind holds the failure of the final
 * attempt and attempts the number of attempts made.
 */
struct CastResult {
    bool success;
    CastErrorKind kind;
    std::string message;
    int attempts;
    CastErrorKind lastErrorKind;

    CastResult()
        : success(false)
        , kind(CastErrorKind::NONE)
        , attempts(0)
        , lastErrorKind(CastErrorKind::NONE)
    {}

    static CastResult ok(int attempts = 1);
    static CastResult failure(CastErrorKind kind, const std::string& message, int attempts = 0);
};

#endif // DLNACAST_CAST_TYPES_H
