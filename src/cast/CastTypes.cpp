#include "CastTypes.h"

const char* castStageName(CastStage stage) {
    switch (stage) {
        case CastStage::CONNECTING: return "connecting";
        case CastStage::BUFFERING:  return "buffering";
        case CastStage::PLAYING:    return "playing";
    }
    return "unknown";
}

const char* castErrorKindName(CastErrorKind kind) {
    switch (kind) {
        case CastErrorKind::NONE:                   return "NONE";
        case CastErrorKind::INVALID_INPUT:          return "INVALID_INPUT";
        case CastErrorKind::SERVICE_NOT_STARTED:    return "SERVICE_NOT_STARTED";
        case CastErrorKind::DEVICE_NOT_FOUND:       return "DEVICE_NOT_FOUND";
        case CastErrorKind::CAPABILITY_UNAVAILABLE: return "CAPABILITY_UNAVAILABLE";
        case CastErrorKind::DISPATCH_FAILURE:       return "DISPATCH_FAILURE";
        case CastErrorKind::TIMEOUT:                return "TIMEOUT";
        case CastErrorKind::MAX_RETRIES_EXCEEDED:   return "MAX_RETRIES_EXCEEDED";
        case CastErrorKind::INVALID_ACTION:         return "INVALID_ACTION";
    }
    return "UNKNOWN";
}

CastResult CastResult::ok(int attempts) {
    CastResult result;
    result.success = true;
    result.attempts = attempts;
    return result;
}

CastResult CastResult::failure(CastErrorKind kind, const std::string& message, int attempts) {
    CastResult result;
    result.success = false;
    result.kind = kind;
    result.message = message;
    result.attempts = attempts;
    result.lastErrorKind = kind;
    return result;
}
