#include "PlaybackController.h"
#include "Logging.h"
#include "registry/DeviceRegistryAdapter.h"

PlaybackController::PlaybackController(DeviceRegistryAdapter& registry, ActionDispatcher& dispatcher)
    : m_registry(registry)
    , m_dispatcher(dispatcher)
{
}

bool PlaybackController::parseAction(const std::string& action, TransportAction& transportAction) {
    if (action == "play") {
        transportAction = TransportAction::PLAY;
    } else if (action == "pause") {
        transportAction = TransportAction::PAUSE;
    } else if (action == "stop") {
        transportAction = TransportAction::STOP;
    } else {
        return false;
    }
    return true;
}

CastResult PlaybackController::control(const std::string& deviceId, const std::string& action) {
    TransportAction transportAction;
    if (!parseAction(action, transportAction)) {
        std::cerr << "[PlaybackController] ❌ Invalid action: " << action << std::endl;
        return CastResult::failure(CastErrorKind::INVALID_ACTION,
                                   "Invalid action: '" + action + "'. "
                                   "Valid actions are: 'play', 'pause', 'stop'.");
    }

    if (deviceId.empty()) {
        return CastResult::failure(CastErrorKind::INVALID_INPUT, "Device ID cannot be empty.");
    }

    RendererDevice device;
    if (!m_registry.resolve(deviceId, device)) {
        std::cerr << "[PlaybackController] ❌ Device not found: " << deviceId << std::endl;
        return CastResult::failure(CastErrorKind::DEVICE_NOT_FOUND,
                                   "Device with ID '" + deviceId + "' not found. "
                                   "Device may have gone offline. Try discovering devices again.");
    }

    if (!device.supportsAVTransport) {
        return CastResult::failure(CastErrorKind::CAPABILITY_UNAVAILABLE,
                                   "Device '" + device.name + "' does not support the AVTransport "
                                   "service. Cannot control playback on this device.");
    }

    const ActionArgs args = (transportAction == TransportAction::PLAY)
        ? ActionDispatcher::playArgs()
        : ActionDispatcher::instanceArgs();

    DEBUG_LOG("[PlaybackController] " << action << " -> " << device.name);

    ActionOutcome outcome = m_dispatcher.invoke(device, transportAction, args).get();
    if (!outcome.success) {
        std::cerr << "[PlaybackController] ❌ " << ActionDispatcher::actionName(transportAction)
                  << " failed on " << device.name << ": " << outcome.reason << std::endl;
        return CastResult::failure(CastErrorKind::DISPATCH_FAILURE,
                                   "Failed to execute action '" + action + "' on device '" +
                                   device.name + "': " + outcome.reason,
                                   1);
    }

    std::cout << "[PlaybackController] ✓ " << action << " sent to " << device.name << std::endl;
    return CastResult::ok(1);
}
