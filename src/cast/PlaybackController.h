#ifndef DLNACAST_PLAYBACK_CONTROLLER_H
#define DLNACAST_PLAYBACK_CONTROLLER_H

#include "ActionDispatcher.h"
#include "CastTypes.h"

#include <string>

class DeviceRegistryAdapter;

/**
 * @brief Single play / pause / stop command against a renderer
 *
 * One resolve, one dispatcher call, no retry, no deadline.
 */
class PlaybackController {
public:
    PlaybackController(DeviceRegistryAdapter& registry, ActionDispatcher& dispatcher);

    /**
     * @brief Issue a control command
     * @param deviceId Renderer UDN
     * @param action "play", "pause" or "stop" (exact)
     */
    CastResult control(const std::string& deviceId, const std::string& action);

    /**
     * @return false if action is not one of the three accepted literals
     */
    static bool parseAction(const std::string& action, TransportAction& transportAction);

private:
    DeviceRegistryAdapter& m_registry;
    ActionDispatcher& m_dispatcher;
};

#endif // DLNACAST_PLAYBACK_CONTROLLER_H
