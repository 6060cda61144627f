#pragma once

#include "CastTypes.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

// SOAP arguments, in the order the service description declares them
using ActionArgs = std::vector<std::pair<std::string, std::string>>;

/**
 * Raw action-invocation primitive of the discovery/transport stack.
 */
class IActionTransport {
public:
    /**
     * @param success true if the device accepted the action
     * @param error human-readable reason when success is false
     */
    using Completion = std::function<void(bool success, const std::string& error)>;

    virtual ~IActionTransport() = default;

    /**
     * @brief Send one AVTransport action to a renderer
     *
     * Completion may run on a transport thread, or synchronously from inside
     * this call. Implementations may report more than once; callers must
     * tolerate it.
     *
     * @return false if the request could not be sent at all
     */
    virtual bool sendAction(const RendererDevice& device,
                            const std::string& actionName,
                            const ActionArgs& args,
                            const Completion& onComplete) = 0;
};
