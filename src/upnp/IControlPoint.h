#pragma once

#include "cast/IActionTransport.h"
#include "registry/IRendererRegistry.h"

/**
 * A running control point: device registry plus action primitive,
 * bracketed by start()/stop().
 */
class IControlPoint : public IRendererRegistry, public IActionTransport {
public:
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    // Re-issue the SSDP search for media renderers
    virtual bool search() = 0;
};
