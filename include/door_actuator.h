#pragma once
#include <stdint.h>
#include "shared_types.h"

// Outputs of the decision engine.
class DoorActuator {
public:
    virtual ~DoorActuator() {}

    // Pulses the door opener. Never retried by the caller.
    virtual bool sendDoorOpenCommand(uint8_t durationSec) = 0;

    // Fire-and-forget; durationMs == 0 means "until the next event".
    virtual void publishStatusEvent(StatusEvent kind, uint32_t durationMs) = 0;
};
