/*
 * DoorManager.h
 *
 * Drives the door opener relay on a single GPIO pin.
 * Uses a millis() state machine to avoid using delay().
 */

#pragma once
#include <Arduino.h>
#include "door_actuator.h"
#include "led_manager.h"

class DoorManager : public DoorActuator {
public:
    /**
     * @brief Constructor
     * @param relayPin GPIO pin wired to the relay driver.
     * @param minIntervalMs Commands closer together than this are rejected.
     */
    DoorManager(int relayPin, LedManager& led, uint32_t minIntervalMs,
                bool debug = false, bool activeHigh = true);

    /**
     * @brief Initializes the pin. Call this in setup().
     */
    void begin();

    /**
     * @brief Call this in your main loop(). Releases the relay when its time is up.
     */
    void update();

    /**
     * @brief Energizes the relay for durationSec (3..10 s).
     * @return false if the duration is out of range, the relay is already
     * active, or the previous command was less than minIntervalMs ago.
     */
    bool sendDoorOpenCommand(uint8_t durationSec) override;

    // Forwarded to the status LED.
    void publishStatusEvent(StatusEvent kind, uint32_t durationMs) override;

    void deactivate(); // Immediately release the relay.

private:
    void drive(bool on) { digitalWrite(_pin, (_activeHigh ? (on ? HIGH : LOW) : (on ? LOW : HIGH))); }

    int _pin;
    LedManager& _led;
    uint32_t _minIntervalMs;
    bool _debug;
    bool _activeHigh;

    enum State {
        IDLE,
        RELAY_ON
    };

    State _currentState;
    unsigned long _stateStartTime;
    unsigned long _lastCommandTime;
    bool _hasCommanded;
    uint32_t _holdMs;
    portMUX_TYPE _lock;
};
