#pragma once
#include <Arduino.h>
#include "shared_types.h"

class LedManager {
public:
    // Constructor: Takes the pin and brightness
    LedManager(int pin, uint8_t brightness = 255);

    void begin(); // Call this in setup() to init the pixel
    void setColor(uint8_t r, uint8_t g, uint8_t b);
    void setOff();

    /**
     * @brief Shows a status event. durationMs == 0 sets the resting colour,
     * otherwise the event colour is held for durationMs and then reverts.
     */
    void showStatus(StatusEvent kind, uint32_t durationMs);

    // Call from loop(); expires timed events.
    void update();

private:
    int _pin;
    uint8_t _brightness;
    uint8_t _targetR;
    uint8_t _targetG;
    uint8_t _targetB;
    bool _initialized;

    StatusEvent _resting;
    StatusEvent _timed;
    bool _timedActive;
    unsigned long _timedStart;
    uint32_t _timedDuration;
    bool _dirty;
    portMUX_TYPE _lock;

    void writeColor();
    void applyStatus(StatusEvent kind);
    uint8_t scale(uint8_t v) const { return (uint8_t)(((uint16_t)v * _brightness) / 255); }
};
