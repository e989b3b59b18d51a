#pragma once
#include <stdint.h>

// Monotonic time source. millis()/vTaskDelay on the board, a fake in tests.
class Clock {
public:
    virtual ~Clock() {}
    virtual uint32_t nowMs() = 0;
    virtual void sleepMs(uint32_t ms) = 0;
};
