#ifndef SHARED_TYPES_H
#define SHARED_TYPES_H

#include <stdint.h>
#include <math.h>

// 1. Single radar target, as decoded from one frame
struct TargetObservation {
    int16_t x;              // mm, lateral
    int16_t y;              // mm, away from the sensor
    int16_t speed;          // cm/s
    uint32_t timestampMs;   // monotonic

    float distanceMm() const {
        return sqrtf((float)x * (float)x + (float)y * (float)y);
    }

    float angleDeg() const {
        return atan2f((float)x, (float)y) * 57.2957795f;
    }
};

// 2. What the reader task publishes into the single-slot queue
struct RadarReading {
    bool hasTarget;
    TargetObservation target;
};

// 3. Decision engine state
enum SystemState {
    STATE_IDLE,
    STATE_TRACKING,
    STATE_COOLDOWN
};

enum BleStatus {
    BLE_UNKNOWN,
    BLE_SCANNING,
    BLE_SUCCESS,
    BLE_FAILED
};

enum IntentStatus {
    INTENT_NEUTRAL,
    INTENT_COMING,
    INTENT_LEAVING
};

enum StatusEvent {
    STATUS_IDLE,
    STATUS_TRACKING,
    STATUS_ACCESS_GRANTED,
    STATUS_FAULT
};

const char* systemStateName(SystemState s);
const char* bleStatusName(BleStatus s);
const char* intentStatusName(IntentStatus s);
const char* statusEventName(StatusEvent e);

#endif
