#include "shared_types.h"

const char* systemStateName(SystemState s) {
    switch (s) {
        case STATE_IDLE:     return "IDLE";
        case STATE_TRACKING: return "TRACKING";
        case STATE_COOLDOWN: return "COOLDOWN";
        default:             return "UNKNOWN";
    }
}

const char* bleStatusName(BleStatus s) {
    switch (s) {
        case BLE_UNKNOWN:  return "UNKNOWN";
        case BLE_SCANNING: return "SCANNING";
        case BLE_SUCCESS:  return "SUCCESS";
        case BLE_FAILED:   return "FAILED";
        default:           return "?";
    }
}

const char* intentStatusName(IntentStatus s) {
    switch (s) {
        case INTENT_NEUTRAL: return "NEUTRAL";
        case INTENT_COMING:  return "COMING";
        case INTENT_LEAVING: return "LEAVING";
        default:             return "?";
    }
}

const char* statusEventName(StatusEvent e) {
    switch (e) {
        case STATUS_IDLE:           return "IDLE";
        case STATUS_TRACKING:       return "TRACKING";
        case STATUS_ACCESS_GRANTED: return "ACCESS_GRANTED";
        case STATUS_FAULT:          return "FAULT";
        default:                    return "?";
    }
}
