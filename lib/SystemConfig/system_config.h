#ifndef SYSTEM_CONFIG_H
#define SYSTEM_CONFIG_H

#include <stdint.h>
#include <stddef.h>
#include "radar_protocol.h"
#include "decision_engine.h"
#include "beacon_identity.h"

struct RadarSettings {
    RadarVariant variant;
    uint8_t uartPort;
    int8_t rxPin;
    int8_t txPin;
    uint32_t loopIntervalMs;
    uint32_t readerTimeoutMs;    // logic task treats a silent queue as "no target"
};

struct DoorSettings {
    uint32_t minDetectionIntervalMs;
};

struct SystemConfig {
    RadarSettings radar;
    DecisionConfig decision;
    IdentityConfig identity;
    DoorSettings door;
};

SystemConfig defaultSystemConfig();

/**
 * @brief Fills cfg from the JSON config document. Missing keys keep defaults.
 * @return false on malformed JSON or an out-of-range value (reason is logged).
 */
bool parseSystemConfig(const char* json, size_t len, SystemConfig& cfg);

void logSystemConfig(const SystemConfig& cfg);

static constexpr uint8_t MIN_RELAY_DURATION_SEC = 3;
static constexpr uint8_t MAX_RELAY_DURATION_SEC = 10;

#endif
