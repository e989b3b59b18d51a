#pragma once
#include <stdint.h>
#include "shared_types.h"
#include "clock.h"
#include "door_actuator.h"
#include "identity_scanner.h"
#include "trajectory_analyzer.h"

struct DecisionConfig {
    TrendConfig trend;
    int16_t signChangeYMaxMm;     // zero crossing only counts this close...
    int16_t signChangeXMaxMm;     // ...and this far off-axis
    uint32_t comfortDelayMs;
    uint32_t cooldownMs;
    uint32_t scanTimeoutMs;
    uint8_t relayDurationSec;
    uint32_t grantedDisplayMs;
};

DecisionConfig defaultDecisionConfig();

/*
 * DecisionEngine
 *
 * Fuses the radar trend with the BLE identity result and decides when to
 * open the door. Driven by the logic task only: one step() per reading
 * taken from the radar queue.
 */
class DecisionEngine {
public:
    DecisionEngine(const DecisionConfig& cfg,
                   IdentityScanner& scanner,
                   DoorActuator& door,
                   Clock& clock,
                   bool debug = false);

    void step(const RadarReading& reading);

    // Cancels any outstanding scan. Called before the logic task goes away.
    void shutdown();

    SystemState state() const { return _state; }
    BleStatus bleStatus() const { return _ble; }
    IntentStatus intent() const { return _intent; }
    bool scanOutstanding() const { return _scanOutstanding; }
    size_t samples() const { return _analyzer.size(); }
    uint32_t doorOpenCount() const { return _doorOpens; }

private:
    bool acuteTriggerFires(const TargetObservation& prev, const TargetObservation& cur) const;
    void fireDoorOpen(const TargetObservation& prev, const TargetObservation& cur);
    void resetToIdle(const char* reason);
    void setState(SystemState next);

    bool pollScan();
    void startScanIfNeeded();
    void cancelScan();

    DecisionConfig _cfg;
    IdentityScanner& _scanner;
    DoorActuator& _door;
    Clock& _clock;
    bool _debug;

    TrajectoryAnalyzer _analyzer;
    SystemState _state;
    BleStatus _ble;
    IntentStatus _intent;
    bool _scanOutstanding;
    uint32_t _cooldownUntil;
    uint32_t _doorOpens;
};
