#include "decision_engine.h"
#include "log.h"
#include <stdlib.h>

DecisionConfig defaultDecisionConfig() {
    DecisionConfig cfg;
    cfg.trend.windowSize = 7;
    cfg.trend.noiseThresholdCmS = 5.0f;
    cfg.trend.expectedXSign = -1;
    cfg.signChangeYMaxMm = 500;
    cfg.signChangeXMaxMm = 700;
    cfg.comfortDelayMs = 500;
    cfg.cooldownMs = 3000;
    cfg.scanTimeoutMs = 1500;
    cfg.relayDurationSec = 4;
    cfg.grantedDisplayMs = 5000;
    return cfg;
}

DecisionEngine::DecisionEngine(const DecisionConfig& cfg,
                               IdentityScanner& scanner,
                               DoorActuator& door,
                               Clock& clock,
                               bool debug)
    : _cfg(cfg),
      _scanner(scanner),
      _door(door),
      _clock(clock),
      _debug(debug),
      _analyzer(cfg.trend),
      _state(STATE_IDLE),
      _ble(BLE_UNKNOWN),
      _intent(INTENT_NEUTRAL),
      _scanOutstanding(false),
      _cooldownUntil(0),
      _doorOpens(0) {
}

void DecisionEngine::setState(SystemState next) {
    if (next == _state) return;
    if (_debug) LOG_DEBUG("[Logic] %s -> %s\n", systemStateName(_state), systemStateName(next));
    _state = next;

    if (next == STATE_IDLE) {
        _door.publishStatusEvent(STATUS_IDLE, 0);
    } else if (next == STATE_TRACKING) {
        _door.publishStatusEvent(STATUS_TRACKING, 0);
    }
}

void DecisionEngine::resetToIdle(const char* reason) {
    LOG_INFO("[Logic] Reset to IDLE: %s (BLE=%s)\n", reason, bleStatusName(_ble));
    _analyzer.clear();
    _intent = INTENT_NEUTRAL;
    setState(STATE_IDLE);
}

// ---------------------------------------------------------
// Identity scan bookkeeping
// ---------------------------------------------------------
bool DecisionEngine::pollScan() {
    if (!_scanOutstanding) return false;

    switch (_scanner.poll()) {
        case SCAN_SUCCESS:
            _scanOutstanding = false;
            _ble = BLE_SUCCESS;
            LOG_INFO("[Logic] Identity confirmed\n");
            return false;
        case SCAN_FAILED:
            _scanOutstanding = false;
            _ble = BLE_FAILED;
            LOG_INFO("[Logic] No authorized beacon found\n");
            return true;
        case SCAN_PENDING:
        default:
            return false;
    }
}

void DecisionEngine::startScanIfNeeded() {
    if (_scanOutstanding) return;
    if (_ble != BLE_UNKNOWN && _ble != BLE_FAILED) return;

    if (!_scanner.startScan(_cfg.scanTimeoutMs)) {
        LOG_WARN("[Logic] Identity scan could not be started\n");
        _ble = BLE_FAILED;
        return;
    }
    _scanOutstanding = true;
    _ble = BLE_SCANNING;
    LOG_INFO("[Logic] Identity scan started (%lums)\n", (unsigned long)_cfg.scanTimeoutMs);
}

void DecisionEngine::cancelScan() {
    if (!_scanOutstanding) return;
    _scanner.cancel();
    _scanOutstanding = false;
    _ble = BLE_FAILED;
    LOG_INFO("[Logic] Identity scan cancelled\n");
}

// ---------------------------------------------------------
// Acute trigger: the visitor crosses x = 0 in front of the door
// ---------------------------------------------------------
bool DecisionEngine::acuteTriggerFires(const TargetObservation& prev, const TargetObservation& cur) const {
    const int sign = _cfg.trend.expectedXSign < 0 ? -1 : 1;

    bool prevOnApproachSide = (sign < 0) ? (prev.x < 0) : (prev.x > 0);
    if (!prevOnApproachSide) return false;

    bool curOnOppositeSide = (sign < 0) ? (cur.x > 0) : (cur.x < 0);
    if (curOnOppositeSide) return true;

    if (cur.x == 0) {
        // Zero crossings far away or far off-axis are mostly noise
        return prev.y <= _cfg.signChangeYMaxMm && abs(prev.x) < _cfg.signChangeXMaxMm;
    }
    return false;
}

void DecisionEngine::fireDoorOpen(const TargetObservation& prev, const TargetObservation& cur) {
    LOG_INFO("[Logic] >>> Threshold crossed (x %d -> %d, y %d). Opening door.\n", prev.x, cur.x, cur.y);

    if (_cfg.comfortDelayMs > 0) {
        _clock.sleepMs(_cfg.comfortDelayMs);
    }

    if (!_door.sendDoorOpenCommand(_cfg.relayDurationSec)) {
        LOG_ERROR("[Logic] Door open command failed\n");
    }
    _door.publishStatusEvent(STATUS_ACCESS_GRANTED, _cfg.grantedDisplayMs);
    _doorOpens++;

    // A fresh approach must earn both checks again
    cancelScan();
    _ble = BLE_UNKNOWN;
    _analyzer.clear();
    _intent = INTENT_NEUTRAL;

    _cooldownUntil = _clock.nowMs() + _cfg.cooldownMs;
    setState(STATE_COOLDOWN);
    LOG_INFO("[Logic] Cooldown for %lums\n", (unsigned long)_cfg.cooldownMs);
}

// ---------------------------------------------------------
// One logic cycle
// ---------------------------------------------------------
void DecisionEngine::step(const RadarReading& reading) {
    uint32_t now = _clock.nowMs();

    if (_state == STATE_COOLDOWN) {
        if ((int32_t)(now - _cooldownUntil) < 0) {
            return;  // drained, ignored
        }
        LOG_INFO("[Logic] Cooldown over\n");
        setState(STATE_IDLE);
    }

    bool scanFailedNow = pollScan();

    // Acute check first: a same-cycle reset must not swallow a valid crossing
    if (reading.hasTarget && _state == STATE_TRACKING && _ble == BLE_SUCCESS &&
        _intent == INTENT_COMING && !_analyzer.empty()) {
        TargetObservation prev = _analyzer.latest();
        if (acuteTriggerFires(prev, reading.target)) {
            fireDoorOpen(prev, reading.target);
            return;
        }
    }

    if (!reading.hasTarget) {
        // Cached identity result and any running scan survive a lost target
        if (_state == STATE_TRACKING) resetToIdle("target lost");
        return;
    }

    if (_state == STATE_TRACKING && scanFailedNow) {
        resetToIdle("identity failed");
        return;
    }

    if (_state == STATE_IDLE) {
        LOG_INFO("[Logic] Target acquired at x=%d y=%d\n", reading.target.x, reading.target.y);
        setState(STATE_TRACKING);
    }

    _analyzer.addSample(reading.target);

    if (_analyzer.isFull()) {
        IntentStatus trend = _analyzer.classify();
        if (trend != INTENT_NEUTRAL && trend != _intent) {
            LOG_INFO("[Logic] Intent %s -> %s\n", intentStatusName(_intent), intentStatusName(trend));
            _intent = trend;
        }
    }

    if (_intent == INTENT_LEAVING) {
        if (_scanOutstanding) {
            cancelScan();
        } else {
            _ble = BLE_UNKNOWN;
        }
        resetToIdle("subject leaving");
        return;
    }

    startScanIfNeeded();

    if (_debug) {
        LOG_DEBUG("[Logic] n=%u intent=%s ble=%s x=%d y=%d\n", (unsigned)_analyzer.size(),
                  intentStatusName(_intent), bleStatusName(_ble), reading.target.x, reading.target.y);
    }
}

void DecisionEngine::shutdown() {
    cancelScan();
    LOG_INFO("[Logic] Decision engine stopped\n");
}
