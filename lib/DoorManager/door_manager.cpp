/*
 * DoorManager.cpp
 * Non-blocking relay driver for the door opener.
 */

#include "door_manager.h"
#include "system_config.h"
#include "log.h"

DoorManager::DoorManager(int relayPin, LedManager& led, uint32_t minIntervalMs,
                         bool debug, bool activeHigh)
    : _pin(relayPin),
      _led(led),
      _minIntervalMs(minIntervalMs),
      _debug(debug),
      _activeHigh(activeHigh),
      _currentState(IDLE),
      _stateStartTime(0),
      _lastCommandTime(0),
      _hasCommanded(false),
      _holdMs(0),
      _lock(portMUX_INITIALIZER_UNLOCKED) {
}

void DoorManager::begin() {
    pinMode(_pin, OUTPUT);
    drive(false);          // relay released
    _currentState = IDLE;
    if (_debug) Serial.println("DOOR: DoorManager initialized.");
}

bool DoorManager::sendDoorOpenCommand(uint8_t durationSec) {
    if (durationSec < MIN_RELAY_DURATION_SEC || durationSec > MAX_RELAY_DURATION_SEC) {
        LOG_ERROR("[Door] Duration %us outside %u..%us\n",
                  durationSec, MIN_RELAY_DURATION_SEC, MAX_RELAY_DURATION_SEC);
        return false;
    }

    unsigned long now = millis();
    bool accepted = false;
    bool tooSoon = false;

    portENTER_CRITICAL(&_lock);
    if (_hasCommanded && (now - _lastCommandTime < _minIntervalMs)) {
        tooSoon = true;
    } else if (_currentState == IDLE) {
        _currentState = RELAY_ON;
        _stateStartTime = now;
        _lastCommandTime = now;
        _hasCommanded = true;
        _holdMs = (uint32_t)durationSec * 1000UL;
        drive(true);
        accepted = true;
    }
    portEXIT_CRITICAL(&_lock);

    if (tooSoon) {
        LOG_WARN("[Door] Command ignored, last one %lums ago\n", now - _lastCommandTime);
        return false;
    }
    if (!accepted) {
        LOG_WARN("[Door] Relay already active\n");
        return false;
    }

    LOG_INFO("[Door] Relay on for %us\n", durationSec);
    return true;
}

void DoorManager::publishStatusEvent(StatusEvent kind, uint32_t durationMs) {
    if (_debug) Serial.printf("DOOR: status %s (%lums)\n", statusEventName(kind), (unsigned long)durationMs);
    _led.showStatus(kind, durationMs);
}

void DoorManager::update() {
    if (_currentState == IDLE) return;

    bool released = false;
    portENTER_CRITICAL(&_lock);
    if (_currentState == RELAY_ON && (millis() - _stateStartTime >= _holdMs)) {
        drive(false);
        _currentState = IDLE;
        released = true;
    }
    portEXIT_CRITICAL(&_lock);

    if (released && _debug) Serial.println("DOOR: Relay released, returning to IDLE.");
}

void DoorManager::deactivate() {
    portENTER_CRITICAL(&_lock);
    drive(false);
    _currentState = IDLE;
    portEXIT_CRITICAL(&_lock);
    if (_debug) Serial.println("DOOR: Deactivated.");
}
