#include "led_manager.h"

LedManager::LedManager(int pin, uint8_t brightness)
  : _pin(pin), _brightness(brightness),
    _targetR(0), _targetG(0), _targetB(0),
    _initialized(false),
    _resting(STATUS_IDLE), _timed(STATUS_IDLE),
    _timedActive(false), _timedStart(0), _timedDuration(0),
    _dirty(false),
    _lock(portMUX_INITIALIZER_UNLOCKED) {
}

void LedManager::begin() {
    if (_initialized) return;

    pinMode(_pin, OUTPUT);
    digitalWrite(_pin, LOW);       // WS2812 idle low
    delay(10);
    delayMicroseconds(300);        // reset/latch gap before first frame

    _initialized = true;
    writeColor();
}

void LedManager::setColor(uint8_t r, uint8_t g, uint8_t b) {
    _targetR = r;
    _targetG = g;
    _targetB = b;
    writeColor();
}

void LedManager::writeColor() {
    if (!_initialized) return;
    neopixelWrite(_pin, scale(_targetR), scale(_targetG), scale(_targetB));
}

void LedManager::setOff() {
    setColor(0, 0, 0);
}

void LedManager::applyStatus(StatusEvent kind) {
    switch (kind) {
        case STATUS_ACCESS_GRANTED: setColor(0, 255, 0);   break;
        case STATUS_TRACKING:       setColor(0, 0, 255);   break;
        case STATUS_FAULT:          setColor(255, 0, 0);   break;
        case STATUS_IDLE:
        default:                    setColor(0, 40, 0);    break;
    }
}

// May be called from the logic task; the pixel itself is only written from loop().
void LedManager::showStatus(StatusEvent kind, uint32_t durationMs) {
    portENTER_CRITICAL(&_lock);
    if (durationMs == 0) {
        _resting = kind;
    } else {
        _timed = kind;
        _timedActive = true;
        _timedStart = millis();
        _timedDuration = durationMs;
    }
    _dirty = true;
    portEXIT_CRITICAL(&_lock);
}

void LedManager::update() {
    portENTER_CRITICAL(&_lock);
    if (_timedActive && (millis() - _timedStart >= _timedDuration)) {
        _timedActive = false;
        _dirty = true;
    }
    bool dirty = _dirty;
    StatusEvent show = _timedActive ? _timed : _resting;
    _dirty = false;
    portEXIT_CRITICAL(&_lock);

    if (dirty) applyStatus(show);
}
