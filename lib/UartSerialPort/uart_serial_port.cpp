#include "uart_serial_port.h"

UartSerialPort::UartSerialPort(uint8_t uartNum, int8_t rxPin, int8_t txPin, bool debug)
    : _serial(uartNum), _rxPin(rxPin), _txPin(txPin), _debug(debug), _open(false) {
}

bool UartSerialPort::open(uint32_t baud) {
    if (_open) return true;

    _serial.setRxBufferSize(RX_BUFFER_SIZE);
    _serial.begin(baud, SERIAL_8N1, _rxPin, _txPin);
    _open = true;

    if (_debug) {
        Serial.printf("[UART] Opened at %lu baud (rx %d, tx %d)\n", (unsigned long)baud, _rxPin, _txPin);
    }
    return true;
}

void UartSerialPort::close() {
    if (!_open) return;
    _serial.end();
    _open = false;
    if (_debug) Serial.println("[UART] Closed");
}

size_t UartSerialPort::available() {
    if (!_open) return 0;
    int n = _serial.available();
    return n > 0 ? (size_t)n : 0;
}

size_t UartSerialPort::read(uint8_t* buf, size_t maxLen) {
    if (!_open) return 0;
    return _serial.read(buf, maxLen);
}

size_t UartSerialPort::write(const uint8_t* data, size_t len) {
    if (!_open) return 0;
    size_t written = _serial.write(data, len);
    _serial.flush();
    return written;
}

void UartSerialPort::clearInput() {
    if (!_open) return;
    unsigned long start = millis();
    while (_serial.available() > 0 && (millis() - start < FLUSH_TIMEOUT_MS)) {
        _serial.read();
    }
}
