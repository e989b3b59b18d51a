#pragma once
#include <Arduino.h>
#include "serial_port.h"

// SerialPort on one of the ESP32 hardware UARTs.
class UartSerialPort : public SerialPort {
public:
    UartSerialPort(uint8_t uartNum, int8_t rxPin, int8_t txPin, bool debug = false);

    bool open(uint32_t baud) override;
    void close() override;
    size_t available() override;
    size_t read(uint8_t* buf, size_t maxLen) override;
    size_t write(const uint8_t* data, size_t len) override;
    void clearInput() override;

private:
    HardwareSerial _serial;
    int8_t _rxPin;
    int8_t _txPin;
    bool _debug;
    bool _open;

    static constexpr size_t RX_BUFFER_SIZE = 1024;
    static constexpr unsigned long FLUSH_TIMEOUT_MS = 500;
};
