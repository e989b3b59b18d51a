#pragma once
#include <stdint.h>
#include <stddef.h>

// Byte-level UART seam used by RadarTransport.
class SerialPort {
public:
    virtual ~SerialPort() {}

    virtual bool open(uint32_t baud) = 0;
    virtual void close() = 0;
    virtual size_t available() = 0;
    virtual size_t read(uint8_t* buf, size_t maxLen) = 0;
    virtual size_t write(const uint8_t* data, size_t len) = 0;
    virtual void clearInput() = 0;
};
