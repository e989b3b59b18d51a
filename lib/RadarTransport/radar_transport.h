#pragma once
#include <stdint.h>
#include <stddef.h>
#include <memory>
#include "clock.h"
#include "serial_port.h"
#include "radar_protocol.h"

/*
 * RadarTransport
 *
 * Owns the UART link to one radar module. connect() opens the port and runs
 * the module specific handshake; every handshake step must see its ACK.
 */
class RadarTransport {
public:
    RadarTransport(SerialPort& port, Clock& clock, bool debug = false);
    virtual ~RadarTransport() {}

    /**
     * @brief Opens the link and configures the module for single target tracking.
     * @return false if the port could not be opened or any handshake step failed.
     */
    bool connect();
    void close();

    // Drains whatever the UART holds right now (non-blocking).
    size_t pollAvailableBytes(uint8_t* buf, size_t maxLen);

    /**
     * @brief Writes a command and waits until expectedAck appears anywhere in
     * the bytes received within timeoutMs (report frames may precede it).
     */
    bool sendAndAwaitAck(const uint8_t* command, size_t commandLen,
                         const uint8_t* expectedAck, size_t ackLen,
                         uint32_t timeoutMs = ACK_TIMEOUT_MS);

    bool isConnected() const { return _connected; }
    virtual RadarVariant variant() const = 0;

    static constexpr uint32_t BAUD_RATE = 256000;
    static constexpr uint32_t ACK_TIMEOUT_MS = 1000;
    static constexpr uint32_t SETTLE_MS = 200;

protected:
    virtual bool handshake() = 0;

    SerialPort& _port;
    Clock& _clock;
    bool _debug;

private:
    bool _connected;

    static constexpr size_t ACK_BUFFER_SIZE = 128;
    static constexpr uint32_t ACK_POLL_MS = 10;
};

class Ld2450Transport : public RadarTransport {
public:
    Ld2450Transport(SerialPort& port, Clock& clock, bool debug = false)
        : RadarTransport(port, clock, debug) {}

    RadarVariant variant() const override { return RADAR_LD2450; }

protected:
    bool handshake() override;

private:
    static constexpr uint32_t STEP_GAP_MS = 50;
};

class Rd03dTransport : public RadarTransport {
public:
    Rd03dTransport(SerialPort& port, Clock& clock, bool debug = false)
        : RadarTransport(port, clock, debug), _multiTarget(false) {}

    RadarVariant variant() const override { return RADAR_RD03D; }

    // Switches tracking mode on a connected module.
    bool setMultiTarget(bool multi);
    bool isMultiTarget() const { return _multiTarget; }

protected:
    bool handshake() override;

private:
    bool _multiTarget;
};

std::unique_ptr<RadarTransport> createRadarTransport(RadarVariant variant,
                                                     SerialPort& port,
                                                     Clock& clock,
                                                     bool debug = false);
