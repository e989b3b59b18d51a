#include "radar_transport.h"
#include "log.h"
#include <string.h>

// Command frames: FD FC FB FA <len LE> <cmd LE> [value] 04 03 02 01
static const uint8_t CMD_ENABLE_CONFIG[] = {0xFD, 0xFC, 0xFB, 0xFA, 0x04, 0x00, 0xFF, 0x00, 0x01, 0x00, 0x04, 0x03, 0x02, 0x01};
static const uint8_t ACK_ENABLE_CONFIG[] = {0xFD, 0xFC, 0xFB, 0xFA, 0x08, 0x00, 0xFF, 0x01, 0x00, 0x00};

static const uint8_t CMD_SINGLE_TARGET[] = {0xFD, 0xFC, 0xFB, 0xFA, 0x02, 0x00, 0x80, 0x00, 0x04, 0x03, 0x02, 0x01};
static const uint8_t ACK_SINGLE_TARGET[] = {0xFD, 0xFC, 0xFB, 0xFA, 0x04, 0x00, 0x80, 0x01, 0x00, 0x00};

static const uint8_t CMD_MULTI_TARGET[] = {0xFD, 0xFC, 0xFB, 0xFA, 0x02, 0x00, 0x90, 0x00, 0x04, 0x03, 0x02, 0x01};
static const uint8_t ACK_MULTI_TARGET[] = {0xFD, 0xFC, 0xFB, 0xFA, 0x04, 0x00, 0x90, 0x01, 0x00, 0x00};

static const uint8_t CMD_END_CONFIG[] = {0xFD, 0xFC, 0xFB, 0xFA, 0x02, 0x00, 0xFE, 0x00, 0x04, 0x03, 0x02, 0x01};
static const uint8_t ACK_END_CONFIG[] = {0xFD, 0xFC, 0xFB, 0xFA, 0x04, 0x00, 0xFE, 0x01, 0x00, 0x00};

RadarTransport::RadarTransport(SerialPort& port, Clock& clock, bool debug)
    : _port(port), _clock(clock), _debug(debug), _connected(false) {
}

bool RadarTransport::connect() {
    const char* name = radarVariantName(variant());

    if (!_port.open(BAUD_RATE)) {
        LOG_ERROR("[Radar] %s: could not open UART at %lu baud\n", name, (unsigned long)BAUD_RATE);
        return false;
    }
    _clock.sleepMs(SETTLE_MS);

    if (!handshake()) {
        LOG_ERROR("[Radar] %s: handshake failed\n", name);
        _port.close();
        return false;
    }

    // Stale ACK bytes must never reach the frame decoder
    _port.clearInput();
    _connected = true;
    LOG_INFO("[Radar] %s connected\n", name);
    return true;
}

void RadarTransport::close() {
    if (!_connected) return;
    _port.close();
    _connected = false;
    LOG_INFO("[Radar] %s link closed\n", radarVariantName(variant()));
}

size_t RadarTransport::pollAvailableBytes(uint8_t* buf, size_t maxLen) {
    size_t n = _port.available();
    if (n == 0) return 0;
    if (n > maxLen) n = maxLen;
    return _port.read(buf, n);
}

bool RadarTransport::sendAndAwaitAck(const uint8_t* command, size_t commandLen,
                                     const uint8_t* expectedAck, size_t ackLen,
                                     uint32_t timeoutMs) {
    if (ackLen == 0 || ackLen > ACK_BUFFER_SIZE) return false;

    _port.clearInput();
    if (_port.write(command, commandLen) != commandLen) {
        LOG_WARN("[Radar] Short write on command 0x%02X\n", commandLen > 6 ? command[6] : 0);
        return false;
    }

    uint8_t rx[ACK_BUFFER_SIZE];
    size_t rxLen = 0;
    uint32_t start = _clock.nowMs();

    for (;;) {
        size_t avail = _port.available();
        while (avail > 0) {
            if (rxLen == ACK_BUFFER_SIZE) {
                // Keep the tail that could still hold a partial ACK
                size_t keep = ackLen - 1;
                memmove(rx, rx + rxLen - keep, keep);
                rxLen = keep;
            }
            size_t room = ACK_BUFFER_SIZE - rxLen;
            size_t got = _port.read(rx + rxLen, avail < room ? avail : room);
            if (got == 0) break;
            rxLen += got;
            avail = _port.available();

            for (size_t i = 0; i + ackLen <= rxLen; i++) {
                if (memcmp(rx + i, expectedAck, ackLen) == 0) {
                    if (_debug) LOG_DEBUG("[Radar] ACK for command 0x%02X\n", command[6]);
                    return true;
                }
            }
        }

        if (_clock.nowMs() - start >= timeoutMs) break;
        _clock.sleepMs(ACK_POLL_MS);
    }

    LOG_WARN("[Radar] No ACK for command 0x%02X within %lums\n",
             commandLen > 6 ? command[6] : 0, (unsigned long)timeoutMs);
    return false;
}

// ---------------------------------------------------------
// LD2450: enable config -> single target -> end config
// ---------------------------------------------------------
bool Ld2450Transport::handshake() {
    if (!sendAndAwaitAck(CMD_ENABLE_CONFIG, sizeof(CMD_ENABLE_CONFIG),
                         ACK_ENABLE_CONFIG, sizeof(ACK_ENABLE_CONFIG))) {
        LOG_ERROR("[Radar] LD2450: enable configuration not acknowledged\n");
        return false;
    }
    _clock.sleepMs(STEP_GAP_MS);

    if (!sendAndAwaitAck(CMD_SINGLE_TARGET, sizeof(CMD_SINGLE_TARGET),
                         ACK_SINGLE_TARGET, sizeof(ACK_SINGLE_TARGET))) {
        LOG_ERROR("[Radar] LD2450: single target mode not acknowledged\n");
        return false;
    }
    _clock.sleepMs(STEP_GAP_MS);

    if (!sendAndAwaitAck(CMD_END_CONFIG, sizeof(CMD_END_CONFIG),
                         ACK_END_CONFIG, sizeof(ACK_END_CONFIG))) {
        LOG_ERROR("[Radar] LD2450: end configuration not acknowledged\n");
        return false;
    }
    return true;
}

// ---------------------------------------------------------
// RD-03D: one mode-select command
// ---------------------------------------------------------
bool Rd03dTransport::handshake() {
    return setMultiTarget(false);
}

bool Rd03dTransport::setMultiTarget(bool multi) {
    bool ok = multi
        ? sendAndAwaitAck(CMD_MULTI_TARGET, sizeof(CMD_MULTI_TARGET), ACK_MULTI_TARGET, sizeof(ACK_MULTI_TARGET))
        : sendAndAwaitAck(CMD_SINGLE_TARGET, sizeof(CMD_SINGLE_TARGET), ACK_SINGLE_TARGET, sizeof(ACK_SINGLE_TARGET));
    if (!ok) {
        LOG_ERROR("[Radar] RD-03D: %s mode not acknowledged\n", multi ? "multi target" : "single target");
        return false;
    }
    _multiTarget = multi;
    if (_debug) LOG_DEBUG("[Radar] RD-03D: %s mode active\n", multi ? "multi target" : "single target");
    return true;
}

std::unique_ptr<RadarTransport> createRadarTransport(RadarVariant variant,
                                                     SerialPort& port,
                                                     Clock& clock,
                                                     bool debug) {
    if (variant == RADAR_LD2450) {
        return std::unique_ptr<RadarTransport>(new Ld2450Transport(port, clock, debug));
    }
    return std::unique_ptr<RadarTransport>(new Rd03dTransport(port, clock, debug));
}
