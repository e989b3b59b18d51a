#pragma once
#include <stdint.h>
#include <stddef.h>
#include "shared_types.h"

enum RadarVariant {
    RADAR_RD03D,
    RADAR_LD2450
};

const char* radarVariantName(RadarVariant variant);

// Axis fields on the wire: bit 15 set = positive, clear = negative,
// low 15 bits = magnitude. Not two's complement.
int16_t decodeSignMagnitude(uint16_t raw);
uint16_t encodeSignMagnitude(int16_t value);

/*
 * FrameDecoder
 *
 * Turns the raw UART byte stream of an RD-03D or LD2450 into target readings.
 * Keeps its own accumulation buffer, so partial frames may be fed across
 * several calls. Only the newest complete frame of each feed() is reported.
 * A frame carries three target slots; the first non-empty one is the target
 * (slots 2 and 3 stay empty in single target mode).
 */
class FrameDecoder {
public:
    explicit FrameDecoder(RadarVariant variant);

    /**
     * @brief Appends bytes and extracts every complete frame.
     * @param out Receives the newest decoded reading (target or explicit absence).
     * @return true if at least one valid frame was decoded.
     */
    bool feed(const uint8_t* data, size_t len, uint32_t nowMs, RadarReading& out);

    void reset();

    RadarVariant variant() const { return _variant; }
    size_t buffered() const { return _len; }
    uint32_t framesDecoded() const { return _framesDecoded; }
    uint32_t framesDropped() const { return _framesDropped; }

    static constexpr size_t FRAME_LENGTH = 30;
    static constexpr size_t MAX_BUFFERED = 300;      // truncate above this...
    static constexpr size_t KEEP_ON_TRUNCATE = 150;  // ...to the newest 150 bytes

private:
    bool parseBuffer(uint32_t nowMs, RadarReading& out);
    long findHeader(size_t from) const;
    void decodeFrame(const uint8_t* frame, uint32_t nowMs, RadarReading& out) const;

    static constexpr size_t BUFFER_CAPACITY = 512;
    static constexpr uint8_t TAIL_0 = 0x55;
    static constexpr uint8_t TAIL_1 = 0xCC;
    static constexpr size_t TARGET_OFFSET = 4;
    static constexpr size_t TARGET_SLOTS = 3;       // 8 bytes each: x, y, speed, resolution
    static constexpr size_t TARGET_SLOT_SIZE = 8;

    RadarVariant _variant;
    const uint8_t* _header;
    size_t _headerLen;

    uint8_t _buf[BUFFER_CAPACITY];
    size_t _len;

    uint32_t _framesDecoded;
    uint32_t _framesDropped;
};
