#include "radar_protocol.h"
#include <string.h>

static const uint8_t RD03D_HEADER[]  = {0xAA, 0xFF};
static const uint8_t LD2450_HEADER[] = {0xAA, 0xFF, 0x03, 0x00};

const char* radarVariantName(RadarVariant variant) {
    return variant == RADAR_LD2450 ? "LD2450" : "RD-03D";
}

int16_t decodeSignMagnitude(uint16_t raw) {
    int16_t magnitude = (int16_t)(raw & 0x7FFF);
    return (raw & 0x8000) ? magnitude : (int16_t)-magnitude;
}

uint16_t encodeSignMagnitude(int16_t value) {
    if (value >= 0) {
        return (uint16_t)(0x8000 | (uint16_t)value);
    }
    int32_t magnitude = -(int32_t)value;
    if (magnitude > 0x7FFF) magnitude = 0x7FFF;  // -32768 has no encoding
    return (uint16_t)magnitude;
}

static inline uint16_t readLE16(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}

FrameDecoder::FrameDecoder(RadarVariant variant)
    : _variant(variant),
      _header(variant == RADAR_LD2450 ? LD2450_HEADER : RD03D_HEADER),
      _headerLen(variant == RADAR_LD2450 ? sizeof(LD2450_HEADER) : sizeof(RD03D_HEADER)),
      _len(0),
      _framesDecoded(0),
      _framesDropped(0) {
}

void FrameDecoder::reset() {
    _len = 0;
}

bool FrameDecoder::feed(const uint8_t* data, size_t len, uint32_t nowMs, RadarReading& out) {
    bool decoded = false;
    size_t offset = 0;

    while (offset < len) {
        size_t n = BUFFER_CAPACITY - _len;
        if (n > len - offset) n = len - offset;
        memcpy(_buf + _len, data + offset, n);
        _len += n;
        offset += n;

        if (parseBuffer(nowMs, out)) decoded = true;

        // Sustained noise without a header: bound memory
        if (_len > MAX_BUFFERED) {
            memmove(_buf, _buf + (_len - KEEP_ON_TRUNCATE), KEEP_ON_TRUNCATE);
            _len = KEEP_ON_TRUNCATE;
        }
    }
    return decoded;
}

long FrameDecoder::findHeader(size_t from) const {
    if (_len < _headerLen) return -1;
    for (size_t i = from; i + _headerLen <= _len; i++) {
        if (memcmp(_buf + i, _header, _headerLen) == 0) return (long)i;
    }
    return -1;
}

bool FrameDecoder::parseBuffer(uint32_t nowMs, RadarReading& out) {
    bool decoded = false;
    size_t consumed = 0;

    for (;;) {
        long found = findHeader(consumed);
        if (found < 0) break;  // no header: keep the rest, wait for more

        size_t start = (size_t)found;
        if (_len - start < FRAME_LENGTH) {
            consumed = start;  // partial frame: keep from header on
            break;
        }

        const uint8_t* frame = _buf + start;
        if (frame[FRAME_LENGTH - 2] != TAIL_0 || frame[FRAME_LENGTH - 1] != TAIL_1) {
            _framesDropped++;
            consumed = start + _headerLen;  // resync past the bad header
            continue;
        }

        decodeFrame(frame, nowMs, out);
        _framesDecoded++;
        decoded = true;
        consumed = start + FRAME_LENGTH;
    }

    if (consumed > 0) {
        memmove(_buf, _buf + consumed, _len - consumed);
        _len -= consumed;
    }
    return decoded;
}

void FrameDecoder::decodeFrame(const uint8_t* frame, uint32_t nowMs, RadarReading& out) const {
    out.hasTarget = false;
    out.target.x = 0;
    out.target.y = 0;
    out.target.speed = 0;
    out.target.timestampMs = nowMs;

    for (size_t slot = 0; slot < TARGET_SLOTS; slot++) {
        const uint8_t* t = frame + TARGET_OFFSET + slot * TARGET_SLOT_SIZE;
        int16_t x = decodeSignMagnitude(readLE16(t));
        int16_t y = decodeSignMagnitude(readLE16(t + 2));
        int16_t speed = decodeSignMagnitude(readLE16(t + 4));

        bool empty;
        if (_variant == RADAR_LD2450) {
            empty = (x == 0 && y == 0 && speed == 0);
        } else {
            empty = (x == 0 && y == 0);
        }
        if (empty) continue;

        out.hasTarget = true;
        out.target.x = x;
        out.target.y = y;
        out.target.speed = speed;
        return;
    }
}
