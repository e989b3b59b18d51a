#include "radar_reader.h"
#include "log.h"

RadarReader::RadarReader(RadarTransport& transport, Clock& clock, bool debug)
    : _transport(transport),
      _clock(clock),
      _decoder(transport.variant()),
      _debug(debug),
      _lastHadTarget(false),
      _lastDropped(0) {
}

bool RadarReader::poll(RadarReading& out) {
    bool decoded = false;
    uint32_t now = _clock.nowMs();

    for (;;) {
        size_t n = _transport.pollAvailableBytes(_chunk, CHUNK_SIZE);
        if (n == 0) break;
        if (_decoder.feed(_chunk, n, now, out)) decoded = true;
        if (n < CHUNK_SIZE) break;
    }

    if (_decoder.framesDropped() != _lastDropped) {
        LOG_DEBUG("[Radar] Resynced after %lu corrupt frame(s)\n",
                  (unsigned long)(_decoder.framesDropped() - _lastDropped));
        _lastDropped = _decoder.framesDropped();
    }

    if (decoded && _debug && out.hasTarget != _lastHadTarget) {
        if (out.hasTarget) {
            LOG_DEBUG("[Radar] Target x=%d y=%d v=%d (%.0fmm, %.1fdeg)\n",
                      out.target.x, out.target.y, out.target.speed,
                      out.target.distanceMm(), out.target.angleDeg());
        } else {
            LOG_DEBUG("[Radar] Target gone\n");
        }
    }
    if (decoded) _lastHadTarget = out.hasTarget;

    return decoded;
}

void RadarReader::stop() {
    _transport.close();
}
