#pragma once
#include <stdint.h>
#include "shared_types.h"
#include "clock.h"
#include "radar_protocol.h"
#include "radar_transport.h"

/*
 * RadarReader
 *
 * Body of the reader task. poll() is called once per loop interval; the
 * task publishes whatever it returns into the single-slot queue.
 */
class RadarReader {
public:
    RadarReader(RadarTransport& transport, Clock& clock, bool debug = false);

    /**
     * @brief Drains the UART and decodes.
     * @param out Newest reading of this tick (target or explicit absence).
     * @return true if a frame was decoded and should be published.
     */
    bool poll(RadarReading& out);

    // Closes the transport. Called when the reader task is torn down.
    void stop();

    static constexpr uint32_t DEFAULT_LOOP_INTERVAL_MS = 50;

private:
    RadarTransport& _transport;
    Clock& _clock;
    FrameDecoder _decoder;
    bool _debug;
    bool _lastHadTarget;
    uint32_t _lastDropped;

    static constexpr size_t CHUNK_SIZE = 256;
    uint8_t _chunk[CHUNK_SIZE];
};
