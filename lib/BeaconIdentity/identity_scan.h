#pragma once
#include <stdint.h>
#include <atomic>
#include "clock.h"
#include "identity_scanner.h"
#include "beacon_registry.h"

// One advertisement as copied out of the BLE host callback.
struct RawAdvertisement {
    char mac[18];
    uint8_t len;
    uint8_t payload[62];   // advertisement + scan response
};

// Where the scan loop takes advertisements from.
class AdvertisementSource {
public:
    virtual ~AdvertisementSource() {}

    // Waits up to waitMs for the next advertisement. false if none arrived.
    virtual bool receive(RawAdvertisement& adv, uint32_t waitMs) = 0;
};

struct ScanSummary {
    ScanOutcome outcome;     // SCAN_SUCCESS or SCAN_FAILED
    bool cancelled;
    uint32_t processed;      // advertisements handed to the registry
    uint32_t elapsedMs;
};

static constexpr uint32_t SCAN_RECEIVE_SLICE_MS = 20;

/**
 * @brief Feeds advertisements into the registry until an allowed credential
 * is fully identified, timeoutMs passes, or cancel is raised.
 *
 * Stale facets are expired first. Every advertisement from the same sender
 * counts, so facets rotated by one beacon accumulate within a single scan.
 * A cancelled scan is always FAILED.
 */
ScanSummary runIdentityScan(BeaconRegistry& registry,
                            AdvertisementSource& source,
                            Clock& clock,
                            uint32_t timeoutMs,
                            const std::atomic<bool>& cancel);
