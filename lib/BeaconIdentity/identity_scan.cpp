#include "identity_scan.h"

ScanSummary runIdentityScan(BeaconRegistry& registry,
                            AdvertisementSource& source,
                            Clock& clock,
                            uint32_t timeoutMs,
                            const std::atomic<bool>& cancel) {
    ScanSummary summary;
    summary.outcome = SCAN_FAILED;
    summary.cancelled = false;
    summary.processed = 0;
    summary.elapsedMs = 0;

    const uint32_t start = clock.nowMs();
    registry.expireStale(start);

    RawAdvertisement adv;
    while (!cancel.load()) {
        uint32_t elapsed = clock.nowMs() - start;
        if (elapsed >= timeoutMs) break;

        uint32_t wait = timeoutMs - elapsed;
        if (wait > SCAN_RECEIVE_SLICE_MS) wait = SCAN_RECEIVE_SLICE_MS;

        if (!source.receive(adv, wait)) continue;

        summary.processed++;
        if (registry.processAdvertisement(adv.mac, adv.payload, adv.len, clock.nowMs())) {
            summary.outcome = SCAN_SUCCESS;
            break;
        }
    }

    if (cancel.load()) {
        summary.cancelled = true;
        summary.outcome = SCAN_FAILED;
    }
    summary.elapsedMs = clock.nowMs() - start;
    return summary;
}
