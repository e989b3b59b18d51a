#pragma once
#include <stdint.h>

enum ScanOutcome {
    SCAN_PENDING,
    SCAN_SUCCESS,
    SCAN_FAILED
};

// On-demand, time-bounded "is an authorized credential nearby" check.
// At most one scan runs at a time.
class IdentityScanner {
public:
    virtual ~IdentityScanner() {}

    // Starts a background scan. false if it could not be started.
    virtual bool startScan(uint32_t timeoutMs) = 0;

    // PENDING while running; SUCCESS or FAILED exactly once when settled.
    virtual ScanOutcome poll() = 0;

    // Abandons a running scan and waits briefly for it to wind down.
    virtual void cancel() = 0;
};
