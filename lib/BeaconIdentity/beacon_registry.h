#pragma once
#include <stdint.h>
#include <stddef.h>
#include <map>
#include <string>
#include "beacon_identity.h"
#include "beacon_frames.h"

// Per-credential accumulation of identity facets.
struct IdentificationState {
    const KnownBeacon* credential;
    uint32_t lastSeenMs;
    bool seen;
    bool fullyIdentified;
    bool hasIBeacon;
    bool hasUid;
    bool hasUrl;

    void clearFacets() {
        fullyIdentified = false;
        hasIBeacon = false;
        hasUid = false;
        hasUrl = false;
    }
};

/*
 * BeaconRegistry
 *
 * Owns the identification map, keyed by upper case MAC. Written only by the
 * scan task; the decision engine only ever sees the scan outcome.
 */
class BeaconRegistry {
public:
    BeaconRegistry(const IdentityConfig& cfg, bool debug = false);

    // Creates an empty state for every configured credential.
    void begin();

    /**
     * @brief Decodes one advertisement and folds it into the sender's state.
     * @param mac Source address, any case.
     * @return true if the sender is now allowed and fully identified.
     */
    bool processAdvertisement(const char* mac, const uint8_t* payload, size_t len, uint32_t nowMs);
    bool processFrames(const char* mac, const AdvertisementFrames& frames, uint32_t nowMs);

    // Clears the facets of every credential not heard within its timeout.
    void expireStale(uint32_t nowMs);

    bool authorizedPresent() const;
    const IdentificationState* find(const char* mac) const;
    size_t size() const { return _states.size(); }

    static std::string normalizeMac(const char* mac);

private:
    bool matchIBeacon(const KnownBeacon& b, const IBeaconFrame& f) const;
    bool matchUid(const KnownBeacon& b, const EddystoneUidFrame& f) const;
    bool matchUrl(const KnownBeacon& b, const std::string& url) const;
    bool criteriaSatisfied(const IdentificationState& st) const;
    bool isExpired(const IdentificationState& st, uint32_t nowMs) const;

    const IdentityConfig& _cfg;
    std::string _ibeaconUuid;
    std::string _namespaceId;
    std::map<std::string, IdentificationState> _states;
    bool _debug;
};
