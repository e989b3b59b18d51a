#include "beacon_registry.h"
#include "log.h"
#include <ctype.h>
#include <string.h>

static std::string upperCopy(const std::string& s) {
    std::string out(s);
    for (size_t i = 0; i < out.size(); i++) {
        out[i] = (char)toupper((unsigned char)out[i]);
    }
    return out;
}

static bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (tolower((unsigned char)a[i]) != tolower((unsigned char)b[i])) return false;
    }
    return true;
}

const char* criterionLevelName(CriterionLevel level) {
    switch (level) {
        case CRITERION_REQUIRED: return "REQUIRED";
        case CRITERION_OPTIONAL: return "OPTIONAL";
        default:                 return "DISABLED";
    }
}

bool parseCriterionLevel(const char* text, CriterionLevel& out) {
    if (!text) return false;
    std::string t = upperCopy(text);
    if (t == "REQUIRED") { out = CRITERION_REQUIRED; return true; }
    if (t == "OPTIONAL") { out = CRITERION_OPTIONAL; return true; }
    if (t == "DISABLED") { out = CRITERION_DISABLED; return true; }
    return false;
}

std::string BeaconRegistry::normalizeMac(const char* mac) {
    return upperCopy(mac ? mac : "");
}

BeaconRegistry::BeaconRegistry(const IdentityConfig& cfg, bool debug)
    : _cfg(cfg),
      _ibeaconUuid(upperCopy(cfg.ibeaconUuid)),
      _namespaceId(upperCopy(cfg.eddystoneNamespaceId)),
      _debug(debug) {
}

void BeaconRegistry::begin() {
    _states.clear();
    for (size_t i = 0; i < _cfg.beacons.size(); i++) {
        const KnownBeacon& b = _cfg.beacons[i];
        if (b.macAddress.empty()) continue;

        IdentificationState st;
        st.credential = &b;
        st.lastSeenMs = 0;
        st.seen = false;
        st.clearFacets();
        _states[normalizeMac(b.macAddress.c_str())] = st;
    }
    LOG_INFO("[BLE] %u known beacon(s) registered\n", (unsigned)_states.size());
}

bool BeaconRegistry::matchIBeacon(const KnownBeacon& b, const IBeaconFrame& f) const {
    if (_ibeaconUuid.empty()) {
        LOG_WARN("[BLE] ibeacon_uuid not configured, cannot validate iBeacon\n");
        return false;
    }
    return f.uuid == _ibeaconUuid && f.major == b.ibeaconMajor && f.minor == b.ibeaconMinor;
}

bool BeaconRegistry::matchUid(const KnownBeacon& b, const EddystoneUidFrame& f) const {
    if (_namespaceId.empty()) {
        LOG_WARN("[BLE] eddystone_namespace_id not configured, cannot validate UID\n");
        return false;
    }
    return f.namespaceId == _namespaceId && f.instanceId == upperCopy(b.eddystoneInstanceId);
}

bool BeaconRegistry::matchUrl(const KnownBeacon& b, const std::string& url) const {
    return !b.eddystoneUrl.empty() && equalsIgnoreCase(url, b.eddystoneUrl);
}

bool BeaconRegistry::criteriaSatisfied(const IdentificationState& st) const {
    const AuthCriteria& c = st.credential->criteria;
    if (c.ibeacon == CRITERION_REQUIRED && !st.hasIBeacon) return false;
    if (c.eddystoneUid == CRITERION_REQUIRED && !st.hasUid) return false;
    if (c.eddystoneUrl == CRITERION_REQUIRED && !st.hasUrl) return false;
    // MAC is satisfied by the lookup itself
    return true;
}

bool BeaconRegistry::isExpired(const IdentificationState& st, uint32_t nowMs) const {
    return st.seen && (nowMs - st.lastSeenMs > st.credential->identificationTimeoutMs);
}

bool BeaconRegistry::processAdvertisement(const char* mac, const uint8_t* payload, size_t len, uint32_t nowMs) {
    AdvertisementFrames frames;
    parseAdvertisement(payload, len, frames);
    return processFrames(mac, frames, nowMs);
}

bool BeaconRegistry::processFrames(const char* mac, const AdvertisementFrames& frames, uint32_t nowMs) {
    std::map<std::string, IdentificationState>::iterator it = _states.find(normalizeMac(mac));
    if (it == _states.end()) return false;  // not one of ours

    IdentificationState& st = it->second;
    const KnownBeacon& b = *st.credential;

    if (isExpired(st, nowMs)) {
        if (_debug) LOG_DEBUG("[BLE] '%s' timed out, starting over\n", b.name.c_str());
        st.clearFacets();
    }

    if (frames.hasIBeacon) {
        if (matchIBeacon(b, frames.ibeacon)) {
            st.hasIBeacon = true;
        } else if (_debug) {
            LOG_DEBUG("[BLE] iBeacon mismatch for %s: %s %u/%u\n", mac,
                      frames.ibeacon.uuid.c_str(), frames.ibeacon.major, frames.ibeacon.minor);
        }
    }
    if (frames.hasUid) {
        if (matchUid(b, frames.uid)) {
            st.hasUid = true;
        } else if (_debug) {
            LOG_DEBUG("[BLE] UID mismatch for %s: %s/%s\n", mac,
                      frames.uid.namespaceId.c_str(), frames.uid.instanceId.c_str());
        }
    }
    if (frames.hasUrl) {
        if (matchUrl(b, frames.url)) {
            st.hasUrl = true;
        } else {
            LOG_INFO("[BLE] URL mismatch for %s: expected '%s', got '%s'\n", mac,
                     b.eddystoneUrl.c_str(), frames.url.c_str());
        }
    }

    st.lastSeenMs = nowMs;
    st.seen = true;

    if (!st.fullyIdentified && criteriaSatisfied(st)) {
        st.fullyIdentified = true;
        LOG_INFO("[BLE] *** '%s' (%s) fully identified [iBeacon:%s UID:%s URL:%s] ***\n",
                 b.name.c_str(), it->first.c_str(),
                 st.hasIBeacon ? "y" : "-", st.hasUid ? "y" : "-", st.hasUrl ? "y" : "-");
    }

    return st.fullyIdentified && b.allowed;
}

void BeaconRegistry::expireStale(uint32_t nowMs) {
    std::map<std::string, IdentificationState>::iterator it;
    for (it = _states.begin(); it != _states.end(); ++it) {
        IdentificationState& st = it->second;
        if (!isExpired(st, nowMs)) continue;
        if (st.fullyIdentified || st.hasIBeacon || st.hasUid || st.hasUrl) {
            if (_debug) LOG_DEBUG("[BLE] '%s' not seen for %lums, cleared\n",
                                  st.credential->name.c_str(), (unsigned long)(nowMs - st.lastSeenMs));
        }
        st.clearFacets();
        st.seen = false;
    }
}

bool BeaconRegistry::authorizedPresent() const {
    std::map<std::string, IdentificationState>::const_iterator it;
    for (it = _states.begin(); it != _states.end(); ++it) {
        if (it->second.fullyIdentified && it->second.credential->allowed) return true;
    }
    return false;
}

const IdentificationState* BeaconRegistry::find(const char* mac) const {
    std::map<std::string, IdentificationState>::const_iterator it = _states.find(normalizeMac(mac));
    return it == _states.end() ? nullptr : &it->second;
}
