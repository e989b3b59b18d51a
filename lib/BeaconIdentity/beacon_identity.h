#pragma once
#include <stdint.h>
#include <string>
#include <vector>

enum CriterionLevel {
    CRITERION_DISABLED,
    CRITERION_OPTIONAL,
    CRITERION_REQUIRED
};

struct AuthCriteria {
    CriterionLevel ibeacon;
    CriterionLevel eddystoneUid;
    CriterionLevel eddystoneUrl;
    CriterionLevel macAddress;
};

// One configured credential. Overrides are already resolved against the
// system-wide defaults when the config is loaded.
struct KnownBeacon {
    std::string name;
    std::string macAddress;        // "AA:BB:CC:DD:EE:FF"
    bool allowed;
    uint16_t ibeaconMajor;
    uint16_t ibeaconMinor;
    std::string eddystoneInstanceId;
    std::string eddystoneUrl;
    uint32_t identificationTimeoutMs;
    AuthCriteria criteria;
};

struct IdentityConfig {
    std::string ibeaconUuid;
    std::string eddystoneNamespaceId;
    std::vector<KnownBeacon> beacons;
};

const char* criterionLevelName(CriterionLevel level);
bool parseCriterionLevel(const char* text, CriterionLevel& out);
