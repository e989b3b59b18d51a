#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>

// Decoders for the two advertisement formats used to authenticate a
// credential: Apple iBeacon and Eddystone (UID / URL).

struct IBeaconFrame {
    std::string uuid;    // "XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX", upper case
    uint16_t major;
    uint16_t minor;
};

struct EddystoneUidFrame {
    std::string namespaceId;   // 20 hex chars, upper case
    std::string instanceId;    // 12 hex chars, upper case
};

struct AdvertisementFrames {
    bool hasIBeacon;
    IBeaconFrame ibeacon;
    bool hasUid;
    EddystoneUidFrame uid;
    bool hasUrl;
    std::string url;

    AdvertisementFrames() : hasIBeacon(false), ibeacon(), hasUid(false), uid(), hasUrl(false) {}
};

static constexpr uint16_t APPLE_COMPANY_ID = 0x004C;
static constexpr uint16_t EDDYSTONE_SERVICE_UUID = 0xFEAA;

static constexpr uint8_t EDDYSTONE_FRAME_UID = 0x00;
static constexpr uint8_t EDDYSTONE_FRAME_URL = 0x10;
static constexpr uint8_t EDDYSTONE_FRAME_TLM = 0x20;

std::string toHexUpper(const uint8_t* data, size_t len);
std::string formatUuid(const uint8_t* bytes16);

/**
 * @brief iBeacon record from manufacturer data (company id already stripped).
 * Layout: 02 15 <uuid:16> <major:BE16> <minor:BE16> <tx power>.
 */
bool parseIBeacon(const uint8_t* mfg, size_t len, IBeaconFrame& out);

/**
 * @brief Eddystone service data (service UUID already stripped).
 * Fills out.uid or out.url depending on the frame type. TLM frames are ignored.
 */
bool parseEddystone(const uint8_t* svc, size_t len, AdvertisementFrames& out);

// Expands a compressed Eddystone URL, starting at the scheme byte. Bytes
// 0x0E and above are copied verbatim.
bool decodeEddystoneUrl(const uint8_t* data, size_t len, std::string& out);

// Walks the AD structures of a raw advertisement / scan response payload.
void parseAdvertisement(const uint8_t* payload, size_t len, AdvertisementFrames& out);
