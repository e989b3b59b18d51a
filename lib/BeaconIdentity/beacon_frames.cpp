#include "beacon_frames.h"

static const char* const URL_SCHEMES[] = {
    "http://www.", "https://www.", "http://", "https://"
};

static const char* const URL_SUFFIXES[] = {
    ".com/", ".org/", ".edu/", ".net/", ".info/", ".biz/", ".gov/",
    ".com", ".org", ".edu", ".net", ".info", ".biz", ".gov"
};

static constexpr size_t NUM_SCHEMES = sizeof(URL_SCHEMES) / sizeof(URL_SCHEMES[0]);
static constexpr size_t NUM_SUFFIXES = sizeof(URL_SUFFIXES) / sizeof(URL_SUFFIXES[0]);

// AD types
static constexpr uint8_t AD_SERVICE_DATA_16 = 0x16;
static constexpr uint8_t AD_MANUFACTURER_DATA = 0xFF;

std::string toHexUpper(const uint8_t* data, size_t len) {
    static const char HEX_DIGITS[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += HEX_DIGITS[data[i] >> 4];
        out += HEX_DIGITS[data[i] & 0x0F];
    }
    return out;
}

std::string formatUuid(const uint8_t* b) {
    std::string out;
    out.reserve(36);
    out += toHexUpper(b, 4);
    out += '-';
    out += toHexUpper(b + 4, 2);
    out += '-';
    out += toHexUpper(b + 6, 2);
    out += '-';
    out += toHexUpper(b + 8, 2);
    out += '-';
    out += toHexUpper(b + 10, 6);
    return out;
}

bool parseIBeacon(const uint8_t* mfg, size_t len, IBeaconFrame& out) {
    if (len < 23 || mfg[0] != 0x02 || mfg[1] != 0x15) return false;

    out.uuid = formatUuid(mfg + 2);
    out.major = (uint16_t)((mfg[18] << 8) | mfg[19]);
    out.minor = (uint16_t)((mfg[20] << 8) | mfg[21]);
    return true;
}

bool decodeEddystoneUrl(const uint8_t* data, size_t len, std::string& out) {
    if (len < 1 || data[0] >= NUM_SCHEMES) return false;

    out = URL_SCHEMES[data[0]];
    for (size_t i = 1; i < len; i++) {
        uint8_t c = data[i];
        // Bytes outside the suffix table are kept as-is (UTF-8 hosts and paths)
        if (c < NUM_SUFFIXES) {
            out += URL_SUFFIXES[c];
        } else {
            out += (char)c;
        }
    }
    return true;
}

bool parseEddystone(const uint8_t* svc, size_t len, AdvertisementFrames& out) {
    if (len < 1) return false;

    switch (svc[0]) {
        case EDDYSTONE_FRAME_UID:
            if (len < 18) return false;
            out.uid.namespaceId = toHexUpper(svc + 2, 10);
            out.uid.instanceId = toHexUpper(svc + 12, 6);
            out.hasUid = true;
            return true;

        case EDDYSTONE_FRAME_URL:
            if (len < 3) return false;
            // byte 1 is the calibrated tx power
            if (!decodeEddystoneUrl(svc + 2, len - 2, out.url)) return false;
            out.hasUrl = true;
            return true;

        case EDDYSTONE_FRAME_TLM:
        default:
            return false;
    }
}

void parseAdvertisement(const uint8_t* payload, size_t len, AdvertisementFrames& out) {
    size_t pos = 0;
    while (pos < len) {
        uint8_t fieldLen = payload[pos];
        if (fieldLen == 0) break;                  // early terminator
        if (pos + 1 + fieldLen > len) break;       // truncated structure

        uint8_t type = payload[pos + 1];
        const uint8_t* data = payload + pos + 2;
        size_t dataLen = fieldLen - 1;

        if (type == AD_MANUFACTURER_DATA && dataLen >= 2) {
            uint16_t company = (uint16_t)(data[0] | (data[1] << 8));
            if (company == APPLE_COMPANY_ID && parseIBeacon(data + 2, dataLen - 2, out.ibeacon)) {
                out.hasIBeacon = true;
            }
        } else if (type == AD_SERVICE_DATA_16 && dataLen >= 2) {
            uint16_t uuid = (uint16_t)(data[0] | (data[1] << 8));
            if (uuid == EDDYSTONE_SERVICE_UUID) {
                parseEddystone(data + 2, dataLen - 2, out);
            }
        }

        pos += 1 + fieldLen;
    }
}
