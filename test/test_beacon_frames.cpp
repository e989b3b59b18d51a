#include <gtest/gtest.h>
#include "beacon_frames.h"
#include "support/fakes.h"

static const uint8_t TEST_UUID[16] = {
    0xE2, 0xC5, 0x6D, 0xB5, 0xDF, 0xFB, 0x48, 0xD2,
    0xB0, 0x60, 0xD0, 0xF5, 0xA7, 0x10, 0x96, 0xE0
};

// 02 15 <uuid> <major> <minor> <tx>
static Bytes ibeaconRecord(uint16_t major, uint16_t minor) {
    Bytes b;
    b.push_back(0x02);
    b.push_back(0x15);
    b.insert(b.end(), TEST_UUID, TEST_UUID + 16);
    b.push_back((uint8_t)(major >> 8));
    b.push_back((uint8_t)(major & 0xFF));
    b.push_back((uint8_t)(minor >> 8));
    b.push_back((uint8_t)(minor & 0xFF));
    b.push_back(0xC5);
    return b;
}

static void appendAd(Bytes& payload, uint8_t type, const Bytes& data) {
    payload.push_back((uint8_t)(data.size() + 1));
    payload.push_back(type);
    payload.insert(payload.end(), data.begin(), data.end());
}

TEST(BeaconFrames, HexAndUuidFormatting) {
    const uint8_t bytes[] = {0x00, 0x0A, 0xFF, 0x5c};
    EXPECT_EQ("000AFF5C", toHexUpper(bytes, sizeof(bytes)));
    EXPECT_EQ("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", formatUuid(TEST_UUID));
}

TEST(BeaconFrames, IBeaconMajorMinorAreBigEndian) {
    Bytes rec = ibeaconRecord(0x1234, 0x0102);

    IBeaconFrame f;
    ASSERT_TRUE(parseIBeacon(rec.data(), rec.size(), f));
    EXPECT_EQ("E2C56DB5-DFFB-48D2-B060-D0F5A71096E0", f.uuid);
    EXPECT_EQ(0x1234, f.major);
    EXPECT_EQ(0x0102, f.minor);
}

TEST(BeaconFrames, IBeaconRejectsShortOrForeignRecords) {
    Bytes rec = ibeaconRecord(1, 2);
    IBeaconFrame f;

    EXPECT_FALSE(parseIBeacon(rec.data(), 22, f));

    rec[1] = 0x16;
    EXPECT_FALSE(parseIBeacon(rec.data(), rec.size(), f));
}

TEST(BeaconFrames, EddystoneUid) {
    Bytes svc;
    svc.push_back(0x00);   // UID
    svc.push_back(0xEE);   // tx power
    for (uint8_t i = 0; i < 10; i++) svc.push_back((uint8_t)(0xA0 + i));
    for (uint8_t i = 0; i < 6; i++) svc.push_back((uint8_t)(0x10 + i));
    svc.push_back(0x00);
    svc.push_back(0x00);

    AdvertisementFrames out;
    ASSERT_TRUE(parseEddystone(svc.data(), svc.size(), out));
    EXPECT_TRUE(out.hasUid);
    EXPECT_EQ("A0A1A2A3A4A5A6A7A8A9", out.uid.namespaceId);
    EXPECT_EQ("101112131415", out.uid.instanceId);
    EXPECT_FALSE(out.hasUrl);
}

TEST(BeaconFrames, EddystoneUidTooShort) {
    Bytes svc(17, 0x00);
    AdvertisementFrames out;
    EXPECT_FALSE(parseEddystone(svc.data(), svc.size(), out));
    EXPECT_FALSE(out.hasUid);
}

TEST(BeaconFrames, EddystoneUrlExpansion) {
    const char* host = "example";
    Bytes svc;
    svc.push_back(0x10);   // URL
    svc.push_back(0xEE);
    svc.push_back(0x01);   // https://www.
    svc.insert(svc.end(), host, host + 7);
    svc.push_back(0x00);   // .com/

    AdvertisementFrames out;
    ASSERT_TRUE(parseEddystone(svc.data(), svc.size(), out));
    EXPECT_TRUE(out.hasUrl);
    EXPECT_EQ("https://www.example.com/", out.url);
}

TEST(BeaconFrames, UrlSuffixesAndRawBytes) {
    const uint8_t data[] = {0x03, 'g', 'o', 0x08, 0x15, '/', 'x'};
    std::string url;
    ASSERT_TRUE(decodeEddystoneUrl(data, sizeof(data), url));
    EXPECT_EQ("https://go.org\x15/x", url);

    // "mü.de/ä": multi-byte UTF-8 survives
    const uint8_t utf8[] = {0x03, 'm', 0xC3, 0xBC, '.', 'd', 'e', '/', 0xC3, 0xA4};
    ASSERT_TRUE(decodeEddystoneUrl(utf8, sizeof(utf8), url));
    EXPECT_EQ("https://m\xC3\xBC.de/\xC3\xA4", url);

    const uint8_t badScheme[] = {0x04, 'a'};
    EXPECT_FALSE(decodeEddystoneUrl(badScheme, sizeof(badScheme), url));
}

TEST(BeaconFrames, TlmIsIgnored) {
    Bytes svc(14, 0x00);
    svc[0] = 0x20;
    AdvertisementFrames out;
    EXPECT_FALSE(parseEddystone(svc.data(), svc.size(), out));
    EXPECT_FALSE(out.hasUid);
    EXPECT_FALSE(out.hasUrl);
}

TEST(BeaconFrames, AdvertisementWalkFindsBothFormats) {
    Bytes payload;
    Bytes flags(1, 0x06);
    appendAd(payload, 0x01, flags);

    Bytes mfg;
    mfg.push_back(0x4C);
    mfg.push_back(0x00);
    Bytes rec = ibeaconRecord(7, 9);
    mfg.insert(mfg.end(), rec.begin(), rec.end());
    appendAd(payload, 0xFF, mfg);

    Bytes svc;
    svc.push_back(0xAA);
    svc.push_back(0xFE);
    svc.push_back(0x10);
    svc.push_back(0x00);
    svc.push_back(0x02);   // http://
    svc.push_back('a');
    svc.push_back(0x07);   // .com
    appendAd(payload, 0x16, svc);

    AdvertisementFrames out;
    parseAdvertisement(payload.data(), payload.size(), out);
    EXPECT_TRUE(out.hasIBeacon);
    EXPECT_EQ(7, out.ibeacon.major);
    EXPECT_EQ(9, out.ibeacon.minor);
    EXPECT_TRUE(out.hasUrl);
    EXPECT_EQ("http://a.com", out.url);
    EXPECT_FALSE(out.hasUid);
}

TEST(BeaconFrames, OtherCompanyIsNotAnIBeacon) {
    Bytes mfg;
    mfg.push_back(0x59);   // Nordic
    mfg.push_back(0x00);
    Bytes rec = ibeaconRecord(7, 9);
    mfg.insert(mfg.end(), rec.begin(), rec.end());
    Bytes payload;
    appendAd(payload, 0xFF, mfg);

    AdvertisementFrames out;
    parseAdvertisement(payload.data(), payload.size(), out);
    EXPECT_FALSE(out.hasIBeacon);
}

TEST(BeaconFrames, TruncatedStructureStopsTheWalk) {
    Bytes mfg;
    mfg.push_back(0x4C);
    mfg.push_back(0x00);
    Bytes rec = ibeaconRecord(7, 9);
    mfg.insert(mfg.end(), rec.begin(), rec.end());
    Bytes payload;
    appendAd(payload, 0xFF, mfg);
    payload.resize(payload.size() - 3);

    AdvertisementFrames out;
    parseAdvertisement(payload.data(), payload.size(), out);
    EXPECT_FALSE(out.hasIBeacon);

    // zero length terminator ends the walk early
    Bytes zero(4, 0x00);
    AdvertisementFrames none;
    parseAdvertisement(zero.data(), zero.size(), none);
    EXPECT_FALSE(none.hasIBeacon || none.hasUid || none.hasUrl);
}
