#include <gtest/gtest.h>
#include "radar_transport.h"
#include "radar_reader.h"
#include "support/fakes.h"

static const Bytes ENABLE_CONFIG = {0xFD, 0xFC, 0xFB, 0xFA, 0x04, 0x00, 0xFF, 0x00, 0x01, 0x00, 0x04, 0x03, 0x02, 0x01};
static const Bytes SINGLE_TARGET = {0xFD, 0xFC, 0xFB, 0xFA, 0x02, 0x00, 0x80, 0x00, 0x04, 0x03, 0x02, 0x01};
static const Bytes MULTI_TARGET  = {0xFD, 0xFC, 0xFB, 0xFA, 0x02, 0x00, 0x90, 0x00, 0x04, 0x03, 0x02, 0x01};
static const Bytes END_CONFIG    = {0xFD, 0xFC, 0xFB, 0xFA, 0x02, 0x00, 0xFE, 0x00, 0x04, 0x03, 0x02, 0x01};

static const Bytes ACK_ENABLE = {0xFD, 0xFC, 0xFB, 0xFA, 0x08, 0x00, 0xFF, 0x01, 0x00, 0x00, 0x01, 0x00, 0x40, 0x00, 0x04, 0x03, 0x02, 0x01};
static const Bytes ACK_SINGLE = {0xFD, 0xFC, 0xFB, 0xFA, 0x04, 0x00, 0x80, 0x01, 0x00, 0x00, 0x04, 0x03, 0x02, 0x01};
static const Bytes ACK_MULTI  = {0xFD, 0xFC, 0xFB, 0xFA, 0x04, 0x00, 0x90, 0x01, 0x00, 0x00, 0x04, 0x03, 0x02, 0x01};
static const Bytes ACK_END    = {0xFD, 0xFC, 0xFB, 0xFA, 0x04, 0x00, 0xFE, 0x01, 0x00, 0x00, 0x04, 0x03, 0x02, 0x01};

class Ld2450TransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        port.replies[ENABLE_CONFIG] = ACK_ENABLE;
        port.replies[SINGLE_TARGET] = ACK_SINGLE;
        port.replies[END_CONFIG] = ACK_END;
    }

    FakeSerialPort port;
    FakeClock clock;
};

TEST_F(Ld2450TransportTest, HandshakeRunsAllThreeSteps) {
    Ld2450Transport transport(port, clock);

    ASSERT_TRUE(transport.connect());
    EXPECT_TRUE(transport.isConnected());
    EXPECT_EQ(RadarTransport::BAUD_RATE, port.baud);
    ASSERT_EQ(3u, port.writes.size());
    EXPECT_EQ(ENABLE_CONFIG, port.writes[0]);
    EXPECT_EQ(SINGLE_TARGET, port.writes[1]);
    EXPECT_EQ(END_CONFIG, port.writes[2]);
    EXPECT_TRUE(port.rx.empty());
}

TEST_F(Ld2450TransportTest, MissingAckFailsConnect) {
    port.replies.erase(END_CONFIG);
    Ld2450Transport transport(port, clock);
    uint32_t before = clock.now;

    EXPECT_FALSE(transport.connect());
    EXPECT_FALSE(transport.isConnected());
    EXPECT_FALSE(port.isOpen);
    EXPECT_GE(clock.now - before, RadarTransport::ACK_TIMEOUT_MS);
}

TEST_F(Ld2450TransportTest, WrongAckFailsFirstStep) {
    port.replies[ENABLE_CONFIG] = ACK_SINGLE;
    Ld2450Transport transport(port, clock);

    EXPECT_FALSE(transport.connect());
    EXPECT_EQ(1u, port.writes.size());
}

TEST_F(Ld2450TransportTest, OpenFailureIsReported) {
    port.openOk = false;
    Ld2450Transport transport(port, clock);

    EXPECT_FALSE(transport.connect());
    EXPECT_TRUE(port.writes.empty());
}

TEST_F(Ld2450TransportTest, AckIsFoundBehindStreamingData) {
    Bytes noisy(45, 0x5A);
    noisy.insert(noisy.end(), ACK_SINGLE.begin(), ACK_SINGLE.end());
    port.replies[SINGLE_TARGET] = noisy;
    Ld2450Transport transport(port, clock);

    EXPECT_TRUE(transport.connect());
}

TEST_F(Ld2450TransportTest, InputIsFlushedAfterHandshake) {
    Ld2450Transport transport(port, clock);
    int before = port.clearCount;

    ASSERT_TRUE(transport.connect());
    // one flush per command plus the final one
    EXPECT_EQ(before + 4, port.clearCount);
}

TEST(Rd03dTransport, SelectsSingleTargetMode) {
    FakeSerialPort port;
    FakeClock clock;
    port.replies[SINGLE_TARGET] = ACK_SINGLE;
    port.replies[MULTI_TARGET] = ACK_MULTI;
    Rd03dTransport transport(port, clock);

    ASSERT_TRUE(transport.connect());
    ASSERT_EQ(1u, port.writes.size());
    EXPECT_EQ(SINGLE_TARGET, port.writes[0]);
    EXPECT_FALSE(transport.isMultiTarget());

    EXPECT_TRUE(transport.setMultiTarget(true));
    EXPECT_TRUE(transport.isMultiTarget());
    EXPECT_EQ(MULTI_TARGET, port.writes.back());
}

TEST(Rd03dTransport, SilentModuleFailsConnect) {
    FakeSerialPort port;
    FakeClock clock;
    Rd03dTransport transport(port, clock);

    EXPECT_FALSE(transport.connect());
}

TEST(RadarTransportFactory, PicksVariant) {
    FakeSerialPort port;
    FakeClock clock;

    EXPECT_EQ(RADAR_LD2450, createRadarTransport(RADAR_LD2450, port, clock)->variant());
    EXPECT_EQ(RADAR_RD03D, createRadarTransport(RADAR_RD03D, port, clock)->variant());
}

// ---------------------------------------------------------
// RadarReader
// ---------------------------------------------------------
static Bytes ld2450Frame(int16_t x, int16_t y) {
    Bytes f(30, 0x00);
    f[0] = 0xAA; f[1] = 0xFF; f[2] = 0x03; f[3] = 0x00;
    uint16_t rx = encodeSignMagnitude(x);
    uint16_t ry = encodeSignMagnitude(y);
    uint16_t rs = encodeSignMagnitude(0);
    f[4] = rx & 0xFF; f[5] = rx >> 8;
    f[6] = ry & 0xFF; f[7] = ry >> 8;
    f[8] = rs & 0xFF; f[9] = rs >> 8;
    f[28] = 0x55; f[29] = 0xCC;
    return f;
}

class RadarReaderTest : public Ld2450TransportTest {};

TEST_F(RadarReaderTest, PublishesDecodedTarget) {
    Ld2450Transport transport(port, clock);
    ASSERT_TRUE(transport.connect());
    RadarReader reader(transport, clock);

    port.push(ld2450Frame(-250, 1400));
    RadarReading r;
    ASSERT_TRUE(reader.poll(r));
    EXPECT_TRUE(r.hasTarget);
    EXPECT_EQ(-250, r.target.x);
    EXPECT_EQ(1400, r.target.y);
    EXPECT_EQ(clock.now, r.target.timestampMs);
}

TEST_F(RadarReaderTest, NothingToPublishWithoutFrame) {
    Ld2450Transport transport(port, clock);
    ASSERT_TRUE(transport.connect());
    RadarReader reader(transport, clock);

    RadarReading r;
    EXPECT_FALSE(reader.poll(r));

    Bytes half = ld2450Frame(-10, 300);
    half.resize(20);
    port.push(half);
    EXPECT_FALSE(reader.poll(r));
}

TEST_F(RadarReaderTest, PublishesExplicitAbsence) {
    Ld2450Transport transport(port, clock);
    ASSERT_TRUE(transport.connect());
    RadarReader reader(transport, clock);

    Bytes empty(30, 0x00);
    empty[0] = 0xAA; empty[1] = 0xFF; empty[2] = 0x03; empty[3] = 0x00;
    empty[28] = 0x55; empty[29] = 0xCC;
    port.push(empty);

    RadarReading r;
    ASSERT_TRUE(reader.poll(r));
    EXPECT_FALSE(r.hasTarget);
}

TEST_F(RadarReaderTest, StopClosesTransport) {
    Ld2450Transport transport(port, clock);
    ASSERT_TRUE(transport.connect());
    RadarReader reader(transport, clock);

    reader.stop();
    EXPECT_FALSE(transport.isConnected());
    EXPECT_FALSE(port.isOpen);
}
