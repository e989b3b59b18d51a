#include <gtest/gtest.h>
#include "decision_engine.h"
#include "support/fakes.h"

static const int16_t APPROACH_X[] = {-600, -550, -450, -350, -250, -180, -100};
static const int16_t APPROACH_Y[] = {1200, 1000, 850, 700, 550, 400, 300};

class DecisionEngineTest : public ::testing::Test {
protected:
    DecisionEngineTest()
        : cfg(defaultDecisionConfig()),
          engine(cfg, scanner, door, clock) {}

    void see(int16_t x, int16_t y) {
        clock.advance(100);
        RadarReading r;
        r.hasTarget = true;
        r.target.x = x;
        r.target.y = y;
        r.target.speed = 0;
        r.target.timestampMs = clock.nowMs();
        engine.step(r);
    }

    void empty() {
        clock.advance(100);
        RadarReading r = {};
        r.hasTarget = false;
        engine.step(r);
    }

    // Walks the 7-sample approach; the scan settles after the first sample.
    void approach(ScanOutcome identity = SCAN_SUCCESS) {
        for (size_t i = 0; i < 7; i++) {
            see(APPROACH_X[i], APPROACH_Y[i]);
            if (i == 0) scanner.settle(identity);
        }
    }

    FakeClock clock;
    FakeScanner scanner;
    FakeDoor door;
    DecisionConfig cfg;
    DecisionEngine engine;
};

TEST_F(DecisionEngineTest, FirstTargetStartsTrackingAndScan) {
    see(-600, 1200);

    EXPECT_EQ(STATE_TRACKING, engine.state());
    EXPECT_EQ(BLE_SCANNING, engine.bleStatus());
    EXPECT_TRUE(engine.scanOutstanding());
    EXPECT_EQ(1, scanner.starts);
    EXPECT_EQ(cfg.scanTimeoutMs, scanner.lastTimeoutMs);
    ASSERT_EQ(1u, door.events.size());
    EXPECT_EQ(STATUS_TRACKING, door.events[0]);
    EXPECT_EQ(0u, door.eventDurations[0]);
}

TEST_F(DecisionEngineTest, ApproachThenCrossingOpensDoor) {
    approach();
    EXPECT_EQ(INTENT_COMING, engine.intent());
    EXPECT_EQ(BLE_SUCCESS, engine.bleStatus());
    EXPECT_TRUE(door.opens.empty());

    see(50, 250);

    ASSERT_EQ(1u, door.opens.size());
    EXPECT_EQ(4, door.opens[0]);
    EXPECT_EQ(500u, clock.slept);
    EXPECT_EQ(STATUS_ACCESS_GRANTED, door.events.back());
    EXPECT_EQ(5000u, door.eventDurations.back());
    EXPECT_EQ(STATE_COOLDOWN, engine.state());
    EXPECT_EQ(BLE_UNKNOWN, engine.bleStatus());
    EXPECT_EQ(INTENT_NEUTRAL, engine.intent());
    EXPECT_EQ(0u, engine.samples());
    EXPECT_EQ(1u, engine.doorOpenCount());
}

TEST_F(DecisionEngineTest, NoDoorWithoutIdentity) {
    for (size_t i = 0; i < 7; i++) see(APPROACH_X[i], APPROACH_Y[i]);
    EXPECT_EQ(INTENT_COMING, engine.intent());
    EXPECT_EQ(BLE_SCANNING, engine.bleStatus());

    see(50, 250);

    EXPECT_TRUE(door.opens.empty());
    EXPECT_EQ(STATE_TRACKING, engine.state());
}

TEST_F(DecisionEngineTest, NoDoorWithoutCrossing) {
    approach();
    see(-60, 250);
    see(-20, 200);

    EXPECT_TRUE(door.opens.empty());
    EXPECT_EQ(STATE_TRACKING, engine.state());
}

TEST_F(DecisionEngineTest, NearFieldZeroCrossingOpensDoor) {
    approach();
    see(0, 280);
    EXPECT_EQ(1u, door.opens.size());
}

TEST_F(DecisionEngineTest, DistantZeroCrossingIsIgnored) {
    const int16_t xs[] = {-600, -550, -450, -350, -250, -180, -100};
    const int16_t ys[] = {2100, 1900, 1700, 1500, 1300, 1100, 900};
    for (size_t i = 0; i < 7; i++) {
        see(xs[i], ys[i]);
        if (i == 0) scanner.settle(SCAN_SUCCESS);
    }
    ASSERT_EQ(INTENT_COMING, engine.intent());

    see(0, 880);

    EXPECT_TRUE(door.opens.empty());
    EXPECT_EQ(STATE_TRACKING, engine.state());
}

TEST_F(DecisionEngineTest, LeavingCancelsOutstandingScan) {
    const int16_t xs[] = {600, 550, 450, 350, 250, 180, 100};
    for (size_t i = 0; i < 7; i++) see(xs[i], APPROACH_Y[i]);

    EXPECT_EQ(1, scanner.cancels);
    EXPECT_FALSE(engine.scanOutstanding());
    EXPECT_EQ(BLE_FAILED, engine.bleStatus());
    EXPECT_EQ(STATE_IDLE, engine.state());
    EXPECT_EQ(INTENT_NEUTRAL, engine.intent());
    EXPECT_EQ(0u, engine.samples());
    EXPECT_EQ(STATUS_IDLE, door.events.back());
}

TEST_F(DecisionEngineTest, LeavingDropsCachedIdentity) {
    const int16_t xs[] = {-100, -150, -200, -250, -300, -350, -400};
    const int16_t ys[] = {300, 450, 600, 750, 900, 1050, 1200};
    for (size_t i = 0; i < 7; i++) {
        see(xs[i], ys[i]);
        if (i == 0) scanner.settle(SCAN_SUCCESS);
    }

    EXPECT_EQ(0, scanner.cancels);
    EXPECT_EQ(BLE_UNKNOWN, engine.bleStatus());
    EXPECT_EQ(STATE_IDLE, engine.state());
}

TEST_F(DecisionEngineTest, CooldownIgnoresReadingsUntilItExpires) {
    approach();
    see(50, 250);
    ASSERT_EQ(STATE_COOLDOWN, engine.state());

    see(-600, 1200);
    empty();
    see(40, 200);
    EXPECT_EQ(STATE_COOLDOWN, engine.state());
    EXPECT_EQ(1, scanner.starts);
    EXPECT_EQ(1u, door.opens.size());

    clock.advance(cfg.cooldownMs);
    see(-600, 1200);

    EXPECT_EQ(STATE_TRACKING, engine.state());
    EXPECT_EQ(2, scanner.starts);
    EXPECT_EQ(1, door.countEvents(STATUS_IDLE));
}

TEST_F(DecisionEngineTest, SecondVisitOpensAgainAfterCooldown) {
    approach();
    see(50, 250);
    clock.advance(cfg.cooldownMs);

    approach();
    see(50, 250);

    EXPECT_EQ(2u, engine.doorOpenCount());
    EXPECT_EQ(2, door.countEvents(STATUS_ACCESS_GRANTED));
}

TEST_F(DecisionEngineTest, LostTargetKeepsCachedIdentity) {
    see(-600, 1200);
    scanner.settle(SCAN_SUCCESS);
    see(-550, 1000);
    see(-450, 850);
    ASSERT_EQ(BLE_SUCCESS, engine.bleStatus());

    empty();
    EXPECT_EQ(STATE_IDLE, engine.state());
    EXPECT_EQ(BLE_SUCCESS, engine.bleStatus());
    EXPECT_EQ(0u, engine.samples());

    see(-600, 1200);
    EXPECT_EQ(STATE_TRACKING, engine.state());
    EXPECT_EQ(1, scanner.starts);
}

TEST_F(DecisionEngineTest, LostTargetKeepsScanRunning) {
    see(-600, 1200);
    empty();

    EXPECT_EQ(STATE_IDLE, engine.state());
    EXPECT_TRUE(engine.scanOutstanding());
    EXPECT_EQ(0, scanner.cancels);

    scanner.settle(SCAN_SUCCESS);
    see(-600, 1200);
    EXPECT_EQ(STATE_TRACKING, engine.state());
    EXPECT_EQ(BLE_SUCCESS, engine.bleStatus());
    EXPECT_EQ(1, scanner.starts);
}

TEST_F(DecisionEngineTest, FailedScanResetsThenRescans) {
    see(-600, 1200);
    see(-550, 1000);
    scanner.settle(SCAN_FAILED);

    see(-450, 850);
    EXPECT_EQ(STATE_IDLE, engine.state());
    EXPECT_EQ(BLE_FAILED, engine.bleStatus());
    EXPECT_EQ(0u, engine.samples());

    see(-350, 700);
    EXPECT_EQ(STATE_TRACKING, engine.state());
    EXPECT_EQ(BLE_SCANNING, engine.bleStatus());
    EXPECT_EQ(2, scanner.starts);
}

TEST_F(DecisionEngineTest, ScanThatCannotStartIsFailed) {
    scanner.startOk = false;
    see(-600, 1200);

    EXPECT_EQ(STATE_TRACKING, engine.state());
    EXPECT_EQ(BLE_FAILED, engine.bleStatus());
    EXPECT_FALSE(engine.scanOutstanding());

    scanner.startOk = true;
    see(-550, 1000);
    EXPECT_EQ(BLE_SCANNING, engine.bleStatus());
}

TEST_F(DecisionEngineTest, DoorFailureIsNotRetried) {
    door.commandOk = false;
    approach();
    see(50, 250);

    EXPECT_EQ(1u, door.opens.size());
    EXPECT_EQ(STATE_COOLDOWN, engine.state());
    EXPECT_EQ(STATUS_ACCESS_GRANTED, door.events.back());

    see(60, 240);
    EXPECT_EQ(1u, door.opens.size());
}

TEST_F(DecisionEngineTest, ShutdownCancelsScan) {
    see(-600, 1200);
    engine.shutdown();

    EXPECT_EQ(1, scanner.cancels);
    EXPECT_FALSE(engine.scanOutstanding());
}

TEST_F(DecisionEngineTest, PositiveApproachSide) {
    DecisionConfig mirrored = defaultDecisionConfig();
    mirrored.trend.expectedXSign = 1;
    DecisionEngine e(mirrored, scanner, door, clock);

    for (size_t i = 0; i < 7; i++) {
        clock.advance(100);
        RadarReading r = {true, {(int16_t)-APPROACH_X[i], APPROACH_Y[i], 0, clock.nowMs()}};
        e.step(r);
        if (i == 0) scanner.settle(SCAN_SUCCESS);
    }
    ASSERT_EQ(INTENT_COMING, e.intent());

    clock.advance(100);
    RadarReading cross = {true, {-50, 250, 0, clock.nowMs()}};
    e.step(cross);
    EXPECT_EQ(1u, e.doorOpenCount());
}
