#include "system_config.h"
#include "log.h"
#include <ArduinoJson.h>
#include <string.h>

static constexpr size_t JSON_CAPACITY = 8192;

static uint32_t secondsToMs(float seconds) {
    return (uint32_t)(seconds * 1000.0f + 0.5f);
}

SystemConfig defaultSystemConfig() {
    SystemConfig cfg;

    cfg.radar.variant = RADAR_LD2450;
    cfg.radar.uartPort = 1;
    cfg.radar.rxPin = 18;
    cfg.radar.txPin = 17;
    cfg.radar.loopIntervalMs = 50;
    cfg.radar.readerTimeoutMs = 200;

    cfg.decision = defaultDecisionConfig();

    cfg.door.minDetectionIntervalMs = 5000;
    return cfg;
}

static bool parseCriteria(JsonObjectConst obj, const AuthCriteria& defaults, AuthCriteria& out) {
    static const char* const KEYS[] = {"ibeacon", "eddystone_uid", "eddystone_url", "mac_address"};
    CriterionLevel* fields[] = {&out.ibeacon, &out.eddystoneUid, &out.eddystoneUrl, &out.macAddress};
    const CriterionLevel fallback[] = {defaults.ibeacon, defaults.eddystoneUid, defaults.eddystoneUrl, defaults.macAddress};

    for (size_t i = 0; i < 4; i++) {
        const char* text = obj[KEYS[i]] | (const char*)nullptr;
        if (!text) {
            *fields[i] = fallback[i];
        } else if (!parseCriterionLevel(text, *fields[i])) {
            LOG_ERROR("[Config] auth_criteria.%s: invalid level '%s'\n", KEYS[i], text);
            return false;
        }
    }
    return true;
}

static bool parseRadar(JsonObjectConst radar, SystemConfig& cfg) {
    const char* variant = radar["sensor_variant"] | "LD2450";
    if (strcmp(variant, "LD2450") == 0) {
        cfg.radar.variant = RADAR_LD2450;
    } else if (strcmp(variant, "RD03D") == 0 || strcmp(variant, "RD-03D") == 0) {
        cfg.radar.variant = RADAR_RD03D;
    } else {
        LOG_ERROR("[Config] radar_config.sensor_variant: unknown '%s'\n", variant);
        return false;
    }

    int port = radar["uart_port"] | (int)cfg.radar.uartPort;
    if (port < 0 || port > 2) {
        LOG_ERROR("[Config] radar_config.uart_port: %d out of range\n", port);
        return false;
    }
    cfg.radar.uartPort = (uint8_t)port;
    cfg.radar.rxPin = (int8_t)(radar["rx_pin"] | (int)cfg.radar.rxPin);
    cfg.radar.txPin = (int8_t)(radar["tx_pin"] | (int)cfg.radar.txPin);
    cfg.radar.loopIntervalMs = radar["loop_interval_ms"] | cfg.radar.loopIntervalMs;
    cfg.radar.readerTimeoutMs = radar["reader_timeout_ms"] | cfg.radar.readerTimeoutMs;
    if (cfg.radar.loopIntervalMs == 0 || cfg.radar.readerTimeoutMs < cfg.radar.loopIntervalMs) {
        LOG_ERROR("[Config] radar_config: loop_interval_ms/reader_timeout_ms invalid\n");
        return false;
    }

    DecisionConfig& d = cfg.decision;
    int window = radar["trend_window_size"] | (int)d.trend.windowSize;
    if (window < 2 || window > (int)TrajectoryAnalyzer::MAX_WINDOW) {
        LOG_ERROR("[Config] radar_config.trend_window_size: %d out of range\n", window);
        return false;
    }
    d.trend.windowSize = (size_t)window;

    d.trend.noiseThresholdCmS = radar["speed_noise_threshold"] | d.trend.noiseThresholdCmS;
    if (d.trend.noiseThresholdCmS < 0.0f) {
        LOG_ERROR("[Config] radar_config.speed_noise_threshold must not be negative\n");
        return false;
    }

    const char* side = radar["expected_x_sign"] | "negative";
    if (strcmp(side, "negative") == 0) {
        d.trend.expectedXSign = -1;
    } else if (strcmp(side, "positive") == 0) {
        d.trend.expectedXSign = 1;
    } else {
        LOG_ERROR("[Config] radar_config.expected_x_sign: '%s'\n", side);
        return false;
    }

    d.signChangeYMaxMm = radar["sign_change_y_max"] | d.signChangeYMaxMm;
    d.signChangeXMaxMm = radar["sign_change_x_max"] | d.signChangeXMaxMm;

    float comfort = radar["door_open_comfort_delay"] | (d.comfortDelayMs / 1000.0f);
    float cooldown = radar["cooldown_duration"] | (d.cooldownMs / 1000.0f);
    float scan = radar["ble_scan_max_duration"] | (d.scanTimeoutMs / 1000.0f);
    if (comfort < 0.0f || cooldown < 0.0f || scan <= 0.0f) {
        LOG_ERROR("[Config] radar_config: negative delay or empty scan window\n");
        return false;
    }
    d.comfortDelayMs = secondsToMs(comfort);
    d.cooldownMs = secondsToMs(cooldown);
    d.scanTimeoutMs = secondsToMs(scan);
    return true;
}

static bool parseBeacon(JsonObjectConst b, const AuthCriteria& globalCriteria,
                        float globalTimeoutSec, KnownBeacon& out) {
    const char* mac = b["mac_address"] | "";
    if (strlen(mac) != 17) {
        LOG_ERROR("[Config] known_beacons: invalid mac_address '%s'\n", mac);
        return false;
    }
    out.name = b["name"] | "Unknown";
    out.macAddress = mac;
    out.allowed = b["is_allowed"] | false;

    out.ibeaconMajor = b["ibeacon"]["major"] | (uint16_t)0;
    out.ibeaconMinor = b["ibeacon"]["minor"] | (uint16_t)0;
    out.eddystoneInstanceId = b["eddystone_uid"]["instance_id"] | "";
    out.eddystoneUrl = b["eddystone_url"] | "";

    float timeoutSec = b["identification_timeout_sec"] | globalTimeoutSec;
    if (timeoutSec <= 0.0f) {
        LOG_ERROR("[Config] known_beacons '%s': identification_timeout_sec must be positive\n", out.name.c_str());
        return false;
    }
    out.identificationTimeoutMs = secondsToMs(timeoutSec);

    return parseCriteria(b["auth_criteria"].as<JsonObjectConst>(), globalCriteria, out.criteria);
}

bool parseSystemConfig(const char* json, size_t len, SystemConfig& cfg) {
    DynamicJsonDocument doc(JSON_CAPACITY);
    DeserializationError err = deserializeJson(doc, json, len);
    if (err) {
        LOG_ERROR("[Config] JSON parse failed: %s\n", err.c_str());
        return false;
    }

    if (!parseRadar(doc["radar_config"].as<JsonObjectConst>(), cfg)) return false;

    JsonObjectConst globals = doc["system_globals"].as<JsonObjectConst>();
    cfg.identity.ibeaconUuid = globals["ibeacon_uuid"] | "";
    cfg.identity.eddystoneNamespaceId = globals["eddystone_namespace_id"] | "";
    float timeoutSec = globals["identification_timeout_sec"] | 4.0f;

    int relay = globals["relay_activation_duration_sec"] | (int)cfg.decision.relayDurationSec;
    if (relay < MIN_RELAY_DURATION_SEC || relay > MAX_RELAY_DURATION_SEC) {
        LOG_ERROR("[Config] relay_activation_duration_sec: %d not in %u..%u\n",
                  relay, MIN_RELAY_DURATION_SEC, MAX_RELAY_DURATION_SEC);
        return false;
    }
    cfg.decision.relayDurationSec = (uint8_t)relay;

    float minInterval = globals["min_detection_interval"] | (cfg.door.minDetectionIntervalMs / 1000.0f);
    if (minInterval < 0.0f) {
        LOG_ERROR("[Config] min_detection_interval must not be negative\n");
        return false;
    }
    cfg.door.minDetectionIntervalMs = secondsToMs(minInterval);

    AuthCriteria none = {CRITERION_DISABLED, CRITERION_DISABLED, CRITERION_DISABLED, CRITERION_DISABLED};
    AuthCriteria globalCriteria;
    if (!parseCriteria(doc["auth_criteria"].as<JsonObjectConst>(), none, globalCriteria)) return false;

    cfg.identity.beacons.clear();
    for (JsonVariantConst entry : doc["known_beacons"].as<JsonArrayConst>()) {
        KnownBeacon beacon;
        if (!parseBeacon(entry.as<JsonObjectConst>(), globalCriteria, timeoutSec, beacon)) return false;
        cfg.identity.beacons.push_back(beacon);
    }

    if (cfg.identity.beacons.empty()) {
        LOG_WARN("[Config] No known_beacons configured; the door will never open\n");
    }
    return true;
}

void logSystemConfig(const SystemConfig& cfg) {
    const DecisionConfig& d = cfg.decision;
    LOG_INFO("[Config] Radar %s on UART%u (rx %d, tx %d), loop %lums\n",
             radarVariantName(cfg.radar.variant), cfg.radar.uartPort,
             cfg.radar.rxPin, cfg.radar.txPin, (unsigned long)cfg.radar.loopIntervalMs);
    LOG_INFO("[Config] Trend N=%u noise=%.1fcm/s side=%s | trigger y<=%d |x|<%d\n",
             (unsigned)d.trend.windowSize, d.trend.noiseThresholdCmS,
             d.trend.expectedXSign < 0 ? "negative" : "positive",
             d.signChangeYMaxMm, d.signChangeXMaxMm);
    LOG_INFO("[Config] Comfort %lums, cooldown %lums, scan %lums, relay %us\n",
             (unsigned long)d.comfortDelayMs, (unsigned long)d.cooldownMs,
             (unsigned long)d.scanTimeoutMs, d.relayDurationSec);
    for (size_t i = 0; i < cfg.identity.beacons.size(); i++) {
        const KnownBeacon& b = cfg.identity.beacons[i];
        LOG_INFO("[Config] Beacon '%s' %s %s [iB:%s UID:%s URL:%s MAC:%s]\n",
                 b.name.c_str(), b.macAddress.c_str(), b.allowed ? "allowed" : "blocked",
                 criterionLevelName(b.criteria.ibeacon), criterionLevelName(b.criteria.eddystoneUid),
                 criterionLevelName(b.criteria.eddystoneUrl), criterionLevelName(b.criteria.macAddress));
    }
}
