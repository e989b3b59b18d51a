#include "ble_scanner.h"
#include "log.h"
#include <string.h>

void BleScanner::ScanCallbacks::onResult(NimBLEAdvertisedDevice* dev) {
    RawAdvertisement adv;
    std::string mac = dev->getAddress().toString();
    strncpy(adv.mac, mac.c_str(), sizeof(adv.mac) - 1);
    adv.mac[sizeof(adv.mac) - 1] = '\0';

    size_t len = dev->getPayloadLength();
    if (len > sizeof(adv.payload)) len = sizeof(adv.payload);
    memcpy(adv.payload, dev->getPayload(), len);
    adv.len = (uint8_t)len;

    // Never block the host task; a dropped advertisement is repeated soon
    xQueueSend(_queue, &adv, 0);
}

BleScanner::BleScanner(BeaconRegistry& registry, Clock& clock, bool debug)
    : _registry(registry),
      _clock(clock),
      _debug(debug),
      _scan(nullptr),
      _advQueue(nullptr),
      _task(nullptr),
      _timeoutMs(0),
      _state(IDLE),
      _cancelRequested(false) {
}

bool BleScanner::begin() {
    _advQueue = xQueueCreate(ADV_QUEUE_LENGTH, sizeof(RawAdvertisement));
    if (!_advQueue) {
        LOG_ERROR("[BLE] Advertisement queue allocation failed\n");
        return false;
    }

    NimBLEDevice::init("");
    NimBLEDevice::setPower(ESP_PWR_LVL_P9);

    _scan = NimBLEDevice::getScan();
    // wantDuplicates: every advertisement of a known sender must reach the
    // registry, not only the first one of each scan
    _scan->setAdvertisedDeviceCallbacks(new ScanCallbacks(_advQueue), true);
    _scan->setActiveScan(true);
    _scan->setInterval(45);
    _scan->setWindow(15);
    _scan->setDuplicateFilter(false);

    if (_debug) Serial.println("[BLE] NimBLE initialized");
    return true;
}

bool BleScanner::startScan(uint32_t timeoutMs) {
    if (!_scan) return false;
    if (_state.load() == RUNNING) {
        LOG_WARN("[BLE] Scan already running\n");
        return false;
    }

    _timeoutMs = timeoutMs;
    _cancelRequested = false;
    _state = RUNNING;

    if (xTaskCreatePinnedToCore(scanTaskEntry, "ble_scan", SCAN_TASK_STACK, this, 1, &_task, 0) != pdPASS) {
        LOG_ERROR("[BLE] Could not create scan task\n");
        _state = IDLE;
        _task = nullptr;
        return false;
    }
    return true;
}

ScanOutcome BleScanner::poll() {
    switch (_state.load()) {
        case RUNNING:
            return SCAN_PENDING;
        case DONE_SUCCESS:
            _state = IDLE;
            return SCAN_SUCCESS;
        case DONE_FAILED:
        case IDLE:
        default:
            _state = IDLE;
            return SCAN_FAILED;
    }
}

void BleScanner::cancel() {
    if (_state.load() != RUNNING) {
        _state = IDLE;
        return;
    }

    _cancelRequested = true;
    unsigned long start = millis();
    while (_state.load() == RUNNING && (millis() - start < CANCEL_WAIT_MS)) {
        vTaskDelay(pdMS_TO_TICKS(10));
    }

    if (_state.load() == RUNNING) {
        LOG_WARN("[BLE] Scan task did not stop within %lums\n", (unsigned long)CANCEL_WAIT_MS);
        return;
    }
    _state = IDLE;
}

void BleScanner::scanTaskEntry(void* arg) {
    static_cast<BleScanner*>(arg)->runScan();
    vTaskDelete(NULL);
}

void BleScanner::runScan() {
    xQueueReset(_advQueue);

    if (!_scan->start(0, nullptr, false)) {
        LOG_ERROR("[BLE] Scan start failed\n");
        _task = nullptr;
        _state = DONE_FAILED;
        return;
    }
    if (_debug) Serial.printf("[BLE] Scanning for up to %lums\n", (unsigned long)_timeoutMs);

    QueueSource source(_advQueue);
    ScanSummary summary = runIdentityScan(_registry, source, _clock, _timeoutMs, _cancelRequested);

    _scan->stop();

    if (summary.cancelled) {
        LOG_INFO("[BLE] Scan cancelled after %lums\n", (unsigned long)summary.elapsedMs);
    } else if (summary.outcome == SCAN_SUCCESS) {
        LOG_INFO("[BLE] Authorized beacon found after %lums (%lu adverts)\n",
                 (unsigned long)summary.elapsedMs, (unsigned long)summary.processed);
    } else {
        LOG_INFO("[BLE] Scan timed out after %lums (%lu adverts)\n",
                 (unsigned long)summary.elapsedMs, (unsigned long)summary.processed);
    }

    _task = nullptr;
    _state = (summary.outcome == SCAN_SUCCESS) ? DONE_SUCCESS : DONE_FAILED;
}
