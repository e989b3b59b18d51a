#pragma once
#include <Arduino.h>
#include <NimBLEDevice.h>
#include <atomic>
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"
#include "clock.h"
#include "identity_scanner.h"
#include "identity_scan.h"
#include "beacon_registry.h"

/*
 * BleScanner
 *
 * NimBLE implementation of IdentityScanner. The scan callback only copies
 * raw advertisements into a queue; the short-lived scan task runs
 * runIdentityScan() over that queue and is the only writer of the
 * BeaconRegistry.
 */
class BleScanner : public IdentityScanner {
public:
    BleScanner(BeaconRegistry& registry, Clock& clock, bool debug = false);

    /**
     * @brief Initializes the NimBLE stack and the advertisement queue. Call in setup().
     */
    bool begin();

    bool startScan(uint32_t timeoutMs) override;
    ScanOutcome poll() override;
    void cancel() override;

    static constexpr uint32_t CANCEL_WAIT_MS = 500;

private:
    enum State : uint8_t {
        IDLE,
        RUNNING,
        DONE_SUCCESS,
        DONE_FAILED
    };

    class ScanCallbacks : public NimBLEAdvertisedDeviceCallbacks {
    public:
        explicit ScanCallbacks(QueueHandle_t queue) : _queue(queue) {}
        void onResult(NimBLEAdvertisedDevice* dev) override;
    private:
        QueueHandle_t _queue;
    };

    class QueueSource : public AdvertisementSource {
    public:
        explicit QueueSource(QueueHandle_t queue) : _queue(queue) {}
        bool receive(RawAdvertisement& adv, uint32_t waitMs) override {
            return xQueueReceive(_queue, &adv, pdMS_TO_TICKS(waitMs)) == pdTRUE;
        }
    private:
        QueueHandle_t _queue;
    };

    static void scanTaskEntry(void* arg);
    void runScan();

    BeaconRegistry& _registry;
    Clock& _clock;
    bool _debug;
    NimBLEScan* _scan;
    QueueHandle_t _advQueue;
    TaskHandle_t _task;
    uint32_t _timeoutMs;
    std::atomic<uint8_t> _state;
    std::atomic<bool> _cancelRequested;

    static constexpr size_t ADV_QUEUE_LENGTH = 32;
    static constexpr uint32_t SCAN_TASK_STACK = 6144;
};
