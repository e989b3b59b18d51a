// ====== IMPORTS ======
#include <Arduino.h>
#include <LittleFS.h>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "freertos/queue.h"
#include "freertos/semphr.h"
#include <esp_task_wdt.h>
#include <esp_system.h>
#include <memory>

// --- KEY IMPORTS ---
#include "log.h"
#include "shared_types.h"
#include "clock.h"
#include "system_config.h"
#include "uart_serial_port.h"
#include "radar_transport.h"
#include "radar_reader.h"
#include "beacon_registry.h"
#include "ble_scanner.h"
#include "decision_engine.h"
#include "door_manager.h"
#include "led_manager.h"

// ====== USER CONFIG ======
#define BRIGHTNESS 10
#define WDT_TIMEOUT_SECONDS 30
#define RELAY_PIN 11
#define CONFIG_PATH "/config.json"

#define SHUTDOWN_WAIT_MS   5000
#define STATS_INTERVAL_MS  10000
#define NO_DATA_WARN_MS    5000

// =========================================================
// CLOCK
// =========================================================
class RtosClock : public Clock {
public:
    uint32_t nowMs() override { return millis(); }
    void sleepMs(uint32_t ms) override { vTaskDelay(pdMS_TO_TICKS(ms)); }
};

// =========================================================
// GLOBALS
// =========================================================
QueueHandle_t radarQueue = nullptr;
TaskHandle_t readerTaskHandle = nullptr;
TaskHandle_t logicTaskHandle = nullptr;

SemaphoreHandle_t readerDone = nullptr;
SemaphoreHandle_t logicDone = nullptr;

volatile bool g_readerRun = false;
volatile bool g_logicRun = false;
volatile bool g_stopped = false;

SystemConfig g_config;
RtosClock rtosClock;

// Managers
LedManager ledManager(RGB_BUILTIN, BRIGHTNESS);
std::unique_ptr<UartSerialPort> radarPort;
std::unique_ptr<RadarTransport> radarTransport;
std::unique_ptr<RadarReader> radarReader;
std::unique_ptr<BeaconRegistry> beaconRegistry;
std::unique_ptr<BleScanner> bleScanner;
std::unique_ptr<DoorManager> doorManager;
std::unique_ptr<DecisionEngine> decisionEngine;

// Task Prototypes
void radarReaderTask(void *p);
void logicCoreTask(void *p);

// =========================================================
// HELPER: Halt on a fatal startup error
// =========================================================
static void haltWithError(const char* what) {
    LOG_ERROR("%s. Halting.\n", what);
    for (;;) {
        ledManager.setColor(255, 0, 0);
        delay(250);
        ledManager.setOff();
        delay(250);
        esp_task_wdt_reset();
    }
}

// =========================================================
// HELPER: Load /config.json from LittleFS
// =========================================================
static bool loadConfig(const char* path, SystemConfig& cfg) {
    File f = LittleFS.open(path, "r");
    if (!f) {
        LOG_ERROR("[Config] %s not found\n", path);
        return false;
    }
    String content = f.readString();
    f.close();

    cfg = defaultSystemConfig();
    return parseSystemConfig(content.c_str(), content.length(), cfg);
}

// =========================================================
// HELPER: Ordered shutdown: logic, reader, transport
// =========================================================
static void shutdownSystem() {
    if (g_stopped) return;
    LOG_INFO("[System] Shutting down...\n");

    g_logicRun = false;
    if (logicDone && xSemaphoreTake(logicDone, pdMS_TO_TICKS(SHUTDOWN_WAIT_MS)) != pdTRUE) {
        LOG_WARN("[System] Logic task did not stop in time\n");
    }

    g_readerRun = false;
    if (readerDone && xSemaphoreTake(readerDone, pdMS_TO_TICKS(SHUTDOWN_WAIT_MS)) != pdTRUE) {
        LOG_WARN("[System] Reader task did not stop in time\n");
    }

    if (doorManager) doorManager->deactivate();
    ledManager.setOff();
    g_stopped = true;
    LOG_INFO("[System] Stopped.\n");
}

// =========================================================
// HELPER: Serial console commands
// =========================================================
static void handleSerialCommand() {
    if (!Serial.available()) return;

    String cmd = Serial.readStringUntil('\n');
    cmd.trim();
    cmd.toUpperCase();

    if (cmd == "STOP") {
        shutdownSystem();
    } else if (cmd == "RESTART") {
        shutdownSystem();
        LOG_INFO("[System] Restarting...\n");
        delay(100);
        ESP.restart();
    } else if (cmd.length() > 0) {
        LOG_WARN("[System] Unknown command '%s' (STOP, RESTART)\n", cmd.c_str());
    }
}

// =========================================================
// SETUP
// =========================================================
void setup() {
    Serial.begin(115200);
    delay(500);

    esp_task_wdt_init(WDT_TIMEOUT_SECONDS, true);
    esp_task_wdt_add(NULL);

    LOG_INFO("\n--- doorsense radar/BLE door opener ---\n");
    LOG_INFO("Heap: %u bytes | Log level: %d\n", esp_get_free_heap_size(), LOG_LEVEL);

    ledManager.begin();
    ledManager.setColor(255, 165, 0);  // amber while starting

    if (!LittleFS.begin(false)) {
        haltWithError("[Config] LittleFS mount failed");
    }
    if (!loadConfig(CONFIG_PATH, g_config)) {
        haltWithError("[Config] Invalid configuration");
    }
    logSystemConfig(g_config);

    // Radar link: no radar, no door opener
    radarPort.reset(new UartSerialPort(g_config.radar.uartPort, g_config.radar.rxPin,
                                       g_config.radar.txPin, (LOG_LEVEL >= 4)));
    radarTransport = createRadarTransport(g_config.radar.variant, *radarPort, rtosClock, (LOG_LEVEL >= 4));
    if (!radarTransport->connect()) {
        haltWithError("[Radar] Could not connect to radar");
    }
    esp_task_wdt_reset();
    radarReader.reset(new RadarReader(*radarTransport, rtosClock, (LOG_LEVEL >= 4)));

    beaconRegistry.reset(new BeaconRegistry(g_config.identity, (LOG_LEVEL >= 4)));
    beaconRegistry->begin();
    bleScanner.reset(new BleScanner(*beaconRegistry, rtosClock, (LOG_LEVEL >= 4)));
    if (!bleScanner->begin()) {
        haltWithError("[BLE] Scanner init failed");
    }

    doorManager.reset(new DoorManager(RELAY_PIN, ledManager, g_config.door.minDetectionIntervalMs, (LOG_LEVEL >= 4)));
    doorManager->begin();

    decisionEngine.reset(new DecisionEngine(g_config.decision, *bleScanner, *doorManager,
                                            rtosClock, (LOG_LEVEL >= 4)));

    radarQueue = xQueueCreate(1, sizeof(RadarReading));
    readerDone = xSemaphoreCreateBinary();
    logicDone = xSemaphoreCreateBinary();
    if (!radarQueue || !readerDone || !logicDone) {
        haltWithError("[System] Queue/semaphore allocation failed");
    }

    g_readerRun = true;
    g_logicRun = true;
    xTaskCreatePinnedToCore(radarReaderTask, "radar", 4096, nullptr, 2, &readerTaskHandle, 0);
    xTaskCreatePinnedToCore(logicCoreTask, "logic", 8192, nullptr, 1, &logicTaskHandle, 1);

    ledManager.showStatus(STATUS_IDLE, 0);
    LOG_INFO("[System] Initialization complete.\n");
    esp_task_wdt_reset();
}

// =========================================================
// RADAR READER TASK (CORE 0)
// =========================================================
void radarReaderTask(void *p) {
    RadarReading reading;
    esp_task_wdt_add(NULL);

    LOG_INFO("[Reader Task] Started on Core 0 (%lums)\n", (unsigned long)g_config.radar.loopIntervalMs);

    TickType_t lastWake = xTaskGetTickCount();
    while (g_readerRun) {
        if (radarReader->poll(reading)) {
            // Single slot: the logic task only ever sees the freshest reading
            xQueueOverwrite(radarQueue, &reading);
        }
        esp_task_wdt_reset();
        vTaskDelayUntil(&lastWake, pdMS_TO_TICKS(g_config.radar.loopIntervalMs));
    }

    radarReader->stop();
    LOG_INFO("[Reader Task] Stopped\n");
    xSemaphoreGive(readerDone);

    esp_task_wdt_delete(NULL);
    vTaskDelete(NULL);
}

// =========================================================
// LOGIC TASK (CORE 1)
// =========================================================
void logicCoreTask(void *p) {
    RadarReading reading;
    esp_task_wdt_add(NULL);

    unsigned long lastData = millis();
    unsigned long lastWarn = 0;

    LOG_INFO("[Logic Task] Started on Core 1\n");

    while (g_logicRun) {
        if (xQueueReceive(radarQueue, &reading, pdMS_TO_TICKS(g_config.radar.readerTimeoutMs)) == pdTRUE) {
            lastData = millis();
        } else {
            // Missed cycle counts as "no target"
            reading.hasTarget = false;
            unsigned long now = millis();
            if (now - lastData > NO_DATA_WARN_MS && now - lastWarn > NO_DATA_WARN_MS) {
                LOG_WARN("[Logic] No radar data for %lus\n", (now - lastData) / 1000);
                doorManager->publishStatusEvent(STATUS_FAULT, NO_DATA_WARN_MS);
                lastWarn = now;
            }
        }

        decisionEngine->step(reading);
        esp_task_wdt_reset();
    }

    decisionEngine->shutdown();
    LOG_INFO("[Logic Task] Stopped\n");
    xSemaphoreGive(logicDone);

    esp_task_wdt_delete(NULL);
    vTaskDelete(NULL);
}

// =========================================================
// MAIN LOOP
// =========================================================
void loop() {
    esp_task_wdt_reset();
    doorManager->update();
    ledManager.update();
    handleSerialCommand();

    static unsigned long lastStats = 0;
    if ((LOG_LEVEL >= 3) && (millis() - lastStats > STATS_INTERVAL_MS)) {
        lastStats = millis();
        LOG_INFO("[SYS] Heap: %u bytes | Uptime: %lus%s\n",
                 esp_get_free_heap_size(), millis() / 1000, g_stopped ? " | STOPPED" : "");
    }

    delay(10);
}
