/**
 * @file main.cpp
 * @brief ESP32 MMA845x Accelerometer Node - Main Entry Point
 *
 * Brings up the I2C bus, opens the accelerometer with the persisted
 * settings and prints X/Y/Z in g at the configured period.
 *
 * Serial console (single-character commands):
 * - '2' / '4' / '8': change full-scale range (persisted)
 * - 's' / 'a':       standby / active
 * - '+' / '-':       halve / double the sample period (persisted)
 * - 'x':             move to the other I2C address (persisted)
 * - 'd':             print device description
 * - 'p':             pause / resume sample printing
 */

#include <Arduino.h>
#include <Wire.h>
#include <esp_log.h>
#include <memory>
#include "pin_config.h"
#include "drivers/wire_bus.h"
#include "drivers/mma845x.h"
#include "app/settings.h"

static const char* TAG = "Main";

namespace {
    WireBus bus(Wire);
    std::unique_ptr<MMA845x::Driver> accel;
    Settings::NodeSettings settings;

    uint32_t lastSampleMs = 0;
    bool printing = true;
}

/**
 * @brief Print the driver's one-line description
 */
void printDescription() {
    char line[96];
    MMA845x::Status status = accel->describe(line, sizeof(line));
    if (status != MMA845x::Status::Ok) {
        ESP_LOGW(TAG, "CTRL_REG1 read failed: %s", MMA845x::statusToString(status));
    }
    Serial.println(line);
}

/**
 * @brief Switch range: standby, write range, back to active, persist
 */
void changeRange(MMA845x::Range range) {
    MMA845x::Status status = accel->standby();
    if (status == MMA845x::Status::Ok) {
        status = accel->setRange(range);
    }
    if (status == MMA845x::Status::Ok) {
        status = accel->active();
    }

    if (status != MMA845x::Status::Ok) {
        ESP_LOGE(TAG, "Range change to %ug failed: %s (bus error %u)",
                 MMA845x::rangeToG(range), MMA845x::statusToString(status),
                 accel->lastBusError());
        return;
    }

    if (!Settings::saveRange(range)) {
        ESP_LOGW(TAG, "Range not persisted");
    }
    ESP_LOGI(TAG, "Range set to %ug", MMA845x::rangeToG(range));
}

/**
 * @brief Halve or double the sample period and persist it
 */
void changeSamplePeriod(bool faster) {
    uint32_t period = Settings::stepSamplePeriod(settings.samplePeriodMs, faster);
    settings.samplePeriodMs = static_cast<uint16_t>(period);

    if (!Settings::saveSamplePeriod(period)) {
        ESP_LOGW(TAG, "Sample period not persisted");
    }
    ESP_LOGI(TAG, "Sample period %lu ms", (unsigned long)period);
}

/**
 * @brief Open the device at the other address and switch to it on success
 */
void changeAddress() {
    uint8_t address = Settings::alternateAddress(settings.address);

    std::unique_ptr<MMA845x::Driver> next;
    MMA845x::Status status =
        MMA845x::Driver::create(bus, address, accel->range(), next);
    if (status != MMA845x::Status::Ok) {
        ESP_LOGE(TAG, "No MMA845x at 0x%02X: %s", address, MMA845x::statusToString(status));
        return;
    }

    status = next->active();
    if (status != MMA845x::Status::Ok) {
        ESP_LOGE(TAG, "Activation at 0x%02X failed: %s (bus error %u)",
                 address, MMA845x::statusToString(status), next->lastBusError());
        return;
    }

    accel = std::move(next);
    settings.address = address;
    if (!Settings::saveAddress(address)) {
        ESP_LOGW(TAG, "Address not persisted");
    }
    ESP_LOGI(TAG, "Now using 0x%02X", address);
}

/**
 * @brief Handle one console command character
 */
void handleCommand(char cmd) {
    MMA845x::Range range;
    MMA845x::Status status = MMA845x::Status::Ok;

    switch (cmd) {
        case '2':
        case '4':
        case '8':
            if (MMA845x::rangeFromG(cmd - '0', range)) {
                changeRange(range);
            }
            break;
        case 's':
            status = accel->standby();
            break;
        case 'a':
            status = accel->active();
            break;
        case '+':
        case '-':
            changeSamplePeriod(cmd == '+');
            break;
        case 'x':
            changeAddress();
            break;
        case 'd':
            printDescription();
            break;
        case 'p':
            printing = !printing;
            Serial.println(printing ? "[Main] Sampling resumed" : "[Main] Sampling paused");
            break;
        case '\r':
        case '\n':
            break;
        default:
            Serial.println("[Main] Commands: 2/4/8 range, s standby, a active, +/- period, x address, d describe, p pause");
            break;
    }

    if (status != MMA845x::Status::Ok) {
        ESP_LOGE(TAG, "Mode change failed: %s (bus error %u)",
                 MMA845x::statusToString(status), accel->lastBusError());
    }
}

void setup() {
    Serial.begin(SERIAL_BAUD);
    while (!Serial && millis() < 3000); // Wait for USB CDC

    Serial.println();
    Serial.println("=====================================");
    Serial.println("  MMA845x Accelerometer Node v1.0");
    Serial.println("=====================================");
    Serial.println();

    if (!Settings::init()) {
        ESP_LOGW(TAG, "NVS unavailable, running with defaults");
    }
    settings = Settings::load();

    if (!Wire.begin(PIN_I2C_SDA, PIN_I2C_SCL, I2C_FREQ_HZ)) {
        ESP_LOGE(TAG, "I2C bus init failed (SDA=%d SCL=%d)", PIN_I2C_SDA, PIN_I2C_SCL);
        return;
    }

    if (!bus.isPresent(settings.address)) {
        ESP_LOGW(TAG, "No ACK at 0x%02X", settings.address);
    }

    MMA845x::Status status =
        MMA845x::Driver::create(bus, settings.address, settings.range, accel);
    if (status != MMA845x::Status::Ok) {
        ESP_LOGE(TAG, "MMA845x init at 0x%02X failed: %s",
                 settings.address, MMA845x::statusToString(status));
        return;
    }

    ESP_LOGI(TAG, "%s (WHO_AM_I=0x%02X) at 0x%02X, +/-%ug",
             accel->partName(), accel->deviceId(), accel->address(),
             MMA845x::rangeToG(accel->range()));

    status = accel->active();
    if (status != MMA845x::Status::Ok) {
        ESP_LOGE(TAG, "Activation failed: %s (bus error %u)",
                 MMA845x::statusToString(status), accel->lastBusError());
    }

    printDescription();
    Serial.println("[Main] Setup complete");
}

void loop() {
    if (!accel) {
        delay(1000);
        return;
    }

    while (Serial.available() > 0) {
        handleCommand(static_cast<char>(Serial.read()));
    }

    uint32_t now = millis();
    if (!printing || (now - lastSampleMs) < settings.samplePeriodMs) {
        delay(1);
        return;
    }
    lastSampleMs = now;

    if (accel->mode() != MMA845x::Mode::Active) {
        return;
    }

    bool ready = false;
    MMA845x::Status status = accel->dataReady(ready);
    if (status != MMA845x::Status::Ok) {
        ESP_LOGW(TAG, "STATUS read failed: %s (bus error %u)",
                 MMA845x::statusToString(status), accel->lastBusError());
        return;
    }
    if (!ready) {
        return;
    }

    MMA845x::Acceleration a;
    status = accel->readAllG(a);
    if (status != MMA845x::Status::Ok) {
        ESP_LOGW(TAG, "Sample read failed: %s (bus error %u)",
                 MMA845x::statusToString(status), accel->lastBusError());
        return;
    }

    Serial.printf("%lu,%.4f,%.4f,%.4f\n", (unsigned long)now, a.x, a.y, a.z);
}
