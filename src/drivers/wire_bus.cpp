/**
 * @file wire_bus.cpp
 * @brief RegisterBus implementation on Arduino Wire
 */

#include "wire_bus.h"
#include <esp_log.h>

static const char* TAG = "WireBus";

uint8_t WireBus::read(uint8_t devAddr, uint8_t reg, uint8_t* data, size_t len) {
    wire_.beginTransmission(devAddr);
    wire_.write(reg);
    uint8_t err = wire_.endTransmission(false);
    if (err != BusError::NONE) {
        ESP_LOGW(TAG, "Read 0x%02X:0x%02X address phase failed (%u)", devAddr, reg, err);
        return err;
    }

    size_t received = wire_.requestFrom(devAddr, (uint8_t)len);
    if (received != len) {
        ESP_LOGW(TAG, "Read 0x%02X:0x%02X got %u of %u bytes",
                 devAddr, reg, (unsigned)received, (unsigned)len);
        return BusError::SHORT_READ;
    }

    for (size_t i = 0; i < len; i++) {
        data[i] = wire_.read();
    }
    return BusError::NONE;
}

uint8_t WireBus::write(uint8_t devAddr, uint8_t reg, const uint8_t* data, size_t len) {
    wire_.beginTransmission(devAddr);
    wire_.write(reg);
    for (size_t i = 0; i < len; i++) {
        wire_.write(data[i]);
    }

    uint8_t err = wire_.endTransmission();
    if (err != BusError::NONE) {
        ESP_LOGW(TAG, "Write 0x%02X:0x%02X failed (%u)", devAddr, reg, err);
    }
    return err;
}

bool WireBus::isPresent(uint8_t devAddr) {
    wire_.beginTransmission(devAddr);
    return wire_.endTransmission() == BusError::NONE;
}
