/**
 * @file settings.cpp
 * @brief NVS-backed Node Settings Implementation
 */

#include "settings.h"
#include "../pin_config.h"
#include <Preferences.h>

namespace Settings {

namespace {
    Preferences prefs;
    bool initialized = false;

    constexpr const char* NVS_NAMESPACE = "mma845x";
    constexpr const char* KEY_ADDRESS = "addr";
    constexpr const char* KEY_RANGE = "range";
    constexpr const char* KEY_PERIOD = "period";

    // Marks a key that was never written
    constexpr uint8_t UNSET_U8 = 0xFF;
    constexpr uint16_t UNSET_U16 = 0;
}

NodeSettings defaults() {
    NodeSettings s;
    s.address = I2C_ADDR_MMA845X;
    s.samplePeriodMs = SAMPLE_PERIOD_MS;
    if (!MMA845x::rangeFromG(ACCEL_DEFAULT_RANGE_G, s.range)) {
        s.range = MMA845x::Range::G2;
    }
    return s;
}

bool isValidAddress(uint8_t address) {
    return address == I2C_ADDR_MMA845X || address == I2C_ADDR_MMA845X_ALT;
}

bool isValidSamplePeriod(uint32_t periodMs) {
    return periodMs >= SAMPLE_PERIOD_MIN_MS && periodMs <= SAMPLE_PERIOD_MAX_MS;
}

uint8_t alternateAddress(uint8_t address) {
    return address == I2C_ADDR_MMA845X_ALT ? I2C_ADDR_MMA845X : I2C_ADDR_MMA845X_ALT;
}

uint32_t stepSamplePeriod(uint32_t periodMs, bool faster) {
    uint32_t next = faster ? periodMs / 2 : periodMs * 2;
    if (next < SAMPLE_PERIOD_MIN_MS) return SAMPLE_PERIOD_MIN_MS;
    if (next > SAMPLE_PERIOD_MAX_MS) return SAMPLE_PERIOD_MAX_MS;
    return next;
}

bool init() {
    if (initialized) {
        return true;
    }

    if (!prefs.begin(NVS_NAMESPACE, false)) {
        Serial.println("[Settings] Failed to open NVS namespace");
        return false;
    }

    initialized = true;
    return true;
}

void end() {
    if (initialized) {
        prefs.end();
        initialized = false;
    }
}

NodeSettings load() {
    NodeSettings s = defaults();
    if (!initialized) {
        Serial.println("[Settings] Storage closed, using defaults");
        return s;
    }

    uint8_t address = prefs.getUChar(KEY_ADDRESS, UNSET_U8);
    if (isValidAddress(address)) {
        s.address = address;
    } else if (address != UNSET_U8) {
        Serial.printf("[Settings] Ignoring stored address 0x%02X\n", address);
    }

    uint8_t code = prefs.getUChar(KEY_RANGE, UNSET_U8);
    MMA845x::Range range = static_cast<MMA845x::Range>(code);
    if (MMA845x::isValidRange(range)) {
        s.range = range;
    } else if (code != UNSET_U8) {
        Serial.printf("[Settings] Ignoring stored range code %u\n", code);
    }

    uint16_t period = prefs.getUShort(KEY_PERIOD, UNSET_U16);
    if (isValidSamplePeriod(period)) {
        s.samplePeriodMs = period;
    } else if (period != UNSET_U16) {
        Serial.printf("[Settings] Ignoring stored period %u ms\n", period);
    }

    return s;
}

bool saveRange(MMA845x::Range range) {
    if (!initialized || !MMA845x::isValidRange(range)) {
        return false;
    }
    return prefs.putUChar(KEY_RANGE, static_cast<uint8_t>(range)) == sizeof(uint8_t);
}

bool saveSamplePeriod(uint32_t periodMs) {
    if (!initialized || !isValidSamplePeriod(periodMs)) {
        return false;
    }
    return prefs.putUShort(KEY_PERIOD, static_cast<uint16_t>(periodMs)) == sizeof(uint16_t);
}

bool saveAddress(uint8_t address) {
    if (!initialized || !isValidAddress(address)) {
        return false;
    }
    return prefs.putUChar(KEY_ADDRESS, address) == sizeof(uint8_t);
}

bool clear() {
    if (!initialized) {
        return false;
    }
    Serial.println("[Settings] Cleared");
    return prefs.clear();
}

} // namespace Settings
