/**
 * @file settings.h
 * @brief Persisted Accelerometer Node Settings (NVS)
 *
 * Stores the sensor bus address, full-scale range and sample period so the
 * node comes back up with the last configuration after a reset. Missing or
 * corrupt entries fall back to the pin_config.h defaults.
 */

#ifndef SETTINGS_H
#define SETTINGS_H

#include <Arduino.h>
#include "../drivers/mma845x.h"

namespace Settings {

/** @brief Node configuration */
struct NodeSettings {
    uint8_t address;            // MMA845x I2C address
    MMA845x::Range range;       // Full-scale range
    uint16_t samplePeriodMs;    // Sample print period
};

/**
 * @brief Compile-time defaults from pin_config.h
 */
NodeSettings defaults();

/**
 * @brief Open the NVS namespace
 * @return true if storage is available
 */
bool init();

/**
 * @brief Close the NVS namespace
 */
void end();

/**
 * @brief Load settings, substituting defaults for invalid entries
 */
NodeSettings load();

/**
 * @brief Persist the full-scale range
 * @return false if storage is closed or the write failed
 */
bool saveRange(MMA845x::Range range);

/**
 * @brief Persist the sample period
 * @return false if out of bounds, storage is closed or the write failed
 */
bool saveSamplePeriod(uint32_t periodMs);

/**
 * @brief Persist the device address (0x1C or 0x1D only)
 */
bool saveAddress(uint8_t address);

/**
 * @brief Erase all stored settings
 */
bool clear();

bool isValidAddress(uint8_t address);
bool isValidSamplePeriod(uint32_t periodMs);

/**
 * @brief The other of the two supported addresses (SA0 high/low)
 */
uint8_t alternateAddress(uint8_t address);

/**
 * @brief Halve (faster) or double the sample period, clamped to bounds
 */
uint32_t stepSamplePeriod(uint32_t periodMs, bool faster);

} // namespace Settings

#endif // SETTINGS_H
