/**
 * @file pin_config.h
 * @brief Board Definitions for the ESP32 MMA845x Accelerometer Node
 *
 * Hardware connections:
 * - MMA8451Q / MMA8452Q accelerometer (I2C, SparkFun breakout)
 *
 * Every value can be overridden with a build flag (-DNAME=value).
 */

#ifndef PIN_CONFIG_H
#define PIN_CONFIG_H

#include <Arduino.h>

// ============================================================================
// I2C BUS
// ============================================================================

/** @brief I2C data line (external pull-up to 3.3V required) */
#ifndef PIN_I2C_SDA
#define PIN_I2C_SDA             21
#endif

/** @brief I2C clock line (external pull-up to 3.3V required) */
#ifndef PIN_I2C_SCL
#define PIN_I2C_SCL             22
#endif

/** @brief I2C bus frequency (100kHz standard mode) */
#ifndef I2C_FREQ_HZ
#define I2C_FREQ_HZ             100000
#endif

// ============================================================================
// I2C DEVICE ADDRESSES
// ============================================================================

/** @brief MMA845x I2C address (SA0=1, breakout default) */
#ifndef I2C_ADDR_MMA845X
#define I2C_ADDR_MMA845X        0x1D
#endif

/** @brief MMA845x alternate address (SA0=0) */
#define I2C_ADDR_MMA845X_ALT    0x1C

// ============================================================================
// SENSOR DEFAULTS
// ============================================================================

/** @brief Full-scale range in g at first boot (2, 4 or 8) */
#ifndef ACCEL_DEFAULT_RANGE_G
#define ACCEL_DEFAULT_RANGE_G   2
#endif

// ============================================================================
// TIMING CONSTANTS
// ============================================================================

/** @brief Default sample print period in milliseconds */
#ifndef SAMPLE_PERIOD_MS
#define SAMPLE_PERIOD_MS        100
#endif

/** @brief Accepted sample period bounds in milliseconds */
#define SAMPLE_PERIOD_MIN_MS    10
#define SAMPLE_PERIOD_MAX_MS    60000

/** @brief Serial console baud rate */
#ifndef SERIAL_BAUD
#define SERIAL_BAUD             115200
#endif

#endif // PIN_CONFIG_H
