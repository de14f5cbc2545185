/**
 * @file register_bus.h
 * @brief Register-addressed two-wire transport used by the sensor drivers
 *
 * A bus implementation issues one register transaction per call and blocks
 * until it completes. Return codes follow TwoWire::endTransmission():
 * 0 is success, anything else is a transport error passed back untouched.
 */

#ifndef REGISTER_BUS_H
#define REGISTER_BUS_H

#include <Arduino.h>

// ============================================================================
// Transport Error Codes
// ============================================================================

namespace BusError {
    constexpr uint8_t NONE          = 0;  // Transaction acknowledged
    constexpr uint8_t DATA_TOO_LONG = 1;  // Data too long for transmit buffer
    constexpr uint8_t NACK_ADDRESS  = 2;  // NACK on device address
    constexpr uint8_t NACK_DATA     = 3;  // NACK on data byte
    constexpr uint8_t OTHER         = 4;  // Other bus error
    constexpr uint8_t TIMEOUT       = 5;  // Bus timeout
    constexpr uint8_t SHORT_READ    = 6;  // Fewer bytes received than requested
}

// ============================================================================
// Bus Interface
// ============================================================================

/**
 * @brief Register-level access to devices on a shared two-wire bus
 *
 * Not thread-safe. Callers serialise access for the duration of each
 * logical operation.
 */
class RegisterBus {
public:
    virtual ~RegisterBus() = default;

    /**
     * @brief Read consecutive registers
     * @param devAddr 7-bit device address
     * @param reg First register to read
     * @param data Output buffer (len bytes)
     * @param len Number of bytes to read
     * @return BusError::NONE on success, transport error code otherwise
     */
    virtual uint8_t read(uint8_t devAddr, uint8_t reg, uint8_t* data, size_t len) = 0;

    /**
     * @brief Write consecutive registers
     * @param devAddr 7-bit device address
     * @param reg First register to write
     * @param data Bytes to write (len bytes)
     * @param len Number of bytes to write
     * @return BusError::NONE on success, transport error code otherwise
     */
    virtual uint8_t write(uint8_t devAddr, uint8_t reg, const uint8_t* data, size_t len) = 0;
};

#endif // REGISTER_BUS_H
