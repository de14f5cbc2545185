/**
 * @file mma845x.h
 * @brief MMA8451Q / MMA8452Q 3-Axis Accelerometer Driver
 *
 * Features:
 * - WHO_AM_I identity check (MMA8451Q 0x1A, MMA8452Q 0x2A)
 * - Standby/active mode control via CTRL_REG1
 * - Full-scale range ±2/4/8 g, changeable in standby only
 * - Raw and g-scaled reads for all three axes
 *
 * Bus access is synchronous and not thread-safe; the bus is borrowed from
 * the caller and must outlive the driver.
 */

#ifndef MMA845X_H
#define MMA845X_H

#include <Arduino.h>
#include <memory>
#include "register_bus.h"

namespace MMA845x {

// ============================================================================
// Device Identification
// ============================================================================

constexpr uint8_t WHO_AM_I_MMA8451 = 0x1A;
constexpr uint8_t WHO_AM_I_MMA8452 = 0x2A;

constexpr uint8_t I2C_ADDRESS_SA0_HIGH = 0x1D;  // SparkFun breakout default
constexpr uint8_t I2C_ADDRESS_SA0_LOW  = 0x1C;

// ============================================================================
// Register Definitions
// ============================================================================

namespace Reg {
    constexpr uint8_t STATUS        = 0x00;  // Data-ready flags
    constexpr uint8_t OUT_X_MSB     = 0x01;
    constexpr uint8_t OUT_X_LSB     = 0x02;
    constexpr uint8_t OUT_Y_MSB     = 0x03;
    constexpr uint8_t OUT_Y_LSB     = 0x04;
    constexpr uint8_t OUT_Z_MSB     = 0x05;
    constexpr uint8_t OUT_Z_LSB     = 0x06;
    constexpr uint8_t WHO_AM_I      = 0x0D;
    constexpr uint8_t XYZ_DATA_CFG  = 0x0E;  // Full-scale range, HPF_OUT
    constexpr uint8_t CTRL_REG1     = 0x2A;  // ODR, ACTIVE
}

// ============================================================================
// Bit Definitions
// ============================================================================

namespace Bits {
    // CTRL_REG1
    constexpr uint8_t ACTIVE        = 0x01;  // 1 = active, 0 = standby

    // XYZ_DATA_CFG
    constexpr uint8_t FS_MASK       = 0x03;  // Full-scale field [1:0]

    // STATUS
    constexpr uint8_t ZYXDR         = 0x08;  // New X/Y/Z data available
}

// ============================================================================
// Configuration Enums
// ============================================================================

/** @brief Full-scale range; values are the XYZ_DATA_CFG FS field codes */
enum class Range : uint8_t {
    G2 = 0x00,  // ±2 g
    G4 = 0x01,  // ±4 g
    G8 = 0x02   // ±8 g
};

/** @brief Operating mode (CTRL_REG1 ACTIVE bit) */
enum class Mode : uint8_t {
    Standby,
    Active
};

enum class Axis : uint8_t {
    X,
    Y,
    Z
};

/** @brief Supported parts, keyed by WHO_AM_I */
enum class Variant : uint8_t {
    MMA8451 = WHO_AM_I_MMA8451,
    MMA8452 = WHO_AM_I_MMA8452
};

/** @brief Operation result */
enum class Status : uint8_t {
    Ok,
    UnsupportedDevice,          // WHO_AM_I not recognised
    InvalidRange,               // Range outside ±2/4/8 g
    InvalidModeForOperation,    // Range change attempted while active
    TransportError              // Bus error, code in lastBusError()
};

// ============================================================================
// Data Structures
// ============================================================================

/** @brief One raw sample, signed counts */
struct RawSample {
    int16_t x;
    int16_t y;
    int16_t z;
};

/** @brief One sample in g */
struct Acceleration {
    float x;
    float y;
    float z;
};

// ============================================================================
// Conversion Helpers
// ============================================================================

/**
 * @brief Reinterpret a combined MSB:LSB word as two's complement
 * @return word if word < 32768, else word - 65536
 */
int16_t toSigned(uint16_t word);

/** @brief True for G2, G4 and G8 */
bool isValidRange(Range range);

/** @brief Nominal range in g (2, 4 or 8), 0 for an invalid value */
uint8_t rangeToG(Range range);

/**
 * @brief Map a g value (2, 4, 8) to a Range
 * @return false if g is not a supported range
 */
bool rangeFromG(uint8_t g, Range& range);

/**
 * @brief Scale factor in g per LSB: full span (2 x range) over 65536 codes
 */
float gPerLsb(Range range);

const char* statusToString(Status status);
const char* modeToString(Mode mode);

// ============================================================================
// Driver
// ============================================================================

class Driver {
public:
    /**
     * @brief Identify and configure a device
     *
     * Validates the range, reads WHO_AM_I, forces standby and writes the
     * range. The device is left in standby; call active() to sample.
     *
     * @param bus Transport, borrowed for the driver's lifetime
     * @param address 7-bit I2C address
     * @param range Initial full-scale range
     * @param driver Receives the handle on success, untouched otherwise
     * @return Status::Ok, InvalidRange, UnsupportedDevice or TransportError
     */
    static Status create(RegisterBus& bus, uint8_t address, Range range,
                         std::unique_ptr<Driver>& driver);

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    // ---- Mode control ----

    /**
     * @brief Clear CTRL_REG1 ACTIVE (read-modify-write)
     *
     * Idempotent. Cached mode changes only after the write succeeds.
     */
    Status standby();

    /**
     * @brief Set CTRL_REG1 ACTIVE (read-modify-write)
     *
     * Idempotent. Cached mode changes only after the write succeeds.
     */
    Status active();

    /**
     * @brief Change the full-scale range (standby only)
     *
     * Rewrites only the FS bits of XYZ_DATA_CFG.
     *
     * @return InvalidModeForOperation if active, InvalidRange for a bad
     *         value (neither touches the bus), TransportError on bus failure
     */
    Status setRange(Range range);

    // ---- Sampling ----

    /**
     * @brief Read one axis in signed counts
     *
     * Two fresh single-register reads (MSB then LSB). Allowed in standby,
     * but the data is stale there.
     */
    Status readAxisRaw(Axis axis, int16_t& raw);

    /** @brief Read one axis in g for the current range */
    Status readAxisG(Axis axis, float& g);

    /**
     * @brief Read X, Y and Z in counts
     *
     * Three independent register-pair reads; the axes are not guaranteed
     * to come from the same conversion. Output untouched on failure.
     */
    Status readAllRaw(RawSample& sample);

    /** @brief Read X, Y and Z in g, same caveats as readAllRaw() */
    Status readAllG(Acceleration& accel);

    /** @brief Poll STATUS for the ZYXDR flag */
    Status dataReady(bool& ready);

    // ---- Diagnostics ----

    /**
     * @brief Write a one-line summary, e.g.
     *        "MMA8452: I2C address 0x1D, Range=2g, Mode=active"
     *
     * Mode is re-read from CTRL_REG1; range is the last written value.
     *
     * @return Status of the CTRL_REG1 read (text is produced either way)
     */
    Status describe(char* buf, size_t len);

    // ---- Accessors ----

    uint8_t address() const { return address_; }
    uint8_t deviceId() const { return deviceId_; }
    Variant variant() const { return static_cast<Variant>(deviceId_); }
    const char* partName() const;
    Range range() const { return range_; }
    Mode mode() const { return mode_; }
    float scale() const { return gPerLsb(range_); }

    /** @brief Transport code of the last failed transaction (0 if none) */
    uint8_t lastBusError() const { return lastBusError_; }

private:
    Driver(RegisterBus& bus, uint8_t address, uint8_t deviceId);

    Status readRegister(uint8_t reg, uint8_t& value);
    Status writeRegister(uint8_t reg, uint8_t value);
    Status setActiveBit(bool on);

    RegisterBus& bus_;
    const uint8_t address_;
    const uint8_t deviceId_;
    Range range_ = Range::G2;
    Mode mode_ = Mode::Standby;
    uint8_t lastBusError_ = BusError::NONE;
};

} // namespace MMA845x

#endif // MMA845X_H
