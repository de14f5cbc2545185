/**
 * @file mma845x.cpp
 * @brief MMA8451Q / MMA8452Q Accelerometer Driver Implementation
 */

#include "mma845x.h"
#include <cstdio>

namespace MMA845x {

namespace {
    // Full 16-bit output span
    constexpr float COUNTS_PER_SPAN = 65536.0f;

    struct AxisRegs {
        uint8_t msb;
        uint8_t lsb;
    };

    AxisRegs axisRegisters(Axis axis) {
        switch (axis) {
            case Axis::Y: return {Reg::OUT_Y_MSB, Reg::OUT_Y_LSB};
            case Axis::Z: return {Reg::OUT_Z_MSB, Reg::OUT_Z_LSB};
            case Axis::X:
            default:      return {Reg::OUT_X_MSB, Reg::OUT_X_LSB};
        }
    }

    bool isSupportedId(uint8_t id) {
        return id == WHO_AM_I_MMA8451 || id == WHO_AM_I_MMA8452;
    }
}

// ============================================================================
// Conversion Helpers
// ============================================================================

int16_t toSigned(uint16_t word) {
    int32_t value = word;
    if (value >= 32768) {
        value -= 65536;
    }
    return static_cast<int16_t>(value);
}

bool isValidRange(Range range) {
    switch (range) {
        case Range::G2:
        case Range::G4:
        case Range::G8:
            return true;
        default:
            return false;
    }
}

uint8_t rangeToG(Range range) {
    switch (range) {
        case Range::G2: return 2;
        case Range::G4: return 4;
        case Range::G8: return 8;
        default:        return 0;
    }
}

bool rangeFromG(uint8_t g, Range& range) {
    switch (g) {
        case 2: range = Range::G2; return true;
        case 4: range = Range::G4; return true;
        case 8: range = Range::G8; return true;
        default: return false;
    }
}

float gPerLsb(Range range) {
    // ±2g: 4 g / 65536 = 0.000061 g/LSB
    return (2.0f * rangeToG(range)) / COUNTS_PER_SPAN;
}

const char* statusToString(Status status) {
    switch (status) {
        case Status::Ok:                      return "ok";
        case Status::UnsupportedDevice:       return "unsupported device";
        case Status::InvalidRange:            return "invalid range";
        case Status::InvalidModeForOperation: return "invalid mode for operation";
        case Status::TransportError:          return "transport error";
        default:                              return "unknown";
    }
}

const char* modeToString(Mode mode) {
    return mode == Mode::Active ? "active" : "standby";
}

// ============================================================================
// Construction
// ============================================================================

Driver::Driver(RegisterBus& bus, uint8_t address, uint8_t deviceId)
    : bus_(bus), address_(address), deviceId_(deviceId) {}

Status Driver::create(RegisterBus& bus, uint8_t address, Range range,
                      std::unique_ptr<Driver>& driver) {
    if (!isValidRange(range)) {
        return Status::InvalidRange;
    }

    uint8_t id = 0;
    if (bus.read(address, Reg::WHO_AM_I, &id, 1) != BusError::NONE) {
        return Status::TransportError;
    }

    if (!isSupportedId(id)) {
        return Status::UnsupportedDevice;
    }

    std::unique_ptr<Driver> dev(new Driver(bus, address, id));

    // Configuration registers are only writable in standby
    Status status = dev->standby();
    if (status != Status::Ok) {
        return status;
    }

    status = dev->setRange(range);
    if (status != Status::Ok) {
        return status;
    }

    driver = std::move(dev);
    return Status::Ok;
}

// ============================================================================
// Register Access
// ============================================================================

Status Driver::readRegister(uint8_t reg, uint8_t& value) {
    uint8_t err = bus_.read(address_, reg, &value, 1);
    if (err != BusError::NONE) {
        lastBusError_ = err;
        return Status::TransportError;
    }
    return Status::Ok;
}

Status Driver::writeRegister(uint8_t reg, uint8_t value) {
    uint8_t err = bus_.write(address_, reg, &value, 1);
    if (err != BusError::NONE) {
        lastBusError_ = err;
        return Status::TransportError;
    }
    return Status::Ok;
}

// ============================================================================
// Mode Control
// ============================================================================

Status Driver::setActiveBit(bool on) {
    uint8_t ctrl1 = 0;
    Status status = readRegister(Reg::CTRL_REG1, ctrl1);
    if (status != Status::Ok) {
        return status;
    }

    if (on) {
        ctrl1 |= Bits::ACTIVE;
    } else {
        ctrl1 &= static_cast<uint8_t>(~Bits::ACTIVE);
    }

    status = writeRegister(Reg::CTRL_REG1, ctrl1);
    if (status != Status::Ok) {
        return status;
    }

    mode_ = on ? Mode::Active : Mode::Standby;
    return Status::Ok;
}

Status Driver::standby() {
    return setActiveBit(false);
}

Status Driver::active() {
    return setActiveBit(true);
}

Status Driver::setRange(Range range) {
    if (mode_ == Mode::Active) {
        return Status::InvalidModeForOperation;
    }
    if (!isValidRange(range)) {
        return Status::InvalidRange;
    }

    uint8_t cfg = 0;
    Status status = readRegister(Reg::XYZ_DATA_CFG, cfg);
    if (status != Status::Ok) {
        return status;
    }

    cfg = (cfg & static_cast<uint8_t>(~Bits::FS_MASK)) |
          (static_cast<uint8_t>(range) & Bits::FS_MASK);

    status = writeRegister(Reg::XYZ_DATA_CFG, cfg);
    if (status != Status::Ok) {
        return status;
    }

    range_ = range;
    return Status::Ok;
}

// ============================================================================
// Sampling
// ============================================================================

Status Driver::readAxisRaw(Axis axis, int16_t& raw) {
    AxisRegs regs = axisRegisters(axis);

    uint8_t msb = 0;
    uint8_t lsb = 0;
    Status status = readRegister(regs.msb, msb);
    if (status != Status::Ok) {
        return status;
    }
    status = readRegister(regs.lsb, lsb);
    if (status != Status::Ok) {
        return status;
    }

    raw = toSigned(static_cast<uint16_t>((msb << 8) | lsb));
    return Status::Ok;
}

Status Driver::readAxisG(Axis axis, float& g) {
    int16_t raw = 0;
    Status status = readAxisRaw(axis, raw);
    if (status != Status::Ok) {
        return status;
    }

    g = raw * gPerLsb(range_);
    return Status::Ok;
}

Status Driver::readAllRaw(RawSample& sample) {
    RawSample s = {0, 0, 0};

    Status status = readAxisRaw(Axis::X, s.x);
    if (status == Status::Ok) status = readAxisRaw(Axis::Y, s.y);
    if (status == Status::Ok) status = readAxisRaw(Axis::Z, s.z);
    if (status != Status::Ok) {
        return status;
    }

    sample = s;
    return Status::Ok;
}

Status Driver::readAllG(Acceleration& accel) {
    RawSample s;
    Status status = readAllRaw(s);
    if (status != Status::Ok) {
        return status;
    }

    const float scale = gPerLsb(range_);
    accel.x = s.x * scale;
    accel.y = s.y * scale;
    accel.z = s.z * scale;
    return Status::Ok;
}

Status Driver::dataReady(bool& ready) {
    uint8_t st = 0;
    Status status = readRegister(Reg::STATUS, st);
    if (status != Status::Ok) {
        return status;
    }

    ready = (st & Bits::ZYXDR) != 0;
    return Status::Ok;
}

// ============================================================================
// Diagnostics
// ============================================================================

const char* Driver::partName() const {
    return deviceId_ == WHO_AM_I_MMA8451 ? "MMA8451" : "MMA8452";
}

Status Driver::describe(char* buf, size_t len) {
    if (buf == nullptr || len == 0) {
        return Status::Ok;
    }

    // Hardware is the source of truth for the mode
    uint8_t ctrl1 = 0;
    Status status = readRegister(Reg::CTRL_REG1, ctrl1);

    if (status == Status::Ok) {
        snprintf(buf, len, "%s: I2C address 0x%02X, Range=%ug, Mode=%s",
                 partName(), (unsigned)address_, (unsigned)rangeToG(range_),
                 modeToString((ctrl1 & Bits::ACTIVE) ? Mode::Active : Mode::Standby));
    } else {
        snprintf(buf, len, "%s: I2C address 0x%02X, Range=%ug, Mode=unknown (bus error %u)",
                 partName(), (unsigned)address_, (unsigned)rangeToG(range_),
                 (unsigned)lastBusError_);
    }
    return status;
}

} // namespace MMA845x
