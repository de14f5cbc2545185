/**
 * @file fake_register_bus.h
 * @brief In-memory RegisterBus for native driver tests
 *
 * Models one device as a 256-byte register file. Every write is logged,
 * and a transport error can be injected on a chosen register.
 */

#ifndef FAKE_REGISTER_BUS_H
#define FAKE_REGISTER_BUS_H

#include <vector>
#include "drivers/register_bus.h"

class FakeRegisterBus : public RegisterBus {
public:
    struct WriteRecord {
        uint8_t reg;
        uint8_t value;
    };

    explicit FakeRegisterBus(uint8_t devAddr) : devAddr_(devAddr) {
        memset(regs_, 0, sizeof(regs_));
    }

    uint8_t read(uint8_t devAddr, uint8_t reg, uint8_t* data, size_t len) override {
        reads++;
        if (devAddr != devAddr_) return BusError::NACK_ADDRESS;
        if (readFailReg_ >= 0 && reg == readFailReg_) return failCode_;
        for (size_t i = 0; i < len; i++) {
            data[i] = regs_[(uint8_t)(reg + i)];
        }
        return BusError::NONE;
    }

    uint8_t write(uint8_t devAddr, uint8_t reg, const uint8_t* data, size_t len) override {
        if (devAddr != devAddr_) return BusError::NACK_ADDRESS;
        if (writeFailReg_ >= 0 && reg == writeFailReg_) return failCode_;
        for (size_t i = 0; i < len; i++) {
            regs_[(uint8_t)(reg + i)] = data[i];
            writes.push_back({(uint8_t)(reg + i), data[i]});
        }
        return BusError::NONE;
    }

    void set(uint8_t reg, uint8_t value) { regs_[reg] = value; }
    uint8_t get(uint8_t reg) const { return regs_[reg]; }

    /** @brief Fail reads of reg with code (-1 clears) */
    void failReadsOf(int reg, uint8_t code = BusError::NACK_DATA) {
        readFailReg_ = reg;
        failCode_ = code;
    }

    /** @brief Fail writes to reg with code (-1 clears) */
    void failWritesTo(int reg, uint8_t code = BusError::NACK_DATA) {
        writeFailReg_ = reg;
        failCode_ = code;
    }

    void clearLog() {
        writes.clear();
        reads = 0;
    }

    std::vector<WriteRecord> writes;
    size_t reads = 0;

private:
    uint8_t devAddr_;
    uint8_t regs_[256];
    int readFailReg_ = -1;
    int writeFailReg_ = -1;
    uint8_t failCode_ = BusError::NACK_DATA;
};

#endif // FAKE_REGISTER_BUS_H
