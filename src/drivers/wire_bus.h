/**
 * @file wire_bus.h
 * @brief RegisterBus over the Arduino Wire library
 */

#ifndef WIRE_BUS_H
#define WIRE_BUS_H

#include <Arduino.h>
#include <Wire.h>
#include "register_bus.h"

/**
 * @brief RegisterBus backed by a TwoWire instance
 *
 * The TwoWire object is borrowed and must already be started
 * (Wire.begin()) by the caller.
 */
class WireBus : public RegisterBus {
public:
    explicit WireBus(TwoWire& wire) : wire_(wire) {}

    uint8_t read(uint8_t devAddr, uint8_t reg, uint8_t* data, size_t len) override;
    uint8_t write(uint8_t devAddr, uint8_t reg, const uint8_t* data, size_t len) override;

    /**
     * @brief Check whether a device ACKs its address
     */
    bool isPresent(uint8_t devAddr);

private:
    TwoWire& wire_;
};

#endif // WIRE_BUS_H
