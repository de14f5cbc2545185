/**
 * @file Arduino.h
 * @brief Arduino core compatibility header for native testing
 *
 * Included via -I test/mocks on host builds so the sensor core and settings
 * compile without the ESP32 toolchain.
 */

#ifndef ARDUINO_H
#define ARDUINO_H

#include "mock_arduino.h"

#endif // ARDUINO_H
