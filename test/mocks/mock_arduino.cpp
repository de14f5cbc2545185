/**
 * @file mock_arduino.cpp
 * @brief Mock Arduino implementation for native tests
 */

#include "mock_arduino.h"

// Mock state
namespace MockArduino {
    uint32_t mockMillis = 0;
    uint32_t mockMicros = 0;
    std::string serialOutput;
    std::map<std::string, uint32_t> nvs;
    bool failPreferencesBegin = false;

    void reset() {
        mockMillis = 0;
        mockMicros = 0;
        serialOutput.clear();
        nvs.clear();
        failPreferencesBegin = false;
    }
}

// Global instances
MockSerial Serial;
