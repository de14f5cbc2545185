/**
 * @file mock_arduino.h
 * @brief Mock Arduino types and functions for native unit testing
 *
 * Provides the subset of the Arduino-ESP32 core used by the host-testable
 * modules: integer types, time functions, a capturing Serial and an
 * in-memory Preferences (NVS) store.
 */

#ifndef MOCK_ARDUINO_H
#define MOCK_ARDUINO_H

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <cstdio>
#include <cstdarg>
#include <map>
#include <string>

// ============================================================================
// Arduino Type Definitions
// ============================================================================

typedef uint8_t byte;
typedef bool boolean;

// ============================================================================
// Arduino Constants
// ============================================================================

#define HIGH 1
#define LOW 0
#define INPUT 0
#define OUTPUT 1
#define INPUT_PULLUP 2

// ============================================================================
// ISR Attributes (no-op on native)
// ============================================================================

#define IRAM_ATTR
#define ICACHE_RAM_ATTR
#define PROGMEM

// ============================================================================
// Mock State
// ============================================================================

namespace MockArduino {
    extern uint32_t mockMillis;
    extern uint32_t mockMicros;

    // Everything written to Serial since the last reset
    extern std::string serialOutput;

    // NVS contents, keyed by "namespace/key"
    extern std::map<std::string, uint32_t> nvs;

    // Make the next Preferences::begin() fail
    extern bool failPreferencesBegin;

    void reset();
}

// ============================================================================
// Mock Time Functions
// ============================================================================

inline uint32_t millis() { return MockArduino::mockMillis; }
inline uint32_t micros() { return MockArduino::mockMicros; }
inline void delay(uint32_t ms) { MockArduino::mockMillis += ms; }
inline void delayMicroseconds(uint32_t us) { MockArduino::mockMicros += us; }

// ============================================================================
// Print / Serial Mock
// ============================================================================

class Print {
public:
    virtual ~Print() = default;
    virtual size_t write(uint8_t) = 0;
    virtual size_t write(const uint8_t* buffer, size_t size) {
        size_t n = 0;
        while (size--) n += write(*buffer++);
        return n;
    }

    size_t print(const char* str) { return write((const uint8_t*)str, strlen(str)); }
    size_t print(char c) { return write((uint8_t)c); }
    size_t print(int n) { char buf[16]; snprintf(buf, 16, "%d", n); return print(buf); }
    size_t print(unsigned int n) { char buf[16]; snprintf(buf, 16, "%u", n); return print(buf); }
    size_t print(float n, int decimals = 2) { char buf[32]; snprintf(buf, 32, "%.*f", decimals, n); return print(buf); }

    size_t println() { return print("\n"); }
    size_t println(const char* str) { return print(str) + println(); }
    size_t println(int n) { return print(n) + println(); }

    int printf(const char* format, ...) {
        char buf[256];
        va_list args;
        va_start(args, format);
        int len = vsnprintf(buf, sizeof(buf), format, args);
        va_end(args);
        if (len > 0) {
            print(buf);
        }
        return len;
    }
};

class MockSerial : public Print {
public:
    using Print::write;

    void begin(unsigned long baud) { (void)baud; }
    void end() {}

    size_t write(uint8_t c) override {
        MockArduino::serialOutput.push_back(static_cast<char>(c));
        return 1;
    }

    int available() { return 0; }
    int read() { return -1; }
    int peek() { return -1; }
    void flush() {}

    operator bool() { return true; }
};

extern MockSerial Serial;

// ============================================================================
// Preferences Mock (NVS)
// ============================================================================

class Preferences {
public:
    bool begin(const char* name, bool readOnly = false) {
        if (MockArduino::failPreferencesBegin) {
            MockArduino::failPreferencesBegin = false;
            return false;
        }
        ns_ = name;
        readOnly_ = readOnly;
        open_ = true;
        return true;
    }
    void end() { open_ = false; }

    size_t putUChar(const char* key, uint8_t value) { return put(key, value) ? sizeof(value) : 0; }
    size_t putUShort(const char* key, uint16_t value) { return put(key, value) ? sizeof(value) : 0; }
    size_t putUInt(const char* key, uint32_t value) { return put(key, value) ? sizeof(value) : 0; }

    uint8_t getUChar(const char* key, uint8_t defaultValue = 0) { return (uint8_t)get(key, defaultValue); }
    uint16_t getUShort(const char* key, uint16_t defaultValue = 0) { return (uint16_t)get(key, defaultValue); }
    uint32_t getUInt(const char* key, uint32_t defaultValue = 0) { return get(key, defaultValue); }

    bool isKey(const char* key) { return open_ && MockArduino::nvs.count(fullKey(key)) != 0; }

    bool remove(const char* key) {
        if (!open_ || readOnly_) return false;
        return MockArduino::nvs.erase(fullKey(key)) != 0;
    }

    bool clear() {
        if (!open_ || readOnly_) return false;
        const std::string prefix = ns_ + "/";
        for (auto it = MockArduino::nvs.begin(); it != MockArduino::nvs.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                it = MockArduino::nvs.erase(it);
            } else {
                ++it;
            }
        }
        return true;
    }

private:
    std::string ns_;
    bool open_ = false;
    bool readOnly_ = false;

    std::string fullKey(const char* key) const { return ns_ + "/" + key; }

    bool put(const char* key, uint32_t value) {
        if (!open_ || readOnly_) return false;
        MockArduino::nvs[fullKey(key)] = value;
        return true;
    }

    uint32_t get(const char* key, uint32_t defaultValue) {
        if (!open_) return defaultValue;
        auto it = MockArduino::nvs.find(fullKey(key));
        return it == MockArduino::nvs.end() ? defaultValue : it->second;
    }
};

#endif // MOCK_ARDUINO_H
