#pragma once
#include <cstdint>

namespace config {

// ============================================================================
// INA260 Addressing
// ============================================================================

// Factory default with A0 = A1 = GND
inline constexpr uint8_t I2C_ADDR_INA260 = 0x40;

// A0/A1 strapping selects one of 16 addresses
inline constexpr uint8_t I2C_ADDR_INA260_MIN = 0x40;
inline constexpr uint8_t I2C_ADDR_INA260_MAX = 0x4F;

// ============================================================================
// INA260 Identification
// ============================================================================

inline constexpr uint16_t INA260_MANUFACTURER_ID = 0x5449;  // "TI"
inline constexpr uint16_t INA260_DEVICE_ID       = 0x227;   // Die ID bits 15..4

// ============================================================================
// I2C Bus (Arduino TwoWire binding)
// ============================================================================

inline constexpr int PIN_I2C_SDA = 1;
inline constexpr int PIN_I2C_SCL = 2;
inline constexpr uint32_t I2C_FREQ_HZ = 400000;  // INA260 supports up to 2.94 MHz; 400k is safe for Wire

// ============================================================================
// Driver Behaviour
// ============================================================================

// Upper bound on Conversion Ready polls before giving up
inline constexpr uint16_t WAIT_FOR_CONVERSION_MAX_POLLS = 100;

// ============================================================================
// Compile-time Validation
// ============================================================================

static_assert(I2C_ADDR_INA260 >= I2C_ADDR_INA260_MIN && I2C_ADDR_INA260 <= I2C_ADDR_INA260_MAX,
              "Default INA260 address outside strapping range");
static_assert(I2C_ADDR_INA260_MAX < 0x80, "I2C addresses are 7-bit");
static_assert(I2C_FREQ_HZ >= 10000 && I2C_FREQ_HZ <= 1000000, "Invalid I2C frequency");
static_assert(WAIT_FOR_CONVERSION_MAX_POLLS > 0, "Need at least one poll");

} // namespace config
