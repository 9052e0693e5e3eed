#pragma once
#include "hal/Register.hpp"
#include <cstdint>

namespace hal {
namespace ina260 {

// ============================================================================
// Register Addresses
// ============================================================================

namespace Reg {
    inline constexpr uint8_t CONFIG      = 0x00;  // Configuration (R/W)
    inline constexpr uint8_t CURRENT     = 0x01;  // Current, 1.25 mA/bit, signed (R)
    inline constexpr uint8_t BUS_VOLTAGE = 0x02;  // Bus voltage, 1.25 mV/bit (R)
    inline constexpr uint8_t POWER       = 0x03;  // Power, 10 mW/bit (R)
    inline constexpr uint8_t MASK_ENABLE = 0x06;  // Alert source and flags (R/W)
    inline constexpr uint8_t ALERT_LIMIT = 0x07;  // Alert comparison value (R/W)
    inline constexpr uint8_t MFG_ID      = 0xFE;  // Manufacturer ID, 0x5449 (R)
    inline constexpr uint8_t DIE_ID      = 0xFF;  // Device ID + revision (R)
}

// ============================================================================
// Scale Factors (datasheet, SI units)
// ============================================================================

inline constexpr float CURRENT_LSB_A = 0.00125f;  // 1.25 mA
inline constexpr float VOLTAGE_LSB_V = 0.00125f;  // 1.25 mV
inline constexpr float POWER_LSB_W   = 0.01f;     // 10 mW

// Power-on value of the configuration register
inline constexpr uint16_t CONFIG_DEFAULT = 0x6127;

// Bits 14..12 of CONFIG are reserved and read back as 110b
inline constexpr uint16_t CONFIG_RESERVED_BITS = 0x6000;

inline constexpr uint16_t CONFIG_RESET = 0x8000;

// ============================================================================
// Scaled Registers
// ============================================================================

inline constexpr ReadOnlyRegister CURRENT{
    Reg::CURRENT, 16, Encoding::TwosComplement, CURRENT_LSB_A, -32768, 32767};

// Bit 15 of the bus voltage register is always zero (40.96 V full scale)
inline constexpr ReadOnlyRegister VOLTAGE{
    Reg::BUS_VOLTAGE, 16, Encoding::Unsigned, VOLTAGE_LSB_V, 0, 0x7FFF};

inline constexpr ReadOnlyRegister POWER{
    Reg::POWER, 16, Encoding::Unsigned, POWER_LSB_W, 0, 0xFFFF};

// The alert limit takes the format of the register selected in MASK_ENABLE.
// Bus voltage format is the register's documented default.
inline constexpr ReadWriteRegister ALERT_LIMIT_VOLTAGE{
    Reg::ALERT_LIMIT, 16, Encoding::Unsigned, VOLTAGE_LSB_V, 0, 0x7FFF};

inline constexpr ReadWriteRegister ALERT_LIMIT_CURRENT{
    Reg::ALERT_LIMIT, 16, Encoding::TwosComplement, CURRENT_LSB_A, -32768, 32767};

inline constexpr ReadWriteRegister ALERT_LIMIT_POWER{
    Reg::ALERT_LIMIT, 16, Encoding::Unsigned, POWER_LSB_W, 0, 0xFFFF};

// ============================================================================
// Bit Fields
// ============================================================================

namespace Field {
    // CONFIG
    inline constexpr ReadWriteField RESET{Reg::CONFIG, 15, 1};
    inline constexpr ReadWriteField AVERAGING{Reg::CONFIG, 9, 3};
    inline constexpr ReadWriteField VBUS_CONV_TIME{Reg::CONFIG, 6, 3};
    inline constexpr ReadWriteField ISH_CONV_TIME{Reg::CONFIG, 3, 3};
    inline constexpr ReadWriteField MODE{Reg::CONFIG, 0, 3};

    // MASK_ENABLE
    inline constexpr ReadWriteField MASK_ENABLE{Reg::MASK_ENABLE, 0, 16};
    inline constexpr ReadWriteField ALERT_FUNCTIONS{Reg::MASK_ENABLE, 11, 5};  // OCL..POL
    inline constexpr ReadWriteField OVER_CURRENT{Reg::MASK_ENABLE, 15, 1};
    inline constexpr ReadWriteField UNDER_CURRENT{Reg::MASK_ENABLE, 14, 1};
    inline constexpr ReadWriteField BUS_OVER_VOLTAGE{Reg::MASK_ENABLE, 13, 1};
    inline constexpr ReadWriteField BUS_UNDER_VOLTAGE{Reg::MASK_ENABLE, 12, 1};
    inline constexpr ReadWriteField POWER_OVER_LIMIT{Reg::MASK_ENABLE, 11, 1};
    inline constexpr ReadWriteField CONVERSION_READY_ALERT{Reg::MASK_ENABLE, 10, 1};
    inline constexpr ReadOnlyField ALERT_FUNCTION_FLAG{Reg::MASK_ENABLE, 4, 1};
    inline constexpr ReadOnlyField CONVERSION_READY_FLAG{Reg::MASK_ENABLE, 3, 1};
    inline constexpr ReadOnlyField MATH_OVERFLOW_FLAG{Reg::MASK_ENABLE, 2, 1};
    inline constexpr ReadWriteField ALERT_POLARITY{Reg::MASK_ENABLE, 1, 1};
    inline constexpr ReadWriteField ALERT_LATCH{Reg::MASK_ENABLE, 0, 1};

    // ALERT_LIMIT as a plain word
    inline constexpr ReadWriteField ALERT_LIMIT_WORD{Reg::ALERT_LIMIT, 0, 16};

    // Identification
    inline constexpr ReadOnlyField MANUFACTURER_ID{Reg::MFG_ID, 0, 16};
    inline constexpr ReadOnlyField DIE_ID{Reg::DIE_ID, 0, 16};
    inline constexpr ReadOnlyField DEVICE_ID{Reg::DIE_ID, 4, 12};
    inline constexpr ReadOnlyField REVISION_ID{Reg::DIE_ID, 0, 4};
}

// ============================================================================
// Field Values
// ============================================================================

// Operating mode (CONFIG bits 2..0)
enum class Mode : uint8_t {
    Shutdown          = 0x0,
    CurrentTriggered  = 0x1,
    VoltageTriggered  = 0x2,
    Triggered         = 0x3,  // current and bus voltage, one shot
    PowerDown         = 0x4,  // same effect as Shutdown
    CurrentContinuous = 0x5,
    VoltageContinuous = 0x6,
    Continuous        = 0x7   // power-on default
};

// Samples averaged per reported value (CONFIG bits 11..9)
enum class AveragingCount : uint8_t {
    Count1    = 0x0,  // power-on default
    Count4    = 0x1,
    Count16   = 0x2,
    Count64   = 0x3,
    Count128  = 0x4,
    Count256  = 0x5,
    Count512  = 0x6,
    Count1024 = 0x7
};

// Conversion time for bus voltage (bits 8..6) or current (bits 5..3)
enum class ConversionTime : uint8_t {
    Us140  = 0x0,
    Us204  = 0x1,
    Us332  = 0x2,
    Us558  = 0x3,
    Us1100 = 0x4,  // power-on default
    Us2116 = 0x5,
    Us4156 = 0x6,
    Us8244 = 0x7
};

// Functions that can drive the ALERT pin (MASK_ENABLE bits 15..10)
enum class AlertSource : uint8_t {
    OverCurrent,
    UnderCurrent,
    BusOverVoltage,
    BusUnderVoltage,
    PowerOverLimit,
    ConversionReady
};

inline bool isTriggered(Mode mode) {
    return mode == Mode::CurrentTriggered || mode == Mode::VoltageTriggered ||
           mode == Mode::Triggered;
}

inline uint16_t averagingSamples(AveragingCount count) {
    static const uint16_t samples[] = {1, 4, 16, 64, 128, 256, 512, 1024};
    return samples[static_cast<uint8_t>(count) & 0x7];
}

inline uint16_t conversionTimeMicros(ConversionTime time) {
    static const uint16_t times[] = {140, 204, 332, 558, 1100, 2116, 4156, 8244};
    return times[static_cast<uint8_t>(time) & 0x7];
}

inline const ReadWriteField& alertField(AlertSource source) {
    switch (source) {
        case AlertSource::OverCurrent:     return Field::OVER_CURRENT;
        case AlertSource::UnderCurrent:    return Field::UNDER_CURRENT;
        case AlertSource::BusOverVoltage:  return Field::BUS_OVER_VOLTAGE;
        case AlertSource::BusUnderVoltage: return Field::BUS_UNDER_VOLTAGE;
        case AlertSource::PowerOverLimit:  return Field::POWER_OVER_LIMIT;
        default:                           return Field::CONVERSION_READY_ALERT;
    }
}

// Limit format matching the register the source compares against.
// ConversionReady has no limit; the bus voltage format is returned for it.
inline const ReadWriteRegister& alertLimitFormat(AlertSource source) {
    switch (source) {
        case AlertSource::OverCurrent:
        case AlertSource::UnderCurrent:
            return ALERT_LIMIT_CURRENT;
        case AlertSource::PowerOverLimit:
            return ALERT_LIMIT_POWER;
        default:
            return ALERT_LIMIT_VOLTAGE;
    }
}

} // namespace ina260
} // namespace hal
