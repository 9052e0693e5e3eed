#pragma once
#include "hal/sensors/ISensor.hpp"
#include "hal/sensors/Ina260Registers.hpp"
#include "hal/II2cTransport.hpp"
#include "Config.hpp"

namespace hal {

// Chip configuration applied by Ina260::begin() / configure().
// Defaults match the power-on state of the device.
struct Ina260Settings {
    ina260::Mode mode = ina260::Mode::Continuous;
    ina260::AveragingCount averaging = ina260::AveragingCount::Count1;
    ina260::ConversionTime voltageConversionTime = ina260::ConversionTime::Us1100;
    ina260::ConversionTime currentConversionTime = ina260::ConversionTime::Us1100;

    // Full CONFIG word for these settings (reset bit clear)
    uint16_t configWord() const;
};

/**
 * @brief TI INA260 current / voltage / power monitor
 *
 * Every accessor performs fresh bus transactions; nothing is cached.
 * Setters for individual fields read-modify-write their register, so the
 * caller must serialize access when several tasks share the transport.
 *
 * Usage:
 *   hal::I2cBus bus(Wire);
 *   bus.begin();
 *   hal::Ina260 ina(bus);           // 0x40
 *   if (ina.begin()) {
 *       auto amps = ina.current();
 *       if (amps) LOG_INFO("I=%.3fA", amps.value());
 *   }
 */
class Ina260 : public ISensor<app::PowerReading> {
public:
    using FloatResult = util::Result<float, app::DeviceError>;
    using WordResult = util::Result<uint16_t, app::DeviceError>;
    using FlagResult = util::Result<bool, app::DeviceError>;
    using VoidResult = util::Result<void, app::DeviceError>;

    explicit Ina260(II2cTransport& transport, uint8_t addr = config::I2C_ADDR_INA260)
        : transport_(transport), addr_(addr) {}

    Ina260(const Ina260&) = delete;
    Ina260& operator=(const Ina260&) = delete;

    // Probe, verify manufacturer and device IDs, apply settings
    bool begin() override { return begin(Ina260Settings{}); }
    bool begin(const Ina260Settings& settings);

    // Current, bus voltage and power in one reading
    util::Result<app::PowerReading, app::DeviceError> read() override;

    const char* getName() const override { return "INA260"; }

    bool isConnected() const override;

    uint8_t getAddress() const { return addr_; }

    // --- Measurements -------------------------------------------------------

    FloatResult current();   // amps, signed
    FloatResult voltage();   // volts
    FloatResult power();     // watts

    // --- Configuration register ---------------------------------------------

    util::Result<ina260::Mode, app::DeviceError> mode();
    VoidResult setMode(ina260::Mode mode);

    util::Result<ina260::AveragingCount, app::DeviceError> averagingCount();
    VoidResult setAveragingCount(ina260::AveragingCount count);

    util::Result<ina260::ConversionTime, app::DeviceError> voltageConversionTime();
    VoidResult setVoltageConversionTime(ina260::ConversionTime time);

    util::Result<ina260::ConversionTime, app::DeviceError> currentConversionTime();
    VoidResult setCurrentConversionTime(ina260::ConversionTime time);

    // Write every configuration field in a single transaction
    VoidResult configure(const Ina260Settings& settings);

    // Reset all registers to power-on defaults. The result is not verified.
    VoidResult reset();

    // Start a one-shot conversion of current and bus voltage
    VoidResult triggerConversion();

    // Conversion Ready flag. Reading it clears it on the device.
    FlagResult conversionReady();

    // Poll Conversion Ready up to maxPolls times; false if it never set
    FlagResult waitForConversion(uint16_t maxPolls = config::WAIT_FOR_CONVERSION_MAX_POLLS);

    // --- Alerts ---------------------------------------------------------------

    FlagResult alertEnabled(ina260::AlertSource source);
    VoidResult setAlertEnabled(ina260::AlertSource source, bool enabled);

    // ALERT pin active-high when true (active-low by default)
    FlagResult alertPolarityInverted();
    VoidResult setAlertPolarityInverted(bool inverted);

    // Latch the ALERT pin and flag until MASK_ENABLE is read
    FlagResult alertLatchEnabled();
    VoidResult setAlertLatchEnabled(bool enabled);

    FlagResult alertFunctionFlag();
    FlagResult mathOverflow();

    WordResult maskEnable();
    VoidResult setMaskEnable(uint16_t word);

    WordResult alertLimitRaw();
    VoidResult setAlertLimitRaw(uint16_t raw);

    FloatResult alertLimitVolts();
    VoidResult setAlertLimitVolts(float volts);
    VoidResult setAlertLimitAmps(float amps);
    VoidResult setAlertLimitWatts(float watts);

    // Write the limit in the source's format, then select only that source
    // among the limit functions (bits 15..11). Conversion-ready alert,
    // polarity and latch bits are kept.
    VoidResult configureAlert(ina260::AlertSource source, float limit);

    // --- Identification -------------------------------------------------------

    WordResult manufacturerId();
    WordResult dieId();
    WordResult deviceId();
    WordResult revisionId();

private:
    FlagResult readFlag(const ReadOnlyField& field);
    FlagResult readFlag(const ReadWriteField& field);

    II2cTransport& transport_;
    uint8_t addr_;
};

} // namespace hal
