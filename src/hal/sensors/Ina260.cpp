#include "hal/sensors/Ina260.hpp"
#include "hal/RegisterIo.hpp"
#include "util/Logger.hpp"

namespace hal {

using namespace ina260;

uint16_t Ina260Settings::configWord() const {
    uint16_t word = CONFIG_RESERVED_BITS;
    word = Field::AVERAGING.insert(word, static_cast<uint16_t>(averaging));
    word = Field::VBUS_CONV_TIME.insert(word, static_cast<uint16_t>(voltageConversionTime));
    word = Field::ISH_CONV_TIME.insert(word, static_cast<uint16_t>(currentConversionTime));
    word = Field::MODE.insert(word, static_cast<uint16_t>(mode));
    return word;
}

bool Ina260::begin(const Ina260Settings& settings) {
    LOG_DEBUG("[INA260][0x%02X] begin()", addr_);
    if (!transport_.probe(addr_)) {
        LOG_ERROR("[INA260][0x%02X] probe FAILED", addr_);
        return false;
    }

    auto mfg = manufacturerId();
    if (mfg.isErr()) {
        LOG_ERROR("[INA260][0x%02X] manufacturer ID read FAILED: %s", addr_, app::toString(mfg.error()));
        return false;
    }
    if (mfg.value() != config::INA260_MANUFACTURER_ID) {
        LOG_ERROR("[INA260][0x%02X] manufacturer ID 0x%04X, expected 0x%04X - check wiring",
                  addr_, mfg.value(), config::INA260_MANUFACTURER_ID);
        return false;
    }

    auto die = dieId();
    if (die.isErr()) {
        LOG_ERROR("[INA260][0x%02X] die ID read FAILED: %s", addr_, app::toString(die.error()));
        return false;
    }
    uint16_t device = Field::DEVICE_ID.extract(die.value());
    if (device != config::INA260_DEVICE_ID) {
        LOG_ERROR("[INA260][0x%02X] device ID 0x%03X, expected 0x%03X - check wiring",
                  addr_, device, config::INA260_DEVICE_ID);
        return false;
    }

    auto configured = configure(settings);
    if (configured.isErr()) {
        LOG_ERROR("[INA260][0x%02X] configure FAILED: %s", addr_, app::toString(configured.error()));
        return false;
    }

    LOG_INFO("[INA260][0x%02X] ready (rev %u, avg %u, %u/%u us)", addr_,
             Field::REVISION_ID.extract(die.value()),
             averagingSamples(settings.averaging),
             conversionTimeMicros(settings.voltageConversionTime),
             conversionTimeMicros(settings.currentConversionTime));
    return true;
}

util::Result<app::PowerReading, app::DeviceError> Ina260::read() {
    using ReadingResult = util::Result<app::PowerReading, app::DeviceError>;

    auto amps = current();
    if (amps.isErr()) return ReadingResult::Err(amps.error());
    auto volts = voltage();
    if (volts.isErr()) return ReadingResult::Err(volts.error());
    auto watts = power();
    if (watts.isErr()) return ReadingResult::Err(watts.error());

    app::PowerReading reading;
    reading.currentAmps = amps.value();
    reading.busVolts = volts.value();
    reading.powerWatts = watts.value();
    reading.valid = true;

    LOG_DEBUG("[INA260][0x%02X] V=%.3fV I=%.4fA P=%.2fW", addr_,
              reading.busVolts, reading.currentAmps, reading.powerWatts);
    return ReadingResult::Ok(reading);
}

bool Ina260::isConnected() const {
    return transport_.probe(addr_);
}

// ============================================================================
// Measurements
// ============================================================================

Ina260::FloatResult Ina260::current() {
    return hal::read(CURRENT, transport_, addr_);
}

Ina260::FloatResult Ina260::voltage() {
    return hal::read(VOLTAGE, transport_, addr_);
}

Ina260::FloatResult Ina260::power() {
    return hal::read(POWER, transport_, addr_);
}

// ============================================================================
// Configuration
// ============================================================================

util::Result<Mode, app::DeviceError> Ina260::mode() {
    return hal::read(Field::MODE, transport_, addr_)
        .map([](uint16_t v) { return static_cast<Mode>(v); });
}

Ina260::VoidResult Ina260::setMode(Mode mode) {
    return hal::write(Field::MODE, transport_, addr_, static_cast<uint16_t>(mode));
}

util::Result<AveragingCount, app::DeviceError> Ina260::averagingCount() {
    return hal::read(Field::AVERAGING, transport_, addr_)
        .map([](uint16_t v) { return static_cast<AveragingCount>(v); });
}

Ina260::VoidResult Ina260::setAveragingCount(AveragingCount count) {
    return hal::write(Field::AVERAGING, transport_, addr_, static_cast<uint16_t>(count));
}

util::Result<ConversionTime, app::DeviceError> Ina260::voltageConversionTime() {
    return hal::read(Field::VBUS_CONV_TIME, transport_, addr_)
        .map([](uint16_t v) { return static_cast<ConversionTime>(v); });
}

Ina260::VoidResult Ina260::setVoltageConversionTime(ConversionTime time) {
    return hal::write(Field::VBUS_CONV_TIME, transport_, addr_, static_cast<uint16_t>(time));
}

util::Result<ConversionTime, app::DeviceError> Ina260::currentConversionTime() {
    return hal::read(Field::ISH_CONV_TIME, transport_, addr_)
        .map([](uint16_t v) { return static_cast<ConversionTime>(v); });
}

Ina260::VoidResult Ina260::setCurrentConversionTime(ConversionTime time) {
    return hal::write(Field::ISH_CONV_TIME, transport_, addr_, static_cast<uint16_t>(time));
}

Ina260::VoidResult Ina260::configure(const Ina260Settings& settings) {
    return writeWord(transport_, addr_, Reg::CONFIG, settings.configWord());
}

Ina260::VoidResult Ina260::reset() {
    LOG_DEBUG("[INA260][0x%02X] reset", addr_);
    return writeWord(transport_, addr_, Reg::CONFIG, CONFIG_RESET);
}

Ina260::VoidResult Ina260::triggerConversion() {
    return setMode(Mode::Triggered);
}

Ina260::FlagResult Ina260::conversionReady() {
    return readFlag(Field::CONVERSION_READY_FLAG);
}

Ina260::FlagResult Ina260::waitForConversion(uint16_t maxPolls) {
    for (uint16_t poll = 0; poll < maxPolls; poll++) {
        auto ready = conversionReady();
        if (ready.isErr() || ready.value()) {
            return ready;
        }
    }
    LOG_WARN("[INA260][0x%02X] no conversion after %u polls", addr_, static_cast<unsigned>(maxPolls));
    return FlagResult::Ok(false);
}

// ============================================================================
// Alerts
// ============================================================================

Ina260::FlagResult Ina260::alertEnabled(AlertSource source) {
    return readFlag(alertField(source));
}

Ina260::VoidResult Ina260::setAlertEnabled(AlertSource source, bool enabled) {
    return hal::write(alertField(source), transport_, addr_, enabled ? 1 : 0);
}

Ina260::FlagResult Ina260::alertPolarityInverted() {
    return readFlag(Field::ALERT_POLARITY);
}

Ina260::VoidResult Ina260::setAlertPolarityInverted(bool inverted) {
    return hal::write(Field::ALERT_POLARITY, transport_, addr_, inverted ? 1 : 0);
}

Ina260::FlagResult Ina260::alertLatchEnabled() {
    return readFlag(Field::ALERT_LATCH);
}

Ina260::VoidResult Ina260::setAlertLatchEnabled(bool enabled) {
    return hal::write(Field::ALERT_LATCH, transport_, addr_, enabled ? 1 : 0);
}

Ina260::FlagResult Ina260::alertFunctionFlag() {
    return readFlag(Field::ALERT_FUNCTION_FLAG);
}

Ina260::FlagResult Ina260::mathOverflow() {
    return readFlag(Field::MATH_OVERFLOW_FLAG);
}

Ina260::WordResult Ina260::maskEnable() {
    return hal::read(Field::MASK_ENABLE, transport_, addr_);
}

Ina260::VoidResult Ina260::setMaskEnable(uint16_t word) {
    return hal::write(Field::MASK_ENABLE, transport_, addr_, word);
}

Ina260::WordResult Ina260::alertLimitRaw() {
    return hal::read(Field::ALERT_LIMIT_WORD, transport_, addr_);
}

Ina260::VoidResult Ina260::setAlertLimitRaw(uint16_t raw) {
    return hal::write(Field::ALERT_LIMIT_WORD, transport_, addr_, raw);
}

Ina260::FloatResult Ina260::alertLimitVolts() {
    return hal::read(ALERT_LIMIT_VOLTAGE, transport_, addr_);
}

Ina260::VoidResult Ina260::setAlertLimitVolts(float volts) {
    return hal::write(ALERT_LIMIT_VOLTAGE, transport_, addr_, volts);
}

Ina260::VoidResult Ina260::setAlertLimitAmps(float amps) {
    return hal::write(ALERT_LIMIT_CURRENT, transport_, addr_, amps);
}

Ina260::VoidResult Ina260::setAlertLimitWatts(float watts) {
    return hal::write(ALERT_LIMIT_POWER, transport_, addr_, watts);
}

Ina260::VoidResult Ina260::configureAlert(AlertSource source, float limit) {
    if (source == AlertSource::ConversionReady) {
        return setAlertEnabled(source, true);
    }

    const ReadWriteRegister& format = alertLimitFormat(source);
    auto raw = format.toRaw(limit);
    if (raw.isErr()) {
        LOG_WARN("[INA260][0x%02X] alert limit %.4f out of range", addr_, static_cast<double>(limit));
        return VoidResult::Err(raw.error());
    }

    auto written = writeWord(transport_, addr_, format.address, format.encode(raw.value()));
    if (written.isErr()) {
        return written;
    }

    // One-hot selection among the limit functions
    uint16_t functions = static_cast<uint16_t>(1u << (alertField(source).shift - Field::ALERT_FUNCTIONS.shift));
    return hal::write(Field::ALERT_FUNCTIONS, transport_, addr_, functions);
}

// ============================================================================
// Identification
// ============================================================================

Ina260::WordResult Ina260::manufacturerId() {
    return hal::read(Field::MANUFACTURER_ID, transport_, addr_);
}

Ina260::WordResult Ina260::dieId() {
    return hal::read(Field::DIE_ID, transport_, addr_);
}

Ina260::WordResult Ina260::deviceId() {
    return hal::read(Field::DEVICE_ID, transport_, addr_);
}

Ina260::WordResult Ina260::revisionId() {
    return hal::read(Field::REVISION_ID, transport_, addr_);
}

// ============================================================================
// Helpers
// ============================================================================

Ina260::FlagResult Ina260::readFlag(const ReadOnlyField& field) {
    return hal::read(field, transport_, addr_).map([](uint16_t v) { return v != 0; });
}

Ina260::FlagResult Ina260::readFlag(const ReadWriteField& field) {
    return hal::read(field, transport_, addr_).map([](uint16_t v) { return v != 0; });
}

} // namespace hal
