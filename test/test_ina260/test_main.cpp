/**
 * Unit tests for the INA260 device driver
 *
 * Covers measurements, configuration fields, reset, alerts,
 * identification and begin() against a recording mock transport.
 */

#include <unity.h>
#include <string>
#include <vector>
#include "hal/sensors/Ina260.hpp"
#include "util/Logger.hpp"
#include "MockTransport.hpp"

using namespace hal;
using namespace hal::ina260;

static MockTransport* bus;
static Ina260* ina;
static std::vector<std::string> logLines;

static void loadPowerOnDefaults(MockTransport& t) {
    t.registers[Reg::CONFIG] = CONFIG_DEFAULT;
    t.registers[Reg::MFG_ID] = 0x5449;
    t.registers[Reg::DIE_ID] = 0x2270;
}

void setUp() {
    bus = new MockTransport(0x40);
    loadPowerOnDefaults(*bus);
    ina = new Ina260(*bus);

    logLines.clear();
    Logger::setLogLevel(LogLevel::DEBUG);
    Logger::setSink([](LogLevel level, const char* line) {
        if (level >= LogLevel::WARN) logLines.push_back(line);
    });
}

void tearDown() {
    Logger::setSink(nullptr);
    delete ina;
    delete bus;
    ina = nullptr;
    bus = nullptr;
}

static bool loggedContaining(const char* text) {
    for (const auto& line : logLines) {
        if (line.find(text) != std::string::npos) return true;
    }
    return false;
}

// ============================================================================
// Measurements
// ============================================================================

void test_voltage_fixture() {
    // 0x0C1C = 3100 counts * 1.25 mV
    bus->registers[Reg::BUS_VOLTAGE] = 0x0C1C;
    auto volts = ina->voltage();
    TEST_ASSERT_TRUE(volts.isOk());
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 3.875f, volts.value());
    TEST_ASSERT_EQUAL(1, bus->transactions.size());
    TEST_ASSERT_EQUAL_HEX8(Reg::BUS_VOLTAGE, bus->transactions[0].reg);
}

void test_current_is_signed_amps() {
    bus->registers[Reg::CURRENT] = 0xFC18;  // -1000 counts
    auto amps = ina->current();
    TEST_ASSERT_TRUE(amps.isOk());
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, -1.25f, amps.value());

    bus->registers[Reg::CURRENT] = 0x0320;  // 800 counts
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f, ina->current().value());
}

void test_power_is_watts() {
    bus->registers[Reg::POWER] = 0x0064;  // 100 counts * 10 mW
    auto watts = ina->power();
    TEST_ASSERT_TRUE(watts.isOk());
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f, watts.value());
}

void test_measurements_are_not_cached() {
    bus->registers[Reg::BUS_VOLTAGE] = 0x0C1C;
    ina->voltage();
    bus->registers[Reg::BUS_VOLTAGE] = 0x1900;  // 6400 counts
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 8.0f, ina->voltage().value());
    TEST_ASSERT_EQUAL(2, bus->reads());
}

void test_read_combines_measurements() {
    bus->registers[Reg::CURRENT] = 0x0320;
    bus->registers[Reg::BUS_VOLTAGE] = 0x2580;  // 12 V
    bus->registers[Reg::POWER] = 0x04B0;        // 12 W
    auto reading = ina->read();
    TEST_ASSERT_TRUE(reading.isOk());
    TEST_ASSERT_TRUE(reading.value().valid);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f, reading.value().currentAmps);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 12.0f, reading.value().busVolts);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 12.0f, reading.value().powerWatts);
    TEST_ASSERT_EQUAL(3, bus->reads());
}

void test_read_stops_on_first_error() {
    bus->readError = app::I2cError::Nack;
    auto reading = ina->read();
    TEST_ASSERT_TRUE(reading.isErr());
    TEST_ASSERT_TRUE(reading.error().transport == app::I2cError::Nack);
    TEST_ASSERT_EQUAL(1, bus->transactions.size());
}

void test_measurement_transport_error_propagates() {
    bus->readError = app::I2cError::Timeout;
    auto amps = ina->current();
    TEST_ASSERT_TRUE(amps.isErr());
    TEST_ASSERT_TRUE(amps.error().isTransport());
    TEST_ASSERT_TRUE(amps.error().transport == app::I2cError::Timeout);
}

// ============================================================================
// Configuration
// ============================================================================

void test_mode_decodes_field() {
    bus->registers[Reg::CONFIG] = 0x6123;
    auto mode = ina->mode();
    TEST_ASSERT_TRUE(mode.isOk());
    TEST_ASSERT_TRUE(mode.value() == Mode::Triggered);
}

void test_set_averaging_count_preserves_other_bits() {
    TEST_ASSERT_TRUE(ina->setAveragingCount(AveragingCount::Count64).isOk());
    TEST_ASSERT_EQUAL(1, bus->reads());
    TEST_ASSERT_EQUAL(1, bus->writes());
    TEST_ASSERT_TRUE(bus->transactions[0].op == MockTransport::Op::Read);
    TEST_ASSERT_EQUAL_HEX16(0x6727, bus->registers[Reg::CONFIG]);
    TEST_ASSERT_TRUE(ina->averagingCount().value() == AveragingCount::Count64);
}

void test_set_conversion_times() {
    TEST_ASSERT_TRUE(ina->setVoltageConversionTime(ConversionTime::Us8244).isOk());
    TEST_ASSERT_EQUAL_HEX16(0x61E7, bus->registers[Reg::CONFIG]);
    TEST_ASSERT_TRUE(ina->setCurrentConversionTime(ConversionTime::Us140).isOk());
    TEST_ASSERT_EQUAL_HEX16(0x61C7, bus->registers[Reg::CONFIG]);

    TEST_ASSERT_TRUE(ina->voltageConversionTime().value() == ConversionTime::Us8244);
    TEST_ASSERT_TRUE(ina->currentConversionTime().value() == ConversionTime::Us140);
}

void test_set_mode_preserves_other_bits() {
    TEST_ASSERT_TRUE(ina->setMode(Mode::Shutdown).isOk());
    TEST_ASSERT_EQUAL_HEX16(0x6120, bus->registers[Reg::CONFIG]);
}

void test_field_write_failure_leaves_register_unchanged() {
    bus->writeError = app::I2cError::Nack;
    auto result = ina->setMode(Mode::Triggered);
    TEST_ASSERT_TRUE(result.isErr());
    TEST_ASSERT_TRUE(result.error().transport == app::I2cError::Nack);
    TEST_ASSERT_EQUAL(1, bus->reads());
    TEST_ASSERT_EQUAL(1, bus->writes());
    TEST_ASSERT_EQUAL_HEX16(CONFIG_DEFAULT, bus->registers[Reg::CONFIG]);
}

void test_reset_writes_only_reset_bit() {
    TEST_ASSERT_TRUE(ina->reset().isOk());
    TEST_ASSERT_EQUAL(1, bus->transactions.size());
    TEST_ASSERT_EQUAL(0, bus->reads());
    TEST_ASSERT_EQUAL_HEX8(Reg::CONFIG, bus->transactions[0].reg);
    TEST_ASSERT_EQUAL_HEX8(0x80, bus->transactions[0].data[0]);
    TEST_ASSERT_EQUAL_HEX8(0x00, bus->transactions[0].data[1]);
}

void test_configure_writes_whole_word_once() {
    Ina260Settings settings;
    TEST_ASSERT_EQUAL_HEX16(CONFIG_DEFAULT, settings.configWord());

    settings.mode = Mode::Triggered;
    settings.averaging = AveragingCount::Count1024;
    settings.voltageConversionTime = ConversionTime::Us140;
    settings.currentConversionTime = ConversionTime::Us8244;
    TEST_ASSERT_TRUE(ina->configure(settings).isOk());

    TEST_ASSERT_EQUAL(1, bus->transactions.size());
    TEST_ASSERT_EQUAL_HEX16(0x6E3B, bus->registers[Reg::CONFIG]);
}

void test_trigger_conversion_sets_triggered_mode() {
    TEST_ASSERT_TRUE(ina->triggerConversion().isOk());
    TEST_ASSERT_EQUAL_HEX16(0x6123, bus->registers[Reg::CONFIG]);
    TEST_ASSERT_TRUE(isTriggered(ina->mode().value()));
}

void test_wait_for_conversion_polls_until_ready() {
    bus->readQueue[Reg::MASK_ENABLE] = {0x0000, 0x0000, 0x0008};
    auto ready = ina->waitForConversion(10);
    TEST_ASSERT_TRUE(ready.isOk());
    TEST_ASSERT_TRUE(ready.value());
    TEST_ASSERT_EQUAL(3, bus->reads());
}

void test_wait_for_conversion_gives_up() {
    auto ready = ina->waitForConversion(5);
    TEST_ASSERT_TRUE(ready.isOk());
    TEST_ASSERT_FALSE(ready.value());
    TEST_ASSERT_EQUAL(5, bus->reads());
    TEST_ASSERT_TRUE(loggedContaining("no conversion"));
}

void test_enum_helpers() {
    TEST_ASSERT_EQUAL_UINT16(1, averagingSamples(AveragingCount::Count1));
    TEST_ASSERT_EQUAL_UINT16(1024, averagingSamples(AveragingCount::Count1024));
    TEST_ASSERT_EQUAL_UINT16(140, conversionTimeMicros(ConversionTime::Us140));
    TEST_ASSERT_EQUAL_UINT16(1100, conversionTimeMicros(ConversionTime::Us1100));
    TEST_ASSERT_EQUAL_UINT16(8244, conversionTimeMicros(ConversionTime::Us8244));
}

// ============================================================================
// Alerts
// ============================================================================

void test_alert_flags_decode() {
    bus->registers[Reg::MASK_ENABLE] = 0x001C;
    TEST_ASSERT_TRUE(ina->alertFunctionFlag().value());
    TEST_ASSERT_TRUE(ina->conversionReady().value());
    TEST_ASSERT_TRUE(ina->mathOverflow().value());
    TEST_ASSERT_FALSE(ina->alertPolarityInverted().value());
    TEST_ASSERT_FALSE(ina->alertLatchEnabled().value());
}

void test_set_alert_enabled_preserves_other_bits() {
    bus->registers[Reg::MASK_ENABLE] = 0x0403;
    TEST_ASSERT_TRUE(ina->setAlertEnabled(AlertSource::UnderCurrent, true).isOk());
    TEST_ASSERT_EQUAL_HEX16(0x4403, bus->registers[Reg::MASK_ENABLE]);
    TEST_ASSERT_TRUE(ina->alertEnabled(AlertSource::UnderCurrent).value());
    TEST_ASSERT_FALSE(ina->alertEnabled(AlertSource::OverCurrent).value());

    TEST_ASSERT_TRUE(ina->setAlertLatchEnabled(false).isOk());
    TEST_ASSERT_EQUAL_HEX16(0x4402, bus->registers[Reg::MASK_ENABLE]);
    TEST_ASSERT_TRUE(ina->setAlertPolarityInverted(false).isOk());
    TEST_ASSERT_EQUAL_HEX16(0x4400, bus->registers[Reg::MASK_ENABLE]);
}

void test_mask_enable_word_access() {
    TEST_ASSERT_TRUE(ina->setMaskEnable(0x8001).isOk());
    TEST_ASSERT_EQUAL(0, bus->reads());
    TEST_ASSERT_EQUAL_HEX16(0x8001, ina->maskEnable().value());
}

void test_alert_limit_volts() {
    TEST_ASSERT_TRUE(ina->setAlertLimitVolts(12.0f).isOk());
    TEST_ASSERT_EQUAL_HEX16(0x2580, bus->registers[Reg::ALERT_LIMIT]);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 12.0f, ina->alertLimitVolts().value());
    TEST_ASSERT_EQUAL_HEX16(0x2580, ina->alertLimitRaw().value());
}

void test_alert_limit_volts_out_of_range() {
    auto result = ina->setAlertLimitVolts(41.0f);
    TEST_ASSERT_TRUE(result.isErr());
    TEST_ASSERT_TRUE(result.error().isRange());
    TEST_ASSERT_EQUAL(0, bus->transactions.size());
}

void test_alert_limit_amps_and_watts() {
    TEST_ASSERT_TRUE(ina->setAlertLimitAmps(-1.25f).isOk());
    TEST_ASSERT_EQUAL_HEX16(0xFC18, bus->registers[Reg::ALERT_LIMIT]);
    TEST_ASSERT_TRUE(ina->setAlertLimitWatts(5.0f).isOk());
    TEST_ASSERT_EQUAL_HEX16(0x01F4, bus->registers[Reg::ALERT_LIMIT]);
    TEST_ASSERT_TRUE(ina->setAlertLimitRaw(0x1234).isOk());
    TEST_ASSERT_EQUAL_HEX16(0x1234, bus->registers[Reg::ALERT_LIMIT]);
}

void test_configure_alert_selects_one_source() {
    // Bus over-voltage selected, conversion-ready alert, polarity and latch set
    bus->registers[Reg::MASK_ENABLE] = 0x2403;
    TEST_ASSERT_TRUE(ina->configureAlert(AlertSource::OverCurrent, 2.5f).isOk());

    TEST_ASSERT_EQUAL_HEX16(0x07D0, bus->registers[Reg::ALERT_LIMIT]);
    TEST_ASSERT_EQUAL_HEX16(0x8403, bus->registers[Reg::MASK_ENABLE]);
    TEST_ASSERT_EQUAL(3, bus->transactions.size());
    TEST_ASSERT_EQUAL_HEX8(Reg::ALERT_LIMIT, bus->transactions[0].reg);
}

void test_configure_alert_power_format() {
    TEST_ASSERT_TRUE(ina->configureAlert(AlertSource::PowerOverLimit, 100.0f).isOk());
    TEST_ASSERT_EQUAL_HEX16(0x2710, bus->registers[Reg::ALERT_LIMIT]);
    TEST_ASSERT_EQUAL_HEX16(0x0800, bus->registers[Reg::MASK_ENABLE]);
}

void test_configure_alert_out_of_range_has_no_side_effects() {
    auto result = ina->configureAlert(AlertSource::BusUnderVoltage, 45.0f);
    TEST_ASSERT_TRUE(result.isErr());
    TEST_ASSERT_TRUE(result.error().isRange());
    TEST_ASSERT_EQUAL(0, bus->transactions.size());
}

void test_configure_alert_conversion_ready_ignores_limit() {
    // Over-current function bit, polarity and latch already set
    bus->registers[Reg::MASK_ENABLE] = 0x2003;
    TEST_ASSERT_TRUE(ina->configureAlert(AlertSource::ConversionReady, 1e9f).isOk());

    TEST_ASSERT_EQUAL(1, bus->reads());
    TEST_ASSERT_EQUAL(1, bus->writes());
    for (const auto& t : bus->transactions) {
        TEST_ASSERT_NOT_EQUAL(Reg::ALERT_LIMIT, t.reg);
    }
    TEST_ASSERT_EQUAL_HEX16(0x2403, bus->registers[Reg::MASK_ENABLE]);
}

// ============================================================================
// Identification
// ============================================================================

void test_identification() {
    TEST_ASSERT_EQUAL_HEX16(0x5449, ina->manufacturerId().value());
    TEST_ASSERT_EQUAL_HEX16(0x2270, ina->dieId().value());
    TEST_ASSERT_EQUAL_HEX16(0x227, ina->deviceId().value());
    TEST_ASSERT_EQUAL_HEX16(0x0, ina->revisionId().value());
}

// ============================================================================
// Lifecycle
// ============================================================================

void test_begin_verifies_and_configures() {
    bus->registers[Reg::CONFIG] = 0x0000;
    TEST_ASSERT_TRUE(ina->begin());
    TEST_ASSERT_EQUAL_HEX16(CONFIG_DEFAULT, bus->registers[Reg::CONFIG]);
    TEST_ASSERT_EQUAL(1, bus->probes);
    TEST_ASSERT_TRUE(logLines.empty());
}

void test_begin_applies_settings() {
    Ina260Settings settings;
    settings.averaging = AveragingCount::Count16;
    TEST_ASSERT_TRUE(ina->begin(settings));
    TEST_ASSERT_EQUAL_HEX16(settings.configWord(), bus->registers[Reg::CONFIG]);
    TEST_ASSERT_EQUAL_HEX16(0x6527, bus->lastWritten());
}

void test_begin_rejects_wrong_manufacturer() {
    bus->registers[Reg::MFG_ID] = 0x1234;
    TEST_ASSERT_FALSE(ina->begin());
    TEST_ASSERT_TRUE(loggedContaining("manufacturer ID 0x1234"));
    TEST_ASSERT_EQUAL(0, bus->writes());
}

void test_begin_rejects_wrong_device() {
    bus->registers[Reg::DIE_ID] = 0x2260;  // INA226-style die ID
    TEST_ASSERT_FALSE(ina->begin());
    TEST_ASSERT_TRUE(loggedContaining("device ID"));
    TEST_ASSERT_EQUAL(0, bus->writes());
}

void test_begin_fails_when_absent() {
    bus->present = false;
    TEST_ASSERT_FALSE(ina->begin());
    TEST_ASSERT_FALSE(ina->isConnected());
    TEST_ASSERT_EQUAL(0, bus->transactions.size());
    TEST_ASSERT_TRUE(loggedContaining("probe FAILED"));
}

void test_custom_address() {
    MockTransport other(0x45);
    loadPowerOnDefaults(other);
    Ina260 device(other, 0x45);
    TEST_ASSERT_EQUAL_HEX8(0x45, device.getAddress());
    TEST_ASSERT_TRUE(device.begin());
    TEST_ASSERT_EQUAL_HEX8(0x45, other.transactions[0].address);
}

void test_sensor_interface() {
    bus->registers[Reg::BUS_VOLTAGE] = 0x0C1C;
    ISensor<app::PowerReading>& sensor = *ina;
    TEST_ASSERT_EQUAL_STRING("INA260", sensor.getName());
    TEST_ASSERT_TRUE(sensor.isConnected());
    auto reading = sensor.read();
    TEST_ASSERT_TRUE(reading.isOk());
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 3.875f, reading.value().busVolts);
}

// ============================================================================
// Test Runner
// ============================================================================

int main(int argc, char** argv) {
    UNITY_BEGIN();

    // Measurements
    RUN_TEST(test_voltage_fixture);
    RUN_TEST(test_current_is_signed_amps);
    RUN_TEST(test_power_is_watts);
    RUN_TEST(test_measurements_are_not_cached);
    RUN_TEST(test_read_combines_measurements);
    RUN_TEST(test_read_stops_on_first_error);
    RUN_TEST(test_measurement_transport_error_propagates);

    // Configuration
    RUN_TEST(test_mode_decodes_field);
    RUN_TEST(test_set_averaging_count_preserves_other_bits);
    RUN_TEST(test_set_conversion_times);
    RUN_TEST(test_set_mode_preserves_other_bits);
    RUN_TEST(test_field_write_failure_leaves_register_unchanged);
    RUN_TEST(test_reset_writes_only_reset_bit);
    RUN_TEST(test_configure_writes_whole_word_once);
    RUN_TEST(test_trigger_conversion_sets_triggered_mode);
    RUN_TEST(test_wait_for_conversion_polls_until_ready);
    RUN_TEST(test_wait_for_conversion_gives_up);
    RUN_TEST(test_enum_helpers);

    // Alerts
    RUN_TEST(test_alert_flags_decode);
    RUN_TEST(test_set_alert_enabled_preserves_other_bits);
    RUN_TEST(test_mask_enable_word_access);
    RUN_TEST(test_alert_limit_volts);
    RUN_TEST(test_alert_limit_volts_out_of_range);
    RUN_TEST(test_alert_limit_amps_and_watts);
    RUN_TEST(test_configure_alert_selects_one_source);
    RUN_TEST(test_configure_alert_power_format);
    RUN_TEST(test_configure_alert_out_of_range_has_no_side_effects);
    RUN_TEST(test_configure_alert_conversion_ready_ignores_limit);

    // Identification
    RUN_TEST(test_identification);

    // Lifecycle
    RUN_TEST(test_begin_verifies_and_configures);
    RUN_TEST(test_begin_applies_settings);
    RUN_TEST(test_begin_rejects_wrong_manufacturer);
    RUN_TEST(test_begin_rejects_wrong_device);
    RUN_TEST(test_begin_fails_when_absent);
    RUN_TEST(test_custom_address);
    RUN_TEST(test_sensor_interface);

    return UNITY_END();
}
