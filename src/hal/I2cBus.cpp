#include "hal/I2cBus.hpp"
#include "util/Logger.hpp"

namespace hal {

bool I2cBus::begin(uint32_t frequency) {
    // End previous session (safe even if not begun)
    wire_.end();
    if (!wire_.begin(sda_, scl_, frequency)) {
        LOG_ERROR("I2C begin FAILED (SDA=%d, SCL=%d)", sda_, scl_);
        return false;
    }
    LOG_DEBUG("I2C bus up (SDA=%d, SCL=%d, %u Hz)", sda_, scl_, static_cast<unsigned>(frequency));
    return true;
}

util::Result<void, app::I2cError> I2cBus::read(uint8_t address, uint8_t reg,
                                               uint8_t* buffer, size_t length) {
    // Register pointer write, repeated start
    wire_.beginTransmission(address);
    wire_.write(reg);
    uint8_t status = wire_.endTransmission(false);
    if (status != 0) {
        return util::Result<void, app::I2cError>::Err(errorFromStatus(status));
    }

    size_t received = wire_.requestFrom(address, static_cast<uint8_t>(length));
    if (received != length) {
        // Drain whatever did arrive so the next transaction starts clean
        while (wire_.available()) {
            wire_.read();
        }
        return util::Result<void, app::I2cError>::Err(app::I2cError::ShortRead);
    }

    for (size_t i = 0; i < length; i++) {
        buffer[i] = static_cast<uint8_t>(wire_.read());
    }
    return util::Result<void, app::I2cError>::Ok();
}

util::Result<void, app::I2cError> I2cBus::write(uint8_t address, uint8_t reg,
                                                const uint8_t* data, size_t length) {
    wire_.beginTransmission(address);
    wire_.write(reg);
    wire_.write(data, length);
    uint8_t status = wire_.endTransmission();
    if (status != 0) {
        return util::Result<void, app::I2cError>::Err(errorFromStatus(status));
    }
    return util::Result<void, app::I2cError>::Ok();
}

bool I2cBus::probe(uint8_t address) {
    wire_.beginTransmission(address);
    return wire_.endTransmission() == 0;
}

app::I2cError I2cBus::errorFromStatus(uint8_t status) {
    switch (status) {
        case 1:  return app::I2cError::BusError;  // data too long for transmit buffer
        case 2:  return app::I2cError::Nack;      // NACK on address
        case 3:  return app::I2cError::Nack;      // NACK on data
        case 4:  return app::I2cError::BusError;
        case 5:  return app::I2cError::Timeout;
        default: return app::I2cError::Unknown;
    }
}

} // namespace hal
