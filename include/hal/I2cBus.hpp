#pragma once
#include <Wire.h>
#include "hal/II2cTransport.hpp"
#include "Config.hpp"

namespace hal {

// II2cTransport over an Arduino TwoWire instance
class I2cBus : public II2cTransport {
public:
    explicit I2cBus(TwoWire& wire = Wire,
                    int sda = config::PIN_I2C_SDA,
                    int scl = config::PIN_I2C_SCL)
        : wire_(wire), sda_(sda), scl_(scl) {}

    bool begin(uint32_t frequency = config::I2C_FREQ_HZ);

    util::Result<void, app::I2cError> read(uint8_t address, uint8_t reg,
                                           uint8_t* buffer, size_t length) override;

    util::Result<void, app::I2cError> write(uint8_t address, uint8_t reg,
                                            const uint8_t* data, size_t length) override;

    bool probe(uint8_t address) override;

    // Map a TwoWire::endTransmission() status code to an I2cError
    static app::I2cError errorFromStatus(uint8_t status);

private:
    TwoWire& wire_;
    int sda_;
    int scl_;
};

} // namespace hal
