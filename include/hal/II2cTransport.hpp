#pragma once
#include "util/Result.hpp"
#include "app/Types.hpp"
#include <cstddef>
#include <cstdint>

namespace hal {

// Register-oriented I2C transport.
// Implementations perform one bus transaction per call and report
// failures as app::I2cError; retries and timeouts are theirs to define.
class II2cTransport {
public:
    virtual ~II2cTransport() = default;

    // Read `length` bytes starting at register `reg` of device `address`
    virtual util::Result<void, app::I2cError> read(uint8_t address, uint8_t reg,
                                                   uint8_t* buffer, size_t length) = 0;

    // Write `length` bytes to register `reg` of device `address`
    virtual util::Result<void, app::I2cError> write(uint8_t address, uint8_t reg,
                                                    const uint8_t* data, size_t length) = 0;

    // Check if a device acknowledges `address`
    virtual bool probe(uint8_t address) = 0;
};

} // namespace hal
