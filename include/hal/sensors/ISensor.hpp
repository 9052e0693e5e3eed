#pragma once
#include "util/Result.hpp"
#include "app/Types.hpp"
#include <cstdint>

namespace hal {

// Base sensor interface
template<typename TReading>
class ISensor {
public:
    virtual ~ISensor() = default;

    // Verify the device and apply its default configuration
    virtual bool begin() = 0;

    // Take one reading
    virtual util::Result<TReading, app::DeviceError> read() = 0;

    // Get sensor name/type
    virtual const char* getName() const = 0;

    // Check if sensor is responsive
    virtual bool isConnected() const = 0;
};

} // namespace hal
