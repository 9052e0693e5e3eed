#pragma once
#include <cstdint>
#include <cmath>

namespace app {

// ============================================================================
// Error Types
// ============================================================================

// Bus-level failure reported by a transport
enum class I2cError {
    Nack,
    Timeout,
    ArbitrationLost,
    BusError,
    ShortRead,
    Unknown
};

// Error returned by register and device accessors.
// Transport errors keep the code the transport reported.
struct DeviceError {
    enum class Kind {
        Transport,
        Range
    };

    Kind kind = Kind::Transport;
    I2cError transport = I2cError::Unknown;

    static DeviceError fromTransport(I2cError error) {
        return DeviceError{Kind::Transport, error};
    }

    static DeviceError outOfRange() {
        return DeviceError{Kind::Range, I2cError::Unknown};
    }

    bool isTransport() const { return kind == Kind::Transport; }
    bool isRange() const { return kind == Kind::Range; }

    bool operator==(const DeviceError& other) const {
        return kind == other.kind && (kind == Kind::Range || transport == other.transport);
    }
    bool operator!=(const DeviceError& other) const { return !(*this == other); }
};

inline const char* toString(I2cError error) {
    switch (error) {
        case I2cError::Nack:            return "NACK";
        case I2cError::Timeout:         return "timeout";
        case I2cError::ArbitrationLost: return "arbitration lost";
        case I2cError::BusError:        return "bus error";
        case I2cError::ShortRead:       return "short read";
        default:                        return "unknown";
    }
}

inline const char* toString(const DeviceError& error) {
    return error.isRange() ? "value out of range" : toString(error.transport);
}

// ============================================================================
// Hardware Reading Types
// ============================================================================

struct PowerReading {
    float busVolts = NAN;
    float currentAmps = NAN;
    float powerWatts = NAN;
    bool valid = false;
};

} // namespace app
