#include "hal/RegisterIo.hpp"
#include "util/Logger.hpp"

namespace hal {

namespace {

constexpr size_t kMaxRegisterBytes = 2;

app::DeviceError fromTransport(const app::I2cError& error) {
    return app::DeviceError::fromTransport(error);
}

} // namespace

util::Result<uint16_t, app::DeviceError> readWord(II2cTransport& transport, uint8_t busAddress,
                                                  uint8_t reg, size_t byteCount) {
    if (byteCount == 0 || byteCount > kMaxRegisterBytes) {
        return util::Result<uint16_t, app::DeviceError>::Err(app::DeviceError::outOfRange());
    }

    uint8_t buffer[kMaxRegisterBytes] = {0, 0};
    auto result = transport.read(busAddress, reg, buffer, byteCount);
    if (result.isErr()) {
        LOG_DEBUG("[0x%02X] read reg 0x%02X failed: %s", busAddress, reg, app::toString(result.error()));
        return util::Result<uint16_t, app::DeviceError>::Err(fromTransport(result.error()));
    }

    uint16_t word = 0;
    for (size_t i = 0; i < byteCount; i++) {
        word = static_cast<uint16_t>((word << 8) | buffer[i]);
    }
    return util::Result<uint16_t, app::DeviceError>::Ok(word);
}

util::Result<void, app::DeviceError> writeWord(II2cTransport& transport, uint8_t busAddress,
                                               uint8_t reg, uint16_t word, size_t byteCount) {
    if (byteCount == 0 || byteCount > kMaxRegisterBytes) {
        return util::Result<void, app::DeviceError>::Err(app::DeviceError::outOfRange());
    }
    if (byteCount == 1 && word > 0xFF) {
        return util::Result<void, app::DeviceError>::Err(app::DeviceError::outOfRange());
    }

    uint8_t buffer[kMaxRegisterBytes];
    for (size_t i = 0; i < byteCount; i++) {
        buffer[i] = static_cast<uint8_t>(word >> (8 * (byteCount - 1 - i)));
    }

    return transport.write(busAddress, reg, buffer, byteCount).mapErr(fromTransport);
}

util::Result<void, app::DeviceError> write(const ReadWriteRegister& reg,
                                           II2cTransport& transport, uint8_t busAddress, float value) {
    auto raw = reg.toRaw(value);
    if (raw.isErr()) {
        LOG_WARN("[0x%02X] reg 0x%02X: %.5f not representable", busAddress, reg.address,
                 static_cast<double>(value));
        return util::Result<void, app::DeviceError>::Err(raw.error());
    }
    return writeWord(transport, busAddress, reg.address, reg.encode(raw.value()), reg.byteCount());
}

util::Result<void, app::DeviceError> write(const ReadWriteField& field,
                                           II2cTransport& transport, uint8_t busAddress, uint16_t value) {
    if (!field.fits(value)) {
        LOG_WARN("[0x%02X] reg 0x%02X: field value %u exceeds %u", busAddress, field.address,
                 static_cast<unsigned>(value), static_cast<unsigned>(field.maxValue()));
        return util::Result<void, app::DeviceError>::Err(app::DeviceError::outOfRange());
    }

    if (field.coversWord()) {
        return writeWord(transport, busAddress, field.address, value);
    }

    // Read-modify-write: keep bits this field does not own
    auto current = readWord(transport, busAddress, field.address);
    if (current.isErr()) {
        return util::Result<void, app::DeviceError>::Err(current.error());
    }

    uint16_t updated = field.insert(current.value(), value);
    LOG_DEBUG("[0x%02X] reg 0x%02X: 0x%04X -> 0x%04X", busAddress, field.address,
              static_cast<unsigned>(current.value()), static_cast<unsigned>(updated));
    return writeWord(transport, busAddress, field.address, updated);
}

} // namespace hal
