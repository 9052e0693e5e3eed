#pragma once
#include "hal/II2cTransport.hpp"
#include "hal/Register.hpp"

namespace hal {

// Register transactions. Words are big-endian on the wire. Every function
// issues exactly one transport transaction, except a write to a partial
// bit field, which reads the register first (one read, one write).
// Range errors are raised before any transaction.

util::Result<uint16_t, app::DeviceError> readWord(II2cTransport& transport, uint8_t busAddress,
                                                  uint8_t reg, size_t byteCount = 2);

util::Result<void, app::DeviceError> writeWord(II2cTransport& transport, uint8_t busAddress,
                                               uint8_t reg, uint16_t word, size_t byteCount = 2);

template<Access A>
util::Result<float, app::DeviceError> read(const ScaledRegister<A>& reg,
                                           II2cTransport& transport, uint8_t busAddress) {
    return readWord(transport, busAddress, reg.address, reg.byteCount())
        .map([&reg](uint16_t word) { return reg.toPhysical(reg.decode(word)); });
}

util::Result<void, app::DeviceError> write(const ReadWriteRegister& reg,
                                           II2cTransport& transport, uint8_t busAddress, float value);

template<Access A>
util::Result<uint16_t, app::DeviceError> read(const BitField<A>& field,
                                              II2cTransport& transport, uint8_t busAddress) {
    return readWord(transport, busAddress, field.address)
        .map([&field](uint16_t word) { return field.extract(word); });
}

util::Result<void, app::DeviceError> write(const ReadWriteField& field,
                                           II2cTransport& transport, uint8_t busAddress, uint16_t value);

} // namespace hal
