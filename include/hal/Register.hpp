#pragma once
#include "util/Result.hpp"
#include "app/Types.hpp"
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace hal {

enum class Access : uint8_t {
    ReadOnly,
    ReadWrite
};

enum class Encoding : uint8_t {
    Unsigned,
    TwosComplement
};

/**
 * @brief Numeric register with a fixed scale to physical units
 *
 * physical = raw * lsb, where raw is the register word decoded as unsigned
 * or two's complement over `widthBits` (8 or 16). The inverse rounds to the
 * nearest count and must land inside [rawMin, rawMax].
 *
 * Access is part of the type: only ScaledRegister<Access::ReadWrite> can be
 * passed to hal::write().
 */
template<Access A>
struct ScaledRegister {
    static constexpr Access access = A;

    uint8_t address;
    uint8_t widthBits;
    Encoding encoding;
    float lsb;          // physical units per raw count
    int32_t rawMin;
    int32_t rawMax;

    constexpr size_t byteCount() const { return widthBits / 8; }

    constexpr uint16_t wordMask() const {
        return static_cast<uint16_t>((1u << widthBits) - 1u);
    }

    // Register word -> raw count (sign-extended for two's complement)
    constexpr int32_t decode(uint16_t word) const {
        uint32_t bits = word & wordMask();
        if (encoding == Encoding::TwosComplement) {
            uint32_t sign = 1u << (widthBits - 1);
            return static_cast<int32_t>(bits ^ sign) - static_cast<int32_t>(sign);
        }
        return static_cast<int32_t>(bits);
    }

    // Raw count -> register word
    constexpr uint16_t encode(int32_t raw) const {
        return static_cast<uint16_t>(static_cast<uint32_t>(raw) & wordMask());
    }

    constexpr float toPhysical(int32_t raw) const {
        return static_cast<float>(raw) * lsb;
    }

    util::Result<int32_t, app::DeviceError> toRaw(float value) const {
        if (!std::isfinite(value)) {
            return util::Result<int32_t, app::DeviceError>::Err(app::DeviceError::outOfRange());
        }
        double counts = std::round(static_cast<double>(value) / static_cast<double>(lsb));
        if (counts < rawMin || counts > rawMax) {
            return util::Result<int32_t, app::DeviceError>::Err(app::DeviceError::outOfRange());
        }
        return util::Result<int32_t, app::DeviceError>::Ok(static_cast<int32_t>(counts));
    }
};

/**
 * @brief Named bit range inside a 16-bit register
 *
 * A field spanning all 16 bits is the register itself and is written
 * without a preceding read.
 */
template<Access A>
struct BitField {
    static constexpr Access access = A;

    uint8_t address;
    uint8_t shift;
    uint8_t width;

    constexpr uint16_t maxValue() const {
        return static_cast<uint16_t>((1u << width) - 1u);
    }

    constexpr uint16_t mask() const {
        return static_cast<uint16_t>(maxValue() << shift);
    }

    constexpr bool coversWord() const { return mask() == 0xFFFF; }

    constexpr bool fits(uint16_t value) const { return value <= maxValue(); }

    constexpr uint16_t extract(uint16_t word) const {
        return static_cast<uint16_t>((word & mask()) >> shift);
    }

    // Replace this field's bits in `word`, leaving every other bit alone
    constexpr uint16_t insert(uint16_t word, uint16_t value) const {
        return static_cast<uint16_t>((word & ~mask()) | ((value << shift) & mask()));
    }
};

using ReadOnlyRegister = ScaledRegister<Access::ReadOnly>;
using ReadWriteRegister = ScaledRegister<Access::ReadWrite>;
using ReadOnlyField = BitField<Access::ReadOnly>;
using ReadWriteField = BitField<Access::ReadWrite>;

} // namespace hal
