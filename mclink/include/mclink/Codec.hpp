#pragma once

#include <array>
#include <cstdint>

namespace mclink
{
    static constexpr int32_t DEFAULT_SCALE{ 100 };

    /**
     * A signed 32 bit fixed-point value split into controller words,
     * low word first. clamped is set when the scaled value did not fit
     * into int32 (or was not finite) and the boundary value was used.
     */
    struct Fixed32Words
    {
        uint16_t low{ 0 };
        uint16_t high{ 0 };
        bool clamped{ false };

        auto words() const -> std::array<uint16_t, 2> { return { low, high }; }
    };

    auto encodeFixed32(double value, int32_t scale = DEFAULT_SCALE) -> Fixed32Words;
    auto decodeFixed32(uint16_t low, uint16_t high, int32_t scale = DEFAULT_SCALE) -> double;
} // namespace mclink
