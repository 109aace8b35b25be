#include "mclink/Codec.hpp"

#include <cmath>
#include <limits>

namespace mclink
{
    auto encodeFixed32(double value, int32_t scale) -> Fixed32Words
    {
        static constexpr auto MIN{ static_cast<double>(std::numeric_limits<int32_t>::min()) };
        static constexpr auto MAX{ static_cast<double>(std::numeric_limits<int32_t>::max()) };

        auto scaled{ std::round(value * scale) };

        Fixed32Words words{};
        int32_t raw{ 0 };
        if (std::isnan(scaled)) {
            words.clamped = true;
        }
        else if (scaled < MIN) {
            raw = std::numeric_limits<int32_t>::min();
            words.clamped = true;
        }
        else if (scaled > MAX) {
            raw = std::numeric_limits<int32_t>::max();
            words.clamped = true;
        }
        else {
            raw = static_cast<int32_t>(scaled);
        }

        auto bits{ static_cast<uint32_t>(raw) };
        words.low = static_cast<uint16_t>(bits & 0xFFFF);
        words.high = static_cast<uint16_t>(bits >> 16);
        return words;
    }

    auto decodeFixed32(uint16_t low, uint16_t high, int32_t scale) -> double
    {
        auto bits{ (static_cast<uint32_t>(high) << 16) | low };
        return static_cast<double>(static_cast<int32_t>(bits)) / scale;
    }
} // namespace mclink
