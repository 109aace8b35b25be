#pragma once

#include "Result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace mclink
{
    /**
     * Word devices addressable through batch read/write in word units.
     * The enumerator value is the binary device code of the 3E frame.
     */
    enum class DeviceType : uint8_t
    {
        D = 0xA8,  /**< data register */
        W = 0xB4,  /**< link register, hexadecimal numbering */
        R = 0xAF,  /**< file register */
        ZR = 0xB0, /**< file register, serial numbering */
        SD = 0xA9, /**< special register */
        TN = 0xC2, /**< timer current value */
        CN = 0xC5  /**< counter current value */
    };

    struct Device
    {
        DeviceType type{ DeviceType::D };
        uint32_t number{ 0 };

        auto operator==(const Device&) const -> bool = default;
    };

    static constexpr uint32_t MAX_DEVICE_NUMBER{ 0xFFFFFF };

    /**
     * Parses a symbolic device name such as "D28", "w1A" or "ZR100".
     * Fails with McError::InvalidDevice on unknown prefixes, bad digits
     * or head numbers that do not fit the 24 bit address field.
     */
    auto parseDevice(std::string_view name) -> Result<Device>;

    auto toString(const Device& device) -> std::string;
} // namespace mclink
