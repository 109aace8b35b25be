#include "mclink/Device.hpp"
#include "mclink/Error.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>

namespace
{
    struct Prefix
    {
        std::string_view name;
        mclink::DeviceType type;
        int base;
    };

    // clang-format off
    // longest prefixes first
    constexpr std::array PREFIXES{
        Prefix{ "ZR", mclink::DeviceType::ZR, 10 },
        Prefix{ "SD", mclink::DeviceType::SD, 10 },
        Prefix{ "TN", mclink::DeviceType::TN, 10 },
        Prefix{ "CN", mclink::DeviceType::CN, 10 },
        Prefix{ "D",  mclink::DeviceType::D,  10 },
        Prefix{ "W",  mclink::DeviceType::W,  16 },
        Prefix{ "R",  mclink::DeviceType::R,  10 },
    };
    // clang-format on

    auto startsWithNoCase(std::string_view str, std::string_view prefix) -> bool
    {
        if (str.size() < prefix.size()) {
            return false;
        }
        return std::ranges::equal(str.substr(0, prefix.size()), prefix, [](char a, char b) {
            return std::toupper(static_cast<unsigned char>(a)) == b;
        });
    }
}

namespace mclink
{
    auto parseDevice(std::string_view name) -> Result<Device>
    {
        auto prefix{ std::ranges::find_if(PREFIXES, [name](const Prefix& p) { return startsWithNoCase(name, p.name); }) };
        if (prefix == PREFIXES.end()) {
            return std::unexpected(make_error_code(McError::InvalidDevice));
        }

        auto digits{ name.substr(prefix->name.size()) };
        if (digits.empty()) {
            return std::unexpected(make_error_code(McError::InvalidDevice));
        }

        uint32_t number{ 0 };
        auto [ptr, ec]{ std::from_chars(digits.data(), digits.data() + digits.size(), number, prefix->base) };
        if (ec != std::errc{} || ptr != digits.data() + digits.size() || number > MAX_DEVICE_NUMBER) {
            return std::unexpected(make_error_code(McError::InvalidDevice));
        }

        return Device{ prefix->type, number };
    }

    auto toString(const Device& device) -> std::string
    {
        auto prefix{ std::ranges::find(PREFIXES, device.type, &Prefix::type) };
        if (prefix->base == 16) {
            return std::format("{}{:X}", prefix->name, device.number);
        }
        return std::format("{}{}", prefix->name, device.number);
    }
} // namespace mclink
