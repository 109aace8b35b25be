#pragma once

#include "coroutine/Task.hpp"

#include "Device.hpp"
#include "Result.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <span>

namespace mclink
{
    static constexpr std::chrono::milliseconds NO_TIMEOUT{ std::chrono::milliseconds(0) };

    /**
     * Word oriented controller link. A timeout of NO_TIMEOUT selects the
     * driver's configured default. Any transport failure closes the
     * connection; the caller reconnects explicitly.
     */
    class IDriver
    {
      public:
        virtual ~IDriver() = default;

        // clang-format off
        virtual auto connect(std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> = 0;
        virtual auto disconnect() -> void = 0;
        virtual auto isConnected() const noexcept -> bool = 0;

        virtual auto readWords(const Device& head,
                               std::span<uint16_t> dest,
                               std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> = 0;

        virtual auto writeWords(const Device& head,
                                std::span<const uint16_t> src,
                                std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> = 0;
        // clang-format on

        auto readWord(const Device& device, std::chrono::milliseconds timeout = NO_TIMEOUT)
          -> coro::Task<Result<uint16_t>>
        {
            uint16_t value{ 0 };
            auto result{ co_await readWords(device, std::span{ &value, 1 }, timeout) };
            if (!result) {
                co_return std::unexpected(result.error());
            }
            co_return value;
        }

        auto writeWord(const Device& device, uint16_t value, std::chrono::milliseconds timeout = NO_TIMEOUT)
          -> coro::Task<Result<void>>
        {
            co_return co_await writeWords(device, std::span<const uint16_t>{ &value, 1 }, timeout);
        }

        template<size_t N>
        auto read(const Device& head, std::chrono::milliseconds timeout = NO_TIMEOUT)
          -> coro::Task<Result<std::array<uint16_t, N>>>
        {
            std::array<uint16_t, N> values{};
            auto result{ co_await readWords(head, values, timeout) };
            if (!result) {
                co_return std::unexpected(result.error());
            }
            co_return values;
        }
    };

} // namespace mclink
