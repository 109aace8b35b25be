#pragma once

#include "mclink/Driver.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace mclink::drivers
{
    /** Access route of a 3E frame. The defaults address the connected station itself. */
    struct Mc3eRoute
    {
        uint8_t network{ 0x00 };
        uint8_t pc{ 0xFF };
        uint16_t moduleIo{ 0x03FF };
        uint8_t station{ 0x00 };
    };

    /** Binary 3E frame encoding, exposed for diagnostics and tests. */
    namespace mc3e
    {
        static constexpr uint16_t CMD_BATCH_READ{ 0x0401 };
        static constexpr uint16_t CMD_BATCH_WRITE{ 0x1401 };
        static constexpr uint16_t SUBCMD_WORD_UNITS{ 0x0000 };

        static constexpr size_t MAX_POINTS{ 960 };
        static constexpr size_t RESPONSE_HEADER_SIZE{ 9 };
        static constexpr size_t END_CODE_SIZE{ 2 };
        static constexpr std::chrono::milliseconds TIMER_UNIT{ 250 };

        struct Response
        {
            uint16_t endCode{ 0 };
            std::span<const uint8_t> data;
        };

        /** Monitoring timer value (250 ms units, at least one unit). */
        auto monitoringTimer(std::chrono::milliseconds timeout) -> uint16_t;

        auto encodeBatchRead(const Mc3eRoute& route, const Device& head, size_t points, uint16_t timer)
          -> Result<std::vector<uint8_t>>;
        auto encodeBatchWrite(const Mc3eRoute& route,
                              const Device& head,
                              std::span<const uint16_t> words,
                              uint16_t timer) -> Result<std::vector<uint8_t>>;

        /**
         * Validates the response header and returns the number of bytes that
         * follow it (end code and data).
         */
        auto parseResponseHeader(std::span<const uint8_t> header) -> Result<size_t>;

        /** Splits a complete response frame into end code and data. */
        auto parseResponse(std::span<const uint8_t> frame) -> Result<Response>;

        auto unpackWords(std::span<const uint8_t> data, std::span<uint16_t> dest) -> Result<void>;
    }

    /**
     * MELSEC communication protocol, 3E frame in binary code over TCP.
     * One transaction is in flight at a time; requests from several
     * coroutines are serialized.
     */
    class Mc3eDriver : public IDriver
    {
      public:
        Mc3eDriver(std::string host,
                   uint16_t port,
                   std::chrono::milliseconds defaultTimeout = std::chrono::milliseconds(1000),
                   Mc3eRoute route = {});
        ~Mc3eDriver() override;

        Mc3eDriver(const Mc3eDriver&) = delete;
        Mc3eDriver& operator=(const Mc3eDriver&) = delete;

        // clang-format off
        auto connect(std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> override;
        auto disconnect() -> void override;
        auto isConnected() const noexcept -> bool override;

        auto readWords(const Device& head,
                       std::span<uint16_t> dest,
                       std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> override;
        auto writeWords(const Device& head,
                        std::span<const uint16_t> src,
                        std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> override;
        // clang-format on

        /** End code of the last response that carried a non-zero one. */
        auto lastEndCode() const noexcept -> uint16_t { return m_lastEndCode; }

      private:
        using Clock = std::chrono::steady_clock;

        auto effectiveTimeout(std::chrono::milliseconds timeout) const -> std::chrono::milliseconds;
        auto transact(std::span<const uint8_t> request, Clock::time_point deadline) -> Result<std::vector<uint8_t>>;
        auto closeSocket() -> void;

        std::string m_host;
        uint16_t m_port;
        std::chrono::milliseconds m_defaultTimeout;
        Mc3eRoute m_route;

        std::mutex m_mutex;
        int m_socket{ -1 };
        std::atomic<bool> m_connected{ false };
        std::atomic<uint16_t> m_lastEndCode{ 0 };
    };

} // namespace mclink::drivers
