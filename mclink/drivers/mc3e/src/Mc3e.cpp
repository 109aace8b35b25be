#include "mclink/drivers/Mc3e.hpp"
#include "mclink/Error.hpp"
#include "mclink/log/Logger.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>

namespace
{
    using mclink::McError;
    using mclink::make_error_code;

    constexpr uint8_t REQUEST_SUBHEADER[]{ 0x50, 0x00 };
    constexpr uint8_t RESPONSE_SUBHEADER[]{ 0xD0, 0x00 };

    // bytes between the data length field and the device data of a batch request
    constexpr size_t REQUEST_FIXED_LENGTH{ 12 };

    struct AddrInfoDeleter
    {
        auto operator()(addrinfo* info) const -> void { freeaddrinfo(info); }
    };

    auto putLe16(std::vector<uint8_t>& buf, uint16_t value) -> void
    {
        buf.push_back(static_cast<uint8_t>(value & 0xFF));
        buf.push_back(static_cast<uint8_t>(value >> 8));
    }

    auto getLe16(std::span<const uint8_t> buf, size_t offset) -> uint16_t
    {
        return static_cast<uint16_t>(buf[offset] | (buf[offset + 1] << 8));
    }

    auto encodeHeader(const mclink::drivers::Mc3eRoute& route,
                      uint16_t command,
                      const mclink::Device& head,
                      size_t points,
                      size_t payloadBytes,
                      uint16_t timer) -> std::vector<uint8_t>
    {
        std::vector<uint8_t> frame;
        frame.reserve(mclink::drivers::mc3e::RESPONSE_HEADER_SIZE + REQUEST_FIXED_LENGTH + payloadBytes);

        frame.insert(frame.end(), std::begin(REQUEST_SUBHEADER), std::end(REQUEST_SUBHEADER));
        frame.push_back(route.network);
        frame.push_back(route.pc);
        putLe16(frame, route.moduleIo);
        frame.push_back(route.station);
        putLe16(frame, static_cast<uint16_t>(REQUEST_FIXED_LENGTH + payloadBytes));
        putLe16(frame, timer);
        putLe16(frame, command);
        putLe16(frame, mclink::drivers::mc3e::SUBCMD_WORD_UNITS);
        frame.push_back(static_cast<uint8_t>(head.number & 0xFF));
        frame.push_back(static_cast<uint8_t>((head.number >> 8) & 0xFF));
        frame.push_back(static_cast<uint8_t>((head.number >> 16) & 0xFF));
        frame.push_back(static_cast<uint8_t>(head.type));
        putLe16(frame, static_cast<uint16_t>(points));
        return frame;
    }

    auto checkPoints(const mclink::Device& head, size_t points) -> McError
    {
        if (points == 0 || points > mclink::drivers::mc3e::MAX_POINTS) {
            return McError::TooManyPoints;
        }
        if (head.number + points - 1 > mclink::MAX_DEVICE_NUMBER) {
            return McError::InvalidDevice;
        }
        return McError::None;
    }

    auto remaining(std::chrono::steady_clock::time_point deadline) -> int
    {
        auto left{ std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()) };
        return static_cast<int>(std::max<int64_t>(left.count(), 0));
    }

    auto waitFor(int socket, short events, std::chrono::steady_clock::time_point deadline) -> McError
    {
        pollfd pfd{ .fd = socket, .events = events, .revents = 0 };
        while (true) {
            auto rc{ ::poll(&pfd, 1, remaining(deadline)) };
            if (rc > 0) {
                return McError::None;
            }
            if (rc == 0) {
                return McError::Timeout;
            }
            if (errno != EINTR) {
                return events == POLLIN ? McError::ReceiveFailed : McError::SendFailed;
            }
        }
    }

    auto sendAll(int socket, std::span<const uint8_t> data, std::chrono::steady_clock::time_point deadline) -> McError
    {
        auto sent{ 0uz };
        while (sent < data.size()) {
            auto rc{ ::send(socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL) };
            if (rc >= 0) {
                sent += static_cast<size_t>(rc);
                continue;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                return errno == EPIPE || errno == ECONNRESET ? McError::ConnectionClosed : McError::SendFailed;
            }
            if (auto err{ waitFor(socket, POLLOUT, deadline) }; err != McError::None) {
                return err;
            }
        }
        return McError::None;
    }

    auto receiveExact(int socket, std::span<uint8_t> dest, std::chrono::steady_clock::time_point deadline) -> McError
    {
        auto received{ 0uz };
        while (received < dest.size()) {
            auto rc{ ::recv(socket, dest.data() + received, dest.size() - received, 0) };
            if (rc > 0) {
                received += static_cast<size_t>(rc);
                continue;
            }
            if (rc == 0) {
                return McError::ConnectionClosed;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                return errno == ECONNRESET ? McError::ConnectionClosed : McError::ReceiveFailed;
            }
            if (auto err{ waitFor(socket, POLLIN, deadline) }; err != McError::None) {
                return err;
            }
        }
        return McError::None;
    }

    auto connectOne(const addrinfo& ai, std::chrono::steady_clock::time_point deadline, int& socketOut) -> McError
    {
        auto socket{ ::socket(ai.ai_family, ai.ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai.ai_protocol) };
        if (socket < 0) {
            return McError::ConnectFailed;
        }

        auto err{ McError::None };
        if (::connect(socket, ai.ai_addr, ai.ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                err = McError::ConnectFailed;
            }
            else if (err = waitFor(socket, POLLOUT, deadline); err == McError::None) {
                int soError{ 0 };
                socklen_t len{ sizeof(soError) };
                if (::getsockopt(socket, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
                    err = McError::ConnectFailed;
                }
            }
            else if (err != McError::Timeout) {
                err = McError::ConnectFailed;
            }
        }

        if (err != McError::None) {
            ::close(socket);
            return err;
        }

        int noDelay{ 1 };
        ::setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));
        socketOut = socket;
        return McError::None;
    }
}

namespace mclink::drivers
{
    namespace mc3e
    {
        auto monitoringTimer(std::chrono::milliseconds timeout) -> uint16_t
        {
            auto units{ (timeout.count() + TIMER_UNIT.count() - 1) / TIMER_UNIT.count() };
            return static_cast<uint16_t>(std::clamp<int64_t>(units, 1, 0xFFFF));
        }

        auto encodeBatchRead(const Mc3eRoute& route, const Device& head, size_t points, uint16_t timer)
          -> Result<std::vector<uint8_t>>
        {
            if (auto err{ checkPoints(head, points) }; err != McError::None) {
                return std::unexpected(make_error_code(err));
            }
            return encodeHeader(route, CMD_BATCH_READ, head, points, 0, timer);
        }

        auto encodeBatchWrite(const Mc3eRoute& route,
                              const Device& head,
                              std::span<const uint16_t> words,
                              uint16_t timer) -> Result<std::vector<uint8_t>>
        {
            if (auto err{ checkPoints(head, words.size()) }; err != McError::None) {
                return std::unexpected(make_error_code(err));
            }

            auto frame{ encodeHeader(route, CMD_BATCH_WRITE, head, words.size(), words.size() * 2, timer) };
            for (auto word : words) {
                putLe16(frame, word);
            }
            return frame;
        }

        auto parseResponseHeader(std::span<const uint8_t> header) -> Result<size_t>
        {
            if (header.size() < RESPONSE_HEADER_SIZE ||
                !std::ranges::equal(header.first(2), std::span{ RESPONSE_SUBHEADER })) {
                return std::unexpected(make_error_code(McError::MalformedResponse));
            }

            auto length{ static_cast<size_t>(getLe16(header, 7)) };
            if (length < END_CODE_SIZE) {
                return std::unexpected(make_error_code(McError::MalformedResponse));
            }
            return length;
        }

        auto parseResponse(std::span<const uint8_t> frame) -> Result<Response>
        {
            auto length{ parseResponseHeader(frame) };
            if (!length) {
                return std::unexpected(length.error());
            }
            if (frame.size() != RESPONSE_HEADER_SIZE + *length) {
                return std::unexpected(make_error_code(McError::MalformedResponse));
            }

            return Response{ .endCode = getLe16(frame, RESPONSE_HEADER_SIZE),
                             .data = frame.subspan(RESPONSE_HEADER_SIZE + END_CODE_SIZE) };
        }

        auto unpackWords(std::span<const uint8_t> data, std::span<uint16_t> dest) -> Result<void>
        {
            if (data.size() != dest.size() * 2) {
                return std::unexpected(make_error_code(McError::SizeMismatch));
            }
            for (auto i{ 0uz }; i < dest.size(); ++i) {
                dest[i] = getLe16(data, i * 2);
            }
            return success();
        }
    }

    Mc3eDriver::Mc3eDriver(std::string host,
                           uint16_t port,
                           std::chrono::milliseconds defaultTimeout,
                           Mc3eRoute route)
      : m_host(std::move(host))
      , m_port{ port }
      , m_defaultTimeout{ defaultTimeout }
      , m_route{ route }
    {
    }

    Mc3eDriver::~Mc3eDriver()
    {
        disconnect();
    }

    auto Mc3eDriver::connect(std::chrono::milliseconds timeout) -> coro::Task<Result<void>>
    {
        std::lock_guard lock(m_mutex);
        closeSocket();

        auto deadline{ Clock::now() + effectiveTimeout(timeout) };

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* found{ nullptr };
        auto service{ std::to_string(m_port) };
        if (auto rc{ ::getaddrinfo(m_host.c_str(), service.c_str(), &hints, &found) }; rc != 0) {
            log::error("MC 3E: cannot resolve {}: {}", m_host, ::gai_strerror(rc));
            co_return std::unexpected(make_error_code(McError::InvalidEndpoint));
        }
        std::unique_ptr<addrinfo, AddrInfoDeleter> addresses(found);

        auto err{ McError::ConnectFailed };
        for (auto* ai{ addresses.get() }; ai; ai = ai->ai_next) {
            err = connectOne(*ai, deadline, m_socket);
            if (err == McError::None || err == McError::Timeout) {
                break;
            }
        }

        if (err != McError::None) {
            log::warning("MC 3E: connection to {}:{} failed: {}", m_host, m_port, make_error_code(err).message());
            co_return std::unexpected(make_error_code(err));
        }

        m_connected = true;
        log::info("MC 3E: connected to {}:{}", m_host, m_port);
        co_return success();
    }

    auto Mc3eDriver::disconnect() -> void
    {
        std::lock_guard lock(m_mutex);
        if (m_socket >= 0) {
            log::info("MC 3E: disconnected from {}:{}", m_host, m_port);
        }
        closeSocket();
    }

    auto Mc3eDriver::isConnected() const noexcept -> bool
    {
        return m_connected;
    }

    auto Mc3eDriver::readWords(const Device& head, std::span<uint16_t> dest, std::chrono::milliseconds timeout)
      -> coro::Task<Result<void>>
    {
        auto timeoutMs{ effectiveTimeout(timeout) };
        auto request{ mc3e::encodeBatchRead(m_route, head, dest.size(), mc3e::monitoringTimer(timeoutMs)) };
        if (!request) {
            co_return std::unexpected(request.error());
        }

        std::lock_guard lock(m_mutex);
        auto frame{ transact(*request, Clock::now() + timeoutMs) };
        if (!frame) {
            co_return std::unexpected(frame.error());
        }

        auto response{ mc3e::parseResponse(*frame) };
        if (!response) {
            closeSocket();
            co_return std::unexpected(response.error());
        }
        if (response->endCode != 0) {
            m_lastEndCode = response->endCode;
            log::error("MC 3E: read of {} x{} rejected, end code 0x{:04X}", toString(head), dest.size(), response->endCode);
            co_return std::unexpected(make_error_code(McError::PlcEndCode));
        }
        co_return mc3e::unpackWords(response->data, dest);
    }

    auto Mc3eDriver::writeWords(const Device& head, std::span<const uint16_t> src, std::chrono::milliseconds timeout)
      -> coro::Task<Result<void>>
    {
        auto timeoutMs{ effectiveTimeout(timeout) };
        auto request{ mc3e::encodeBatchWrite(m_route, head, src, mc3e::monitoringTimer(timeoutMs)) };
        if (!request) {
            co_return std::unexpected(request.error());
        }

        std::lock_guard lock(m_mutex);
        auto frame{ transact(*request, Clock::now() + timeoutMs) };
        if (!frame) {
            co_return std::unexpected(frame.error());
        }

        auto response{ mc3e::parseResponse(*frame) };
        if (!response) {
            closeSocket();
            co_return std::unexpected(response.error());
        }
        if (response->endCode != 0) {
            m_lastEndCode = response->endCode;
            log::error("MC 3E: write of {} x{} rejected, end code 0x{:04X}", toString(head), src.size(), response->endCode);
            co_return std::unexpected(make_error_code(McError::PlcEndCode));
        }
        co_return success();
    }

    auto Mc3eDriver::effectiveTimeout(std::chrono::milliseconds timeout) const -> std::chrono::milliseconds
    {
        return timeout > NO_TIMEOUT ? timeout : m_defaultTimeout;
    }

    auto Mc3eDriver::transact(std::span<const uint8_t> request, Clock::time_point deadline)
      -> Result<std::vector<uint8_t>>
    {
        if (m_socket < 0) {
            return std::unexpected(make_error_code(McError::NotConnected));
        }

        auto fail = [this](McError err) -> Result<std::vector<uint8_t>> {
            log::warning("MC 3E: transaction with {}:{} failed: {}", m_host, m_port, make_error_code(err).message());
            closeSocket();
            return std::unexpected(make_error_code(err));
        };

        if (auto err{ sendAll(m_socket, request, deadline) }; err != McError::None) {
            return fail(err);
        }

        std::vector<uint8_t> frame(mc3e::RESPONSE_HEADER_SIZE);
        if (auto err{ receiveExact(m_socket, frame, deadline) }; err != McError::None) {
            return fail(err);
        }

        auto length{ mc3e::parseResponseHeader(frame) };
        if (!length) {
            return fail(McError::MalformedResponse);
        }

        frame.resize(mc3e::RESPONSE_HEADER_SIZE + *length);
        if (auto err{ receiveExact(m_socket, std::span{ frame }.subspan(mc3e::RESPONSE_HEADER_SIZE), deadline) };
            err != McError::None) {
            return fail(err);
        }
        return frame;
    }

    auto Mc3eDriver::closeSocket() -> void
    {
        if (m_socket >= 0) {
            ::close(m_socket);
            m_socket = -1;
        }
        m_connected = false;
    }

} // namespace mclink::drivers
