#include "ProtocolClient.hpp"

#include "mclink/Codec.hpp"
#include "mclink/log/Logger.hpp"

#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <array>
#include <limits>
#include <string>

namespace
{
    class PlcErrorCategory : public std::error_category
    {
    public:
        const char* name() const noexcept override { return "PlcError"; }

        std::string message(int ev) const override
        {
            return std::string(magic_enum::enum_name(static_cast<tcheck::plc::PlcError>(ev)));
        }
    };
}

namespace tcheck::plc
{
    namespace log = mclink::log;

    auto plc_category() noexcept -> const std::error_category&
    {
        static PlcErrorCategory instance;
        return instance;
    }

    auto make_error_code(PlcError e) noexcept -> std::error_code
    {
        return std::error_code(static_cast<int>(e), plc_category());
    }

    ProtocolClient::ProtocolClient(std::shared_ptr<mclink::IDriver> driver, config::ConnectionConfig config)
        : m_driver(std::move(driver))
        , m_config(std::move(config))
    {
    }

    ProtocolClient::~ProtocolClient()
    {
        disconnect();
    }

    auto ProtocolClient::connect() -> mclink::coro::Task<mclink::Result<void>>
    {
        if (is_connected()) {
            co_return mclink::success();
        }

        log::info("PLC: connecting to {}:{}", m_config.host, m_config.port);
        auto result{ co_await m_driver->connect(m_config.timeout) };
        if (!result) {
            co_return std::unexpected(fail(PlcError::ConnectFailed, result.error()));
        }

        log::info("PLC: connected, trigger {} value {} rows {}",
                  mclink::toString(m_config.trigger),
                  mclink::toString(m_config.value),
                  mclink::toString(m_config.row_count));
        co_return mclink::success();
    }

    void ProtocolClient::disconnect() noexcept
    {
        if (m_driver) {
            m_driver->disconnect();
        }
    }

    bool ProtocolClient::is_connected() const noexcept
    {
        return m_driver && m_driver->isConnected();
    }

    auto ProtocolClient::read_trigger() -> mclink::coro::Task<mclink::Result<model::TriggerState>>
    {
        if (!is_connected()) {
            co_return std::unexpected(make_error_code(PlcError::NotConnected));
        }

        auto raw{ co_await m_driver->readWord(m_config.trigger, m_config.timeout) };
        if (!raw) {
            co_return std::unexpected(fail(PlcError::TriggerReadFailed, raw.error()));
        }
        co_return decode_trigger(*raw);
    }

    auto ProtocolClient::write_result(double value_mm, int row_count, bool success)
      -> mclink::coro::Task<mclink::Result<void>>
    {
        if (!is_connected()) {
            co_return std::unexpected(make_error_code(PlcError::NotConnected));
        }

        // an error result carries no data
        auto encoded{ mclink::encodeFixed32(success ? value_mm : 0.0, m_config.value_scale) };
        if (encoded.clamped) {
            log::warning("PLC: value {} mm does not fit the register pair and was clamped", value_mm);
        }
        auto words{ encoded.words() };

        auto rows{ success ? std::clamp(row_count, 0, static_cast<int>(std::numeric_limits<uint16_t>::max())) : 0 };
        auto code{ success ? m_config.codes.success : m_config.codes.error };

        if (auto res{ co_await m_driver->writeWords(m_config.value, words, m_config.timeout) }; !res) {
            co_return std::unexpected(fail(PlcError::ValueWriteFailed, res.error()));
        }
        if (auto res{ co_await m_driver->writeWord(m_config.row_count, static_cast<uint16_t>(rows), m_config.timeout) };
            !res) {
            co_return std::unexpected(fail(PlcError::RowCountWriteFailed, res.error()));
        }
        if (auto res{ co_await m_driver->writeWord(m_config.trigger, code, m_config.timeout) }; !res) {
            co_return std::unexpected(fail(PlcError::TriggerWriteFailed, res.error()));
        }

        log::debug("PLC: wrote value [{:#06x}, {:#06x}] rows {} code {}", words[0], words[1], rows, code);
        co_return mclink::success();
    }

    auto ProtocolClient::read_status() -> mclink::coro::Task<mclink::Result<PlcStatus>>
    {
        if (!is_connected()) {
            co_return std::unexpected(make_error_code(PlcError::NotConnected));
        }

        auto trigger{ co_await m_driver->readWord(m_config.trigger, m_config.timeout) };
        if (!trigger) {
            co_return std::unexpected(fail(PlcError::StatusReadFailed, trigger.error()));
        }
        auto rows{ co_await m_driver->readWord(m_config.row_count, m_config.timeout) };
        if (!rows) {
            co_return std::unexpected(fail(PlcError::StatusReadFailed, rows.error()));
        }

        PlcStatus status{ .raw_trigger = *trigger, .trigger = decode_trigger(*trigger), .row_count = *rows };
        log::debug("PLC: {}", status);
        co_return status;
    }

    model::TriggerState ProtocolClient::decode_trigger(uint16_t raw) const
    {
        if (raw == m_config.codes.request) {
            return model::TriggerState::RequestPending;
        }
        if (raw == m_config.codes.success) {
            return model::TriggerState::LastSuccess;
        }
        if (raw == m_config.codes.error) {
            return model::TriggerState::LastError;
        }
        return model::TriggerState::Idle;
    }

    std::string_view ProtocolClient::describe(model::TriggerState state)
    {
        switch (state) {
            case model::TriggerState::RequestPending:
                return "request pending";
            case model::TriggerState::LastSuccess:
                return "last result ok";
            case model::TriggerState::LastError:
                return "last result error";
            case model::TriggerState::Idle:
                break;
        }
        return "idle";
    }

    auto ProtocolClient::fail(PlcError err, const std::error_code& cause) -> std::error_code
    {
        log::error("PLC: {} ({}), dropping connection", make_error_code(err).message(), cause.message());
        disconnect();
        return make_error_code(err);
    }
}
