#pragma once

#include "../config/Config.hpp"
#include "../model/Inspection.hpp"

#include "mclink/Driver.hpp"
#include "mclink/Result.hpp"
#include "mclink/coroutine/Task.hpp"

#include <memory>
#include <string_view>
#include <system_error>

namespace tcheck::plc
{
    enum class PlcError
    {
        None = 0,
        ConnectFailed,
        NotConnected,
        TriggerReadFailed,
        StatusReadFailed,
        ValueWriteFailed,
        RowCountWriteFailed,
        TriggerWriteFailed
    };

    auto plc_category() noexcept -> const std::error_category&;
    auto make_error_code(PlcError e) noexcept -> std::error_code;

    /** Snapshot of the handshake registers for the operator. */
    struct PlcStatus
    {
        uint16_t raw_trigger{ 0 };
        model::TriggerState trigger{ model::TriggerState::Idle };
        uint16_t row_count{ 0 };
    };

    /**
     * Handshake with the controller over a word driver.
     *
     * A result is written as value (two words, low first), then row count,
     * then the trigger code. A failed step skips the remaining ones and
     * drops the connection, so the trigger never announces stale data.
     */
    class ProtocolClient
    {
    public:
        ProtocolClient(std::shared_ptr<mclink::IDriver> driver, config::ConnectionConfig config);
        ~ProtocolClient();

        ProtocolClient(const ProtocolClient&) = delete;
        ProtocolClient& operator=(const ProtocolClient&) = delete;

        auto connect() -> mclink::coro::Task<mclink::Result<void>>;
        void disconnect() noexcept;
        bool is_connected() const noexcept;

        auto read_trigger() -> mclink::coro::Task<mclink::Result<model::TriggerState>>;
        auto write_result(double value_mm, int row_count, bool success) -> mclink::coro::Task<mclink::Result<void>>;
        auto read_status() -> mclink::coro::Task<mclink::Result<PlcStatus>>;

        model::TriggerState decode_trigger(uint16_t raw) const;
        static std::string_view describe(model::TriggerState state);

        const config::ConnectionConfig& config() const { return m_config; }

    private:
        auto fail(PlcError err, const std::error_code& cause) -> std::error_code;

        std::shared_ptr<mclink::IDriver> m_driver;
        config::ConnectionConfig m_config;
    };
}

namespace std
{
    template<>
    struct is_error_code_enum<tcheck::plc::PlcError> : true_type
    {
    };
}
