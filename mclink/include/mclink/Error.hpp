#pragma once

#include <cstdint>
#include <system_error>

namespace mclink
{
    enum class McError : int
    {
        None = 0,
        InvalidDevice,     /**< device name could not be parsed */
        InvalidEndpoint,   /**< host could not be resolved */
        ConnectFailed,     /**< tcp connection refused or unreachable */
        NotConnected,      /**< request issued without an open connection */
        Timeout,           /**< no answer within the configured timeout */
        ConnectionClosed,  /**< peer closed the connection */
        SendFailed,        /**< socket send error */
        ReceiveFailed,     /**< socket receive error */
        MalformedResponse, /**< response frame could not be decoded */
        SizeMismatch,      /**< response carried an unexpected amount of data */
        TooManyPoints,     /**< request exceeds the points allowed per frame */
        PlcEndCode         /**< controller answered with a non-zero end code */
    };

    auto mc_category() noexcept -> const std::error_category&;
    auto make_error_code(McError e) noexcept -> std::error_code;
} // namespace mclink

namespace std
{
    template<>
    struct is_error_code_enum<mclink::McError> : true_type
    {
    };
}
