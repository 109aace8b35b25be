#include "config/Config.hpp"
#include "plc/ProtocolClient.hpp"

#include "mclink/drivers/Mc3e.hpp"
#include "mclink/mclink.hpp"

#include <filesystem>
#include <print>

// Connects with the station settings and prints the handshake registers once.
auto main(int argc, char** argv) -> int
{
    std::filesystem::path configPath{ argc > 1 ? argv[1] : "config/station.yaml" };

    tcheck::config::StationConfig config;
    try {
        config = tcheck::config::load_config(configPath);
    } catch (const tcheck::config::ConfigError& e) {
        std::println(stderr, "Configuration error: {}", e.what());
        return 1;
    }

    const auto& conn{ config.connection };
    auto driver{ std::make_shared<mclink::drivers::Mc3eDriver>(conn.host, conn.port, conn.timeout, conn.route) };
    tcheck::plc::ProtocolClient client(driver, conn);

    if (auto connected{ mclink::coro::syncWait(client.connect()) }; !connected) {
        std::println(stderr, "{}:{} not reachable: {}", conn.host, conn.port, connected.error().message());
        return 2;
    }

    auto status{ mclink::coro::syncWait(client.read_status()) };
    if (!status) {
        std::println(stderr, "Status read failed: {}", status.error().message());
        return 2;
    }

    std::println("{} = {} ({})",
                 mclink::toString(conn.trigger),
                 status->raw_trigger,
                 tcheck::plc::ProtocolClient::describe(status->trigger));
    std::println("{} = {}", mclink::toString(conn.row_count), status->row_count);

    client.disconnect();
    return 0;
}
