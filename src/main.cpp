#include "config/Config.hpp"
#include "replay/Recording.hpp"
#include "station/ControlLoop.hpp"

#include "mclink/drivers/Mc3e.hpp"
#include "mclink/mclink.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <print>
#include <thread>

using namespace std::chrono_literals;

namespace
{
    std::atomic<bool> s_interrupted{ false };

    void on_signal(int)
    {
        s_interrupted = true;
    }
}

auto main(int argc, char** argv) -> int
{
    std::filesystem::path configPath{ argc > 1 ? argv[1] : "config/station.yaml" };

    tcheck::config::StationConfig config;
    std::shared_ptr<const tcheck::replay::Recording> recording;
    try {
        config = tcheck::config::load_config(configPath);
        if (config.replay.recording.empty()) {
            throw tcheck::config::ConfigError("replay.recording: no frame source configured");
        }
        recording = tcheck::replay::load_recording(config.replay.recording);
    } catch (const tcheck::config::ConfigError& e) {
        std::println(stderr, "Configuration error: {}", e.what());
        return 1;
    }

    auto& logger{ mclink::log::Logger::instance() };
    if (auto res{ logger.setConfig({ .minLevel = config.logging.level, .file = config.logging.file }) }; !res) {
        std::println(stderr, "Cannot open log file {}: {}", config.logging.file.string(), res.error().message());
        return 1;
    }

    mclink::log::info("TubeCheck: station {}:{} from {}", config.connection.host, config.connection.port, configPath.string());

    auto driver{ std::make_shared<mclink::drivers::Mc3eDriver>(
      config.connection.host, config.connection.port, config.connection.timeout, config.connection.route) };

    tcheck::station::ControlLoop loop(
      config,
      driver,
      { .top = std::make_shared<tcheck::replay::ReplayCamera>(recording, tcheck::replay::View::Top),
        .side = std::make_shared<tcheck::replay::ReplayCamera>(recording, tcheck::replay::View::Side) },
      { .top = std::make_shared<tcheck::replay::ReplayDetector>(recording, tcheck::replay::View::Top),
        .side = std::make_shared<tcheck::replay::ReplayDetector>(recording, tcheck::replay::View::Side) });

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    loop.start();
    while (!s_interrupted && loop.is_running()) {
        std::this_thread::sleep_for(100ms);
    }

    mclink::log::info("TubeCheck: shutting down");
    loop.stop();
    loop.wait();
    return 0;
}
