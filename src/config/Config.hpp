#pragma once

#include "../model/Inspection.hpp"

#include "mclink/Device.hpp"
#include "mclink/drivers/Mc3e.hpp"
#include "mclink/log/Logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace YAML
{
    class Node;
}

namespace tcheck::config
{
    /**
     * Missing or invalid configuration. The station must not start with it.
     */
    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct StatusCodes
    {
        uint16_t request{ 0 };
        uint16_t success{ 0 };
        uint16_t error{ 0 };
    };

    /**
     * Controller link. Host, port, devices and codes have no defaults.
     */
    struct ConnectionConfig
    {
        std::string host;
        uint16_t port{ 0 };
        mclink::Device trigger;
        mclink::Device value;
        mclink::Device row_count;
        StatusCodes codes;
        std::chrono::milliseconds timeout{ 1000 };
        int32_t value_scale{ 100 };
        mclink::drivers::Mc3eRoute route;
    };

    struct TopVisionConfig
    {
        double confidence{ 0.45 };
        double calibration_confidence{ 0.10 };
        std::vector<std::string> fault_classes{ "error_apilado", "error_alerta" };
        std::string occupied_class{ "posicion_columna" };
        std::string empty_class{ "posicion_vacia" };
        int column_count{ 8 };
        int column_tolerance_px{ 30 };
        int correction_limit_px{ 50 };
    };

    struct SideVisionConfig
    {
        double confidence{ 0.05 };
        std::vector<std::string> anomaly_classes{ "error_caido" };
        std::string reference_class{ "referencia_fija" };
        std::string edge_class{ "borde_envase" };
        std::string mid_class{ "mitad_envase" };
        double real_distance_mm{ 100.0 };
        double zero_offset_px{ 40.0 };
    };

    struct OutputConfig
    {
        model::DeviationSource deviation_source{ model::DeviationSource::SideDepth };
        double mm_per_pixel{ 0.5 };
        double max_valid_correction_mm{ 50.0 };
    };

    struct VisionConfig
    {
        TopVisionConfig top;
        SideVisionConfig side;
        OutputConfig output;
    };

    struct TimingConfig
    {
        std::chrono::milliseconds poll_delay{ 100 };
        std::chrono::milliseconds post_process_delay{ 500 };
        std::chrono::milliseconds simulation_delay{ 500 };
    };

    struct SystemConfig
    {
        bool simulation{ false };
        int recalibrate_every{ 0 }; // processed cycles, 0 = only when uncalibrated
    };

    struct LoggingConfig
    {
        std::filesystem::path file;
        mclink::log::Level level{ mclink::log::Level::Info };
    };

    struct ReplayConfig
    {
        std::filesystem::path recording;
    };

    struct StationConfig
    {
        ConnectionConfig connection;
        VisionConfig vision;
        TimingConfig timing;
        SystemConfig system;
        LoggingConfig logging;
        ReplayConfig replay;
    };

    /** Reads and validates a station file. Throws ConfigError. */
    auto load_config(const std::filesystem::path& path) -> StationConfig;

    /** Same as load_config for an in-memory document. Throws ConfigError. */
    auto parse_config(std::string_view yaml) -> StationConfig;

    auto parse_config(const YAML::Node& root) -> StationConfig;
}
