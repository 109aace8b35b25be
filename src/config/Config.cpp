#include "Config.hpp"

#include <magic_enum/magic_enum.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <format>
#include <limits>

namespace
{
    using tcheck::config::ConfigError;

    auto child(const YAML::Node& node, std::string_view path, const char* key) -> YAML::Node
    {
        if (!node.IsMap()) {
            throw ConfigError(std::format("{}: expected a mapping", path));
        }
        return node[key];
    }

    template<typename T>
    auto convert(const YAML::Node& node, std::string_view path, const char* key) -> T
    {
        try {
            return node.as<T>();
        } catch (const YAML::Exception& ex) {
            throw ConfigError(std::format("{}.{}: invalid value ({})", path, key, ex.what()));
        }
    }

    template<typename T>
    auto required_field(const YAML::Node& node, std::string_view path, const char* key) -> T
    {
        auto value{ child(node, path, key) };
        if (!value.IsDefined() || value.IsNull()) {
            throw ConfigError(std::format("{}.{}: required field is missing", path, key));
        }
        return convert<T>(value, path, key);
    }

    template<typename T>
    auto optional_field(const YAML::Node& node, std::string_view path, const char* key, T fallback) -> T
    {
        if (!node.IsDefined() || node.IsNull()) {
            return fallback;
        }
        auto value{ child(node, path, key) };
        if (!value.IsDefined() || value.IsNull()) {
            return fallback;
        }
        return convert<T>(value, path, key);
    }

    template<typename T>
    auto in_range(int64_t value, std::string_view path, const char* key) -> T
    {
        if (value < std::numeric_limits<T>::min() || value > std::numeric_limits<T>::max()) {
            throw ConfigError(std::format("{}.{}: {} is out of range", path, key, value));
        }
        return static_cast<T>(value);
    }

    auto required_word(const YAML::Node& node, std::string_view path, const char* key) -> uint16_t
    {
        return in_range<uint16_t>(required_field<int64_t>(node, path, key), path, key);
    }

    auto required_device(const YAML::Node& node, std::string_view path, const char* key) -> mclink::Device
    {
        auto name{ required_field<std::string>(node, path, key) };
        auto device{ mclink::parseDevice(name) };
        if (!device) {
            throw ConfigError(std::format("{}.{}: '{}' is not a word device", path, key, name));
        }
        return *device;
    }

    auto duration_field(const YAML::Node& node, std::string_view path, const char* key, std::chrono::milliseconds fallback)
      -> std::chrono::milliseconds
    {
        auto ms{ optional_field<int64_t>(node, path, key, fallback.count()) };
        if (ms < 0) {
            throw ConfigError(std::format("{}.{}: must not be negative", path, key));
        }
        return std::chrono::milliseconds(ms);
    }

    auto parse_connection(const YAML::Node& node) -> tcheck::config::ConnectionConfig
    {
        static constexpr std::string_view PATH{ "connection" };
        if (!node.IsDefined() || node.IsNull()) {
            throw ConfigError("connection: required section is missing");
        }

        tcheck::config::ConnectionConfig cfg{};
        cfg.host = required_field<std::string>(node, PATH, "host");
        cfg.port = in_range<uint16_t>(required_field<int64_t>(node, PATH, "port"), PATH, "port");

        auto devices{ child(node, PATH, "devices") };
        if (!devices.IsDefined()) {
            throw ConfigError("connection.devices: required section is missing");
        }
        cfg.trigger = required_device(devices, "connection.devices", "trigger");
        cfg.value = required_device(devices, "connection.devices", "value");
        cfg.row_count = required_device(devices, "connection.devices", "row_count");

        auto codes{ child(node, PATH, "codes") };
        if (!codes.IsDefined()) {
            throw ConfigError("connection.codes: required section is missing");
        }
        cfg.codes.request = required_word(codes, "connection.codes", "request");
        cfg.codes.success = required_word(codes, "connection.codes", "success");
        cfg.codes.error = required_word(codes, "connection.codes", "error");

        cfg.timeout = duration_field(node, PATH, "timeout_ms", cfg.timeout);
        cfg.value_scale =
          in_range<int32_t>(optional_field<int64_t>(node, PATH, "value_scale", cfg.value_scale), PATH, "value_scale");

        auto route{ child(node, PATH, "route") };
        cfg.route.network = in_range<uint8_t>(optional_field<int64_t>(route, "connection.route", "network", cfg.route.network),
                                              "connection.route", "network");
        cfg.route.pc =
          in_range<uint8_t>(optional_field<int64_t>(route, "connection.route", "pc", cfg.route.pc), "connection.route", "pc");
        cfg.route.moduleIo = in_range<uint16_t>(
          optional_field<int64_t>(route, "connection.route", "module_io", cfg.route.moduleIo), "connection.route", "module_io");
        cfg.route.station = in_range<uint8_t>(optional_field<int64_t>(route, "connection.route", "station", cfg.route.station),
                                              "connection.route", "station");
        return cfg;
    }

    auto parse_top(const YAML::Node& node) -> tcheck::config::TopVisionConfig
    {
        static constexpr std::string_view PATH{ "vision.top" };

        tcheck::config::TopVisionConfig cfg{};
        cfg.confidence = optional_field(node, PATH, "confidence", cfg.confidence);
        cfg.calibration_confidence = optional_field(node, PATH, "calibration_confidence", cfg.calibration_confidence);
        cfg.fault_classes = optional_field(node, PATH, "fault_classes", cfg.fault_classes);
        cfg.occupied_class = optional_field(node, PATH, "occupied_class", cfg.occupied_class);
        cfg.empty_class = optional_field(node, PATH, "empty_class", cfg.empty_class);
        cfg.column_count = optional_field(node, PATH, "column_count", cfg.column_count);
        cfg.column_tolerance_px = optional_field(node, PATH, "column_tolerance_px", cfg.column_tolerance_px);
        cfg.correction_limit_px = optional_field(node, PATH, "correction_limit_px", cfg.correction_limit_px);
        return cfg;
    }

    auto parse_side(const YAML::Node& node) -> tcheck::config::SideVisionConfig
    {
        static constexpr std::string_view PATH{ "vision.side" };

        tcheck::config::SideVisionConfig cfg{};
        cfg.confidence = optional_field(node, PATH, "confidence", cfg.confidence);
        cfg.anomaly_classes = optional_field(node, PATH, "anomaly_classes", cfg.anomaly_classes);
        cfg.reference_class = optional_field(node, PATH, "reference_class", cfg.reference_class);
        cfg.edge_class = optional_field(node, PATH, "edge_class", cfg.edge_class);
        cfg.mid_class = optional_field(node, PATH, "mid_class", cfg.mid_class);
        cfg.real_distance_mm = optional_field(node, PATH, "real_distance_mm", cfg.real_distance_mm);
        cfg.zero_offset_px = optional_field(node, PATH, "zero_offset_px", cfg.zero_offset_px);
        return cfg;
    }

    auto parse_output(const YAML::Node& node) -> tcheck::config::OutputConfig
    {
        static constexpr std::string_view PATH{ "vision.output" };

        tcheck::config::OutputConfig cfg{};
        auto source{ optional_field<std::string>(node, PATH, "deviation_source", "side_depth") };
        if (source == "side_depth") {
            cfg.deviation_source = tcheck::model::DeviationSource::SideDepth;
        } else if (source == "top_lateral") {
            cfg.deviation_source = tcheck::model::DeviationSource::TopLateral;
        } else {
            throw ConfigError(std::format("vision.output.deviation_source: unknown source '{}'", source));
        }
        cfg.mm_per_pixel = optional_field(node, PATH, "mm_per_pixel", cfg.mm_per_pixel);
        cfg.max_valid_correction_mm = optional_field(node, PATH, "max_valid_correction_mm", cfg.max_valid_correction_mm);
        return cfg;
    }

    auto parse_level(const YAML::Node& node) -> mclink::log::Level
    {
        auto name{ optional_field<std::string>(node, "logging", "level", "info") };
        auto level{ magic_enum::enum_cast<mclink::log::Level>(name, magic_enum::case_insensitive) };
        if (!level) {
            throw ConfigError(std::format("logging.level: unknown level '{}'", name));
        }
        return *level;
    }

    auto check_fraction(double value, std::string_view key) -> void
    {
        if (!(value >= 0.0 && value <= 1.0)) {
            throw ConfigError(std::format("{}: {} is not within [0, 1]", key, value));
        }
    }

    auto check_non_negative(double value, std::string_view key) -> void
    {
        if (!(value >= 0.0)) {
            throw ConfigError(std::format("{}: must not be negative", key));
        }
    }

    auto validate(const tcheck::config::StationConfig& cfg) -> void
    {
        const auto& codes{ cfg.connection.codes };
        if (codes.request == 0) {
            throw ConfigError("connection.codes.request: 0 is the idle trigger value");
        }
        if (codes.request == codes.success || codes.request == codes.error || codes.success == codes.error) {
            throw ConfigError(std::format("connection.codes: request {}, success {} and error {} must differ",
                                          codes.request,
                                          codes.success,
                                          codes.error));
        }
        if (cfg.connection.host.empty()) {
            throw ConfigError("connection.host: must not be empty");
        }
        if (cfg.connection.timeout.count() <= 0) {
            throw ConfigError("connection.timeout_ms: must be positive");
        }
        if (cfg.connection.value_scale <= 0) {
            throw ConfigError("connection.value_scale: must be positive");
        }

        const auto& top{ cfg.vision.top };
        check_fraction(top.confidence, "vision.top.confidence");
        check_fraction(top.calibration_confidence, "vision.top.calibration_confidence");
        if (top.column_count < 1) {
            throw ConfigError("vision.top.column_count: at least one column is required");
        }
        check_non_negative(top.column_tolerance_px, "vision.top.column_tolerance_px");
        check_non_negative(top.correction_limit_px, "vision.top.correction_limit_px");
        if (top.occupied_class == top.empty_class) {
            throw ConfigError("vision.top: occupied_class and empty_class must differ");
        }

        const auto& side{ cfg.vision.side };
        check_fraction(side.confidence, "vision.side.confidence");
        check_non_negative(side.real_distance_mm, "vision.side.real_distance_mm");

        const auto& output{ cfg.vision.output };
        check_non_negative(output.mm_per_pixel, "vision.output.mm_per_pixel");
        check_non_negative(output.max_valid_correction_mm, "vision.output.max_valid_correction_mm");

        if (cfg.system.recalibrate_every < 0) {
            throw ConfigError("system.recalibrate_every: must not be negative");
        }
    }
}

namespace tcheck::config
{
    auto parse_config(const YAML::Node& root) -> StationConfig
    {
        if (!root.IsMap()) {
            throw ConfigError("configuration root must be a mapping");
        }

        StationConfig cfg{};
        cfg.connection = parse_connection(root["connection"]);

        auto vision{ root["vision"] };
        if (vision.IsDefined() && !vision.IsNull()) {
            cfg.vision.top = parse_top(child(vision, "vision", "top"));
            cfg.vision.side = parse_side(child(vision, "vision", "side"));
            cfg.vision.output = parse_output(child(vision, "vision", "output"));
        }

        auto timing{ root["timing"] };
        cfg.timing.poll_delay = duration_field(timing, "timing", "poll_delay_ms", cfg.timing.poll_delay);
        cfg.timing.post_process_delay =
          duration_field(timing, "timing", "post_process_delay_ms", cfg.timing.post_process_delay);
        cfg.timing.simulation_delay = duration_field(timing, "timing", "simulation_delay_ms", cfg.timing.simulation_delay);

        auto system{ root["system"] };
        cfg.system.simulation = optional_field(system, "system", "simulation", cfg.system.simulation);
        cfg.system.recalibrate_every = optional_field(system, "system", "recalibrate_every", cfg.system.recalibrate_every);

        auto logging{ root["logging"] };
        cfg.logging.file = optional_field<std::string>(logging, "logging", "file", "");
        cfg.logging.level = parse_level(logging);

        auto replay{ root["replay"] };
        cfg.replay.recording = optional_field<std::string>(replay, "replay", "recording", "");

        validate(cfg);
        return cfg;
    }

    auto parse_config(std::string_view yaml) -> StationConfig
    {
        YAML::Node root;
        try {
            root = YAML::Load(std::string(yaml));
        } catch (const YAML::Exception& ex) {
            throw ConfigError(std::format("configuration is not valid YAML: {}", ex.what()));
        }
        return parse_config(root);
    }

    auto load_config(const std::filesystem::path& path) -> StationConfig
    {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path.string());
        } catch (const YAML::BadFile&) {
            throw ConfigError(std::format("{}: cannot open configuration file", path.string()));
        } catch (const YAML::Exception& ex) {
            throw ConfigError(std::format("{}: {}", path.string(), ex.what()));
        }

        auto cfg{ parse_config(root) };
        // recordings are looked up next to the station file
        if (!cfg.replay.recording.empty() && cfg.replay.recording.is_relative()) {
            cfg.replay.recording = path.parent_path() / cfg.replay.recording;
        }
        return cfg;
    }
}
