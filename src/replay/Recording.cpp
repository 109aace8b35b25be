#include "Recording.hpp"

#include "../config/Config.hpp"

#include "mclink/log/Logger.hpp"

#include <yaml-cpp/yaml.h>

#include <format>
#include <string>

namespace
{
    using tcheck::config::ConfigError;

    auto parse_detection(const YAML::Node& node, size_t frame) -> tcheck::model::Detection
    {
        auto box{ node["box"] };
        if (!box.IsSequence() || box.size() != 4) {
            throw ConfigError(std::format("recording frame {}: box must be [x1, y1, x2, y2]", frame));
        }

        tcheck::model::Detection det{};
        det.label = node["label"].as<std::string>();
        det.box = { .x1 = box[0].as<double>(), .y1 = box[1].as<double>(), .x2 = box[2].as<double>(), .y2 = box[3].as<double>() };
        det.confidence = node["confidence"] ? node["confidence"].as<double>() : 1.0;
        return det;
    }

    auto parse_shot(const YAML::Node& node, size_t frame) -> tcheck::replay::Shot
    {
        tcheck::replay::Shot shot{};
        if (!node) {
            return shot;
        }
        shot.width = node["width"] ? node["width"].as<int>() : 0;
        shot.height = node["height"] ? node["height"].as<int>() : 0;
        for (const auto& det : node["detections"]) {
            shot.detections.push_back(parse_detection(det, frame));
        }
        return shot;
    }

    auto parse(const YAML::Node& root) -> std::shared_ptr<const tcheck::replay::Recording>
    {
        auto frames{ root["frames"] };
        if (!frames.IsSequence() || frames.size() == 0) {
            throw ConfigError("recording: 'frames' must be a non-empty list");
        }

        auto recording{ std::make_shared<tcheck::replay::Recording>() };
        recording->frames.reserve(frames.size());
        for (auto i{ 0uz }; i < frames.size(); ++i) {
            recording->frames.push_back({ .top = parse_shot(frames[i]["top"], i), .side = parse_shot(frames[i]["side"], i) });
        }
        return recording;
    }
}

namespace tcheck::replay
{
    auto parse_recording(std::string_view yaml) -> std::shared_ptr<const Recording>
    {
        try {
            return parse(YAML::Load(std::string(yaml)));
        } catch (const YAML::Exception& ex) {
            throw ConfigError(std::format("recording: {}", ex.what()));
        }
    }

    auto load_recording(const std::filesystem::path& path) -> std::shared_ptr<const Recording>
    {
        try {
            auto recording{ parse(YAML::LoadFile(path.string())) };
            mclink::log::info("Replay: {} frames from {}", recording->frames.size(), path.string());
            return recording;
        } catch (const YAML::Exception& ex) {
            throw ConfigError(std::format("{}: {}", path.string(), ex.what()));
        }
    }

    ReplayCamera::ReplayCamera(std::shared_ptr<const Recording> recording, View view)
        : m_recording(std::move(recording))
        , m_view(view)
    {
    }

    auto ReplayCamera::grab() -> mclink::Result<model::Frame>
    {
        auto sequence{ m_next++ };
        if (sequence > 0 && sequence % m_recording->frames.size() == 0) {
            mclink::log::debug("Replay: {} camera rewinds", m_view);
        }

        const auto& shot{ m_recording->shot(sequence, m_view) };
        return model::Frame{ .sequence = sequence, .width = shot.width, .height = shot.height, .pixels = {} };
    }

    ReplayDetector::ReplayDetector(std::shared_ptr<const Recording> recording, View view)
        : m_recording(std::move(recording))
        , m_view(view)
    {
    }

    auto ReplayDetector::infer(const model::Frame& frame) -> mclink::Result<model::Detections>
    {
        return m_recording->shot(frame.sequence, m_view).detections;
    }
}
