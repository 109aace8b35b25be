#pragma once

#include "../model/Detection.hpp"
#include "../model/Frame.hpp"
#include "../station/Camera.hpp"
#include "../vision/Detector.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace tcheck::replay
{
    enum class View
    {
        Top,
        Side
    };

    struct Shot
    {
        int width{ 0 };
        int height{ 0 };
        model::Detections detections;
    };

    struct RecordedFrame
    {
        Shot top;
        Shot side;
    };

    /**
     * Detections recorded per frame for both cameras. Stands in for the
     * video sources and the detection model when the station runs from a
     * recording.
     */
    struct Recording
    {
        std::vector<RecordedFrame> frames;

        const Shot& shot(uint64_t sequence, View view) const
        {
            const auto& frame{ frames[sequence % frames.size()] };
            return view == View::Top ? frame.top : frame.side;
        }
    };

    /** Throws config::ConfigError when the file is unreadable, malformed or empty. */
    auto load_recording(const std::filesystem::path& path) -> std::shared_ptr<const Recording>;
    auto parse_recording(std::string_view yaml) -> std::shared_ptr<const Recording>;

    /** Hands out the recorded frames in order and rewinds at the end. */
    class ReplayCamera : public station::IFrameSource
    {
    public:
        ReplayCamera(std::shared_ptr<const Recording> recording, View view);

        auto grab() -> mclink::Result<model::Frame> override;
        void rewind() override { m_next = 0; }

    private:
        std::shared_ptr<const Recording> m_recording;
        View m_view;
        std::atomic<uint64_t> m_next{ 0 };
    };

    /** Returns what was recorded for the frame's sequence number. */
    class ReplayDetector : public vision::IDetector
    {
    public:
        ReplayDetector(std::shared_ptr<const Recording> recording, View view);

        auto infer(const model::Frame& frame) -> mclink::Result<model::Detections> override;

    private:
        std::shared_ptr<const Recording> m_recording;
        View m_view;
    };
}
