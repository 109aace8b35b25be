#pragma once

#include "config/Config.hpp"
#include "model/Detection.hpp"
#include "station/Camera.hpp"
#include "vision/Detector.hpp"

#include "mclink/Driver.hpp"
#include "mclink/Error.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tcheck::test
{
    inline auto detection(std::string label, double cx, double cy, double confidence = 0.9) -> model::Detection
    {
        return { .label = std::move(label),
                 .box = { .x1 = cx - 10.0, .y1 = cy - 10.0, .x2 = cx + 10.0, .y2 = cy + 10.0 },
                 .confidence = confidence };
    }

    inline auto connection_config() -> config::ConnectionConfig
    {
        config::ConnectionConfig cfg{};
        cfg.host = "127.0.0.1";
        cfg.port = 5007;
        cfg.trigger = { mclink::DeviceType::D, 28 };
        cfg.value = { mclink::DeviceType::D, 29 };
        cfg.row_count = { mclink::DeviceType::D, 14 };
        cfg.codes = { .request = 99, .success = 88, .error = 77 };
        return cfg;
    }

    struct WriteRecord
    {
        mclink::Device head;
        std::vector<uint16_t> words;
    };

    /**
     * In-memory word registers. Writes are recorded in order; a write can
     * be made to fail by its 1-based position.
     */
    class FakeDriver : public mclink::IDriver
    {
    public:
        auto connect(std::chrono::milliseconds) -> mclink::coro::Task<mclink::Result<void>> override
        {
            ++connects;
            if (refuse_connect) {
                co_return std::unexpected(mclink::make_error_code(mclink::McError::ConnectFailed));
            }
            connected = true;
            co_return mclink::success();
        }

        auto disconnect() -> void override
        {
            ++disconnects;
            connected = false;
        }

        auto isConnected() const noexcept -> bool override { return connected; }

        auto readWords(const mclink::Device& head, std::span<uint16_t> dest, std::chrono::milliseconds)
          -> mclink::coro::Task<mclink::Result<void>> override
        {
            ++reads;
            if (!connected) {
                co_return std::unexpected(mclink::make_error_code(mclink::McError::NotConnected));
            }
            if (fail_reads) {
                connected = false;
                co_return std::unexpected(mclink::make_error_code(mclink::McError::Timeout));
            }
            for (auto i{ 0uz }; i < dest.size(); ++i) {
                dest[i] = registers[head.number + static_cast<uint32_t>(i)];
            }
            co_return mclink::success();
        }

        auto writeWords(const mclink::Device& head, std::span<const uint16_t> src, std::chrono::milliseconds)
          -> mclink::coro::Task<mclink::Result<void>> override
        {
            if (!connected) {
                co_return std::unexpected(mclink::make_error_code(mclink::McError::NotConnected));
            }
            ++write_attempts;
            if (fail_write_at && *fail_write_at == write_attempts) {
                connected = false;
                co_return std::unexpected(mclink::make_error_code(mclink::McError::SendFailed));
            }
            writes.push_back({ head, { src.begin(), src.end() } });
            for (auto i{ 0uz }; i < src.size(); ++i) {
                registers[head.number + static_cast<uint32_t>(i)] = src[i];
            }
            co_return mclink::success();
        }

        bool connected{ false };
        bool refuse_connect{ false };
        bool fail_reads{ false };
        std::optional<int> fail_write_at;
        int connects{ 0 };
        int disconnects{ 0 };
        int reads{ 0 };
        int write_attempts{ 0 };
        std::map<uint32_t, uint16_t> registers;
        std::vector<WriteRecord> writes;
    };

    class FakeFrameSource : public station::IFrameSource
    {
    public:
        explicit FakeFrameSource(int height = 480)
            : m_height(height)
        {
        }

        auto grab() -> mclink::Result<model::Frame> override
        {
            ++grabs;
            if (fail) {
                return std::unexpected(std::make_error_code(std::errc::io_error));
            }
            return model::Frame{ .sequence = static_cast<uint64_t>(grabs), .width = 640, .height = m_height, .pixels = {} };
        }

        bool fail{ false };
        int grabs{ 0 };

    private:
        int m_height;
    };

    class FakeDetector : public vision::IDetector
    {
    public:
        explicit FakeDetector(model::Detections detections = {})
            : detections(std::move(detections))
        {
        }

        auto infer(const model::Frame&) -> mclink::Result<model::Detections> override
        {
            ++calls;
            if (fail) {
                return std::unexpected(std::make_error_code(std::errc::io_error));
            }
            return detections;
        }

        model::Detections detections;
        bool fail{ false };
        int calls{ 0 };
    };
}
