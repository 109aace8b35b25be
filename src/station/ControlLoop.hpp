#pragma once

#include "../config/Config.hpp"
#include "../model/Inspection.hpp"
#include "../plc/ProtocolClient.hpp"
#include "../vision/CalibrationEngine.hpp"
#include "../vision/Detector.hpp"
#include "../vision/ResultArbiter.hpp"
#include "../vision/ResultValidator.hpp"
#include "../vision/SideInterpreter.hpp"
#include "../vision/TopInterpreter.hpp"
#include "Camera.hpp"

#include "mclink/Driver.hpp"
#include "mclink/coroutine/coroutine.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tcheck::station
{
    enum class CycleStatus
    {
        Idle,             // no request pending
        Processed,        // outcome produced and written (or simulated)
        Disconnected,     // controller unreachable, nothing polled
        ConnectivityLost, // trigger poll failed
        FrameError,       // a camera delivered no frame
        InferenceError,   // a detector failed
        WriteFailed       // outcome produced but the write-back failed
    };

    struct CycleReport
    {
        CycleStatus status{ CycleStatus::Idle };
        std::optional<model::InspectionOutcome> outcome;
        std::vector<std::string> warnings;
    };

    struct Cameras
    {
        std::shared_ptr<IFrameSource> top;
        std::shared_ptr<IFrameSource> side;
    };

    struct Detectors
    {
        std::shared_ptr<vision::IDetector> top;
        std::shared_ptr<vision::IDetector> side;
    };

    /**
     * Poll, inspect, write back. One cycle at a time on a single worker;
     * stop() takes effect between cycles, so a started write-back always
     * runs to completion or failure.
     */
    class ControlLoop
    {
    public:
        ControlLoop(const config::StationConfig& config,
                    std::shared_ptr<mclink::IDriver> driver,
                    Cameras cameras,
                    Detectors detectors);
        ~ControlLoop();

        ControlLoop(const ControlLoop&) = delete;
        ControlLoop& operator=(const ControlLoop&) = delete;

        /** Connects (unless simulating), calibrates from the first top frame and rewinds the top source. */
        auto initialize() -> mclink::coro::Task<void>;

        auto run_cycle() -> mclink::coro::Task<CycleReport>;

        /** Cycles until stop() and disconnects afterwards. Stops ex when done. */
        auto run(mclink::coro::IExecutor& ex) -> mclink::coro::Task<void>;

        /** Runs initialize() and run() on a worker thread. Can be started once. */
        void start();
        void stop();
        void wait();
        bool is_running() const { return m_running; }

        const vision::CalibrationEngine& calibration() const { return m_calibration; }
        plc::ProtocolClient& client() { return m_client; }
        uint64_t processed_cycles() const { return m_processed; }

    private:
        auto calibrate_from(const model::Detections& detections) -> bool;
        auto delay_after(CycleStatus status) const -> std::chrono::milliseconds;
        void log_report(const CycleReport& report) const;

        config::StationConfig m_config;
        plc::ProtocolClient m_client;
        Cameras m_cameras;
        Detectors m_detectors;

        vision::CalibrationEngine m_calibration;
        vision::TopInterpreter m_top;
        vision::SideInterpreter m_side;
        vision::ResultArbiter m_arbiter;
        vision::ResultValidator m_validator;

        std::atomic<bool> m_running{ false };
        std::atomic<bool> m_started{ false };
        std::atomic<uint64_t> m_processed{ 0 };
        mclink::coro::Context m_ctx;
        std::jthread m_thread;
    };
}
