#include "ControlLoop.hpp"

#include "mclink/log/Logger.hpp"

#include <chrono>
#include <exception>

namespace tcheck::station
{
    namespace log = mclink::log;

    ControlLoop::ControlLoop(const config::StationConfig& config,
                             std::shared_ptr<mclink::IDriver> driver,
                             Cameras cameras,
                             Detectors detectors)
        : m_config(config)
        , m_client(std::move(driver), config.connection)
        , m_cameras(std::move(cameras))
        , m_detectors(std::move(detectors))
        , m_calibration(config.vision.top)
        , m_top(config.vision.top, m_calibration)
        , m_side(config.vision.side)
        , m_arbiter(config.vision.output)
        , m_validator(config.vision.output, config.vision.top.column_count, config.vision.top.correction_limit_px)
    {
    }

    ControlLoop::~ControlLoop()
    {
        stop();
        wait();
    }

    auto ControlLoop::initialize() -> mclink::coro::Task<void>
    {
        if (m_config.system.simulation) {
            log::warning("Station: simulation mode, the controller is not contacted");
        } else if (auto connected{ co_await m_client.connect() }; !connected) {
            log::warning("Station: controller not reachable yet, retrying every {} ms", m_config.timing.poll_delay.count());
        } else if (auto status{ co_await m_client.read_status() }; status) {
            log::info("Station: trigger {} ({}), rows {}",
                      status->raw_trigger,
                      plc::ProtocolClient::describe(status->trigger),
                      status->row_count);
        }

        auto frame{ m_cameras.top->grab() };
        if (!frame) {
            log::warning("Station: no top frame for the initial calibration: {}", frame.error().message());
            co_return;
        }
        // keeps the top source in step with the side source
        m_cameras.top->rewind();

        auto detections{ m_detectors.top->infer(*frame) };
        if (!detections) {
            log::warning("Station: initial calibration inference failed: {}", detections.error().message());
            co_return;
        }
        if (!calibrate_from(*detections)) {
            log::warning("Station: starting uncalibrated, the next top frame will be used");
        }
    }

    auto ControlLoop::run_cycle() -> mclink::coro::Task<CycleReport>
    {
        CycleReport report{};

        if (!m_config.system.simulation) {
            if (!m_client.is_connected()) {
                if (auto connected{ co_await m_client.connect() }; !connected) {
                    report.status = CycleStatus::Disconnected;
                    co_return report;
                }
            }

            auto trigger{ co_await m_client.read_trigger() };
            if (!trigger) {
                report.status = CycleStatus::ConnectivityLost;
                co_return report;
            }
            if (*trigger != model::TriggerState::RequestPending) {
                report.status = CycleStatus::Idle;
                co_return report;
            }
            log::info("Station: inspection requested");
        }

        auto top_frame{ m_cameras.top->grab() };
        auto side_frame{ m_cameras.side->grab() };
        if (!top_frame || !side_frame) {
            log::error("Station: frame acquisition failed: {}",
                       (!top_frame ? top_frame.error() : side_frame.error()).message());
            report.status = CycleStatus::FrameError;
            co_return report;
        }

        auto side_detections{ m_detectors.side->infer(*side_frame) };
        if (!side_detections) {
            log::error("Station: side inference failed: {}", side_detections.error().message());
            report.status = CycleStatus::InferenceError;
            co_return report;
        }
        auto side{ m_side.interpret(*side_detections, side_frame->height) };

        std::optional<std::error_code> top_error;
        auto outcome{ m_arbiter.arbitrate(side, [&]() -> model::TopResult {
            auto detections{ m_detectors.top->infer(*top_frame) };
            if (!detections) {
                top_error = detections.error();
                return {};
            }

            auto every{ m_config.system.recalibrate_every };
            auto due{ every > 0 && m_processed > 0 && m_processed % static_cast<uint64_t>(every) == 0 };
            if (!m_calibration.is_calibrated() || due) {
                calibrate_from(*detections);
            }
            return m_top.interpret(*detections);
        }) };

        if (top_error) {
            log::error("Station: top inference failed: {}", top_error->message());
            report.status = CycleStatus::InferenceError;
            co_return report;
        }

        report.warnings = m_validator.validate(outcome);
        report.outcome = std::move(outcome);
        ++m_processed;

        if (m_config.system.simulation) {
            report.status = CycleStatus::Processed;
            log_report(report);
            co_return report;
        }

        auto written{ co_await m_client.write_result(
          report.outcome->deviation_mm, report.outcome->row_count, report.outcome->success) };
        report.status = written ? CycleStatus::Processed : CycleStatus::WriteFailed;
        log_report(report);
        co_return report;
    }

    auto ControlLoop::run(mclink::coro::IExecutor& ex) -> mclink::coro::Task<void>
    {
        log::info("Station: control loop started");
        co_await initialize();

        while (m_running) {
            auto status{ CycleStatus::Idle };
            try {
                auto report{ co_await run_cycle() };
                status = report.status;
            } catch (const std::exception& e) {
                log::error("Station: cycle aborted: {}", e.what());
                status = CycleStatus::FrameError;
            }

            if (m_running) {
                std::this_thread::sleep_for(delay_after(status));
            }
        }

        m_client.disconnect();
        log::info("Station: control loop stopped after {} inspections", m_processed.load());
        ex.stop();
    }

    void ControlLoop::start()
    {
        if (m_started.exchange(true)) {
            return;
        }

        m_running = true;
        m_thread = std::jthread([this] {
            mclink::coro::co_spawn(m_ctx, [this](mclink::coro::IExecutor& ex) -> mclink::coro::Task<void> {
                return run(ex);
            });
            m_ctx.run();
        });
    }

    void ControlLoop::stop()
    {
        m_running = false;
    }

    void ControlLoop::wait()
    {
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    auto ControlLoop::calibrate_from(const model::Detections& detections) -> bool
    {
        auto calibration{ m_calibration.calibrate(detections) };
        if (!calibration) {
            log::warning("Station: calibration failed: {}", calibration.error().message());
            return false;
        }
        return true;
    }

    auto ControlLoop::delay_after(CycleStatus status) const -> std::chrono::milliseconds
    {
        if (m_config.system.simulation) {
            return m_config.timing.simulation_delay;
        }
        switch (status) {
            case CycleStatus::Processed:
            case CycleStatus::WriteFailed:
                return m_config.timing.post_process_delay;
            default:
                return m_config.timing.poll_delay;
        }
    }

    void ControlLoop::log_report(const CycleReport& report) const
    {
        const auto& outcome{ *report.outcome };

        // clang-format off
        switch (outcome.code) {
            case model::OutcomeCode::SafetyStop:
                log::error("==================== SAFETY STOP ====================");
                log::error("side: {}", outcome.side_diagnostic);
                break;
            case model::OutcomeCode::QualityFault:
                log::warning("------------------- QUALITY FAULT -------------------");
                log::warning("top: {}", outcome.top_diagnostic);
                log::warning("side: {}", outcome.side_diagnostic);
                break;
            case model::OutcomeCode::Ok:
                log::info("------------------------ OK -------------------------");
                log::info("top: {}", outcome.top_diagnostic);
                log::info("side: {}", outcome.side_diagnostic);
                break;
        }
        // clang-format on

        log::info("result: {} success={} rows={} deviation={:.2f} mm lateral={} px depth={} centi-mm -> {}",
                  outcome.code,
                  outcome.success,
                  outcome.row_count,
                  outcome.deviation_mm,
                  outcome.lateral_correction_px,
                  outcome.depth_correction_centi_mm,
                  report.status);
        for (const auto& warning : report.warnings) {
            log::warning("check: {}", warning);
        }
        log::debug("record: {}", outcome);
    }
}
