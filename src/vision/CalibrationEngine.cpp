#include "CalibrationEngine.hpp"

#include "mclink/log/Logger.hpp"

#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <iterator>
#include <limits>
#include <string>

namespace
{
    class VisionErrorCategory : public std::error_category
    {
    public:
        const char* name() const noexcept override { return "VisionError"; }

        std::string message(int ev) const override
        {
            return std::string(magic_enum::enum_name(static_cast<tcheck::vision::VisionError>(ev)));
        }
    };
}

namespace tcheck::vision
{
    namespace log = mclink::log;

    auto vision_category() noexcept -> const std::error_category&
    {
        static VisionErrorCategory instance;
        return instance;
    }

    auto make_error_code(VisionError e) noexcept -> std::error_code
    {
        return std::error_code(static_cast<int>(e), vision_category());
    }

    CalibrationEngine::CalibrationEngine(config::TopVisionConfig config)
        : m_config(std::move(config))
    {
    }

    auto CalibrationEngine::calibrate(const model::Detections& detections) -> mclink::Result<ColumnCalibration>
    {
        std::vector<int> markers;
        for (const auto& det : detections) {
            if (det.confidence < m_config.calibration_confidence) {
                continue;
            }
            if (det.label == m_config.occupied_class || det.label == m_config.empty_class) {
                markers.push_back(det.box.center_x());
            }
        }

        if (markers.size() < 2) {
            log::warning("Calibration: {} column marker(s) found, at least 2 required", markers.size());
            m_calibration.reset();
            return std::unexpected(make_error_code(VisionError::InsufficientMarkers));
        }

        std::ranges::sort(markers);

        // mean of the consecutive deltas of the sorted markers
        auto spacing{ static_cast<double>(markers.back() - markers.front()) / static_cast<double>(markers.size() - 1) };
        if (spacing < 1.0) {
            log::warning("Calibration: {} markers collapse onto x={}", markers.size(), markers.front());
            m_calibration.reset();
            return std::unexpected(make_error_code(VisionError::DegenerateSpacing));
        }

        ColumnCalibration calibration{ .centers = {}, .spacing_px = spacing };
        calibration.centers.reserve(static_cast<size_t>(m_config.column_count));
        for (auto i{ 0 }; i < m_config.column_count; ++i) {
            calibration.centers.push_back(static_cast<int>(markers.front() + i * spacing));
        }

        std::string centers;
        for (auto center : calibration.centers) {
            std::format_to(std::back_inserter(centers), "{}{}", centers.empty() ? "" : " ", center);
        }
        log::info("Calibration: {} markers, spacing {:.1f} px, centers [{}]", markers.size(), spacing, centers);
        m_calibration = calibration;
        return calibration;
    }

    auto CalibrationEngine::nearest_column(int x) const -> mclink::Result<ColumnMatch>
    {
        if (!m_calibration) {
            return std::unexpected(make_error_code(VisionError::NotCalibrated));
        }

        ColumnMatch best{ .column = 0, .center_x = 0, .distance_px = std::numeric_limits<int>::max() };
        for (auto i{ 0 }; i < m_calibration->column_count(); ++i) {
            auto center{ m_calibration->centers[static_cast<size_t>(i)] };
            auto distance{ std::abs(x - center) };
            if (distance < best.distance_px) {
                best = { .column = i + 1, .center_x = center, .distance_px = distance };
            }
        }
        return best;
    }
}
