#pragma once

#include "../config/Config.hpp"
#include "../model/Detection.hpp"
#include "VisionError.hpp"

#include "mclink/Result.hpp"

#include <optional>
#include <vector>

namespace tcheck::vision
{
    /**
     * Ideal pixel X of every column. centers[i] belongs to column i + 1.
     */
    struct ColumnCalibration
    {
        std::vector<int> centers;
        double spacing_px{ 0.0 };

        int column_count() const { return static_cast<int>(centers.size()); }
        int center(int column) const { return centers.at(static_cast<size_t>(column - 1)); }
    };

    struct ColumnMatch
    {
        int column{ 0 };
        int center_x{ 0 };
        int distance_px{ 0 };
    };

    class CalibrationEngine
    {
    public:
        explicit CalibrationEngine(config::TopVisionConfig config);

        /**
         * Derives the column grid from the occupied and empty markers of one
         * top frame. The previous calibration is replaced on success and
         * discarded on failure.
         */
        auto calibrate(const model::Detections& detections) -> mclink::Result<ColumnCalibration>;

        auto nearest_column(int x) const -> mclink::Result<ColumnMatch>;

        bool is_calibrated() const { return m_calibration.has_value(); }
        const std::optional<ColumnCalibration>& calibration() const { return m_calibration; }
        void reset() { m_calibration.reset(); }

    private:
        config::TopVisionConfig m_config;
        std::optional<ColumnCalibration> m_calibration;
    };
}
