#include "TopInterpreter.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <map>
#include <ranges>

namespace
{
    enum class Slot
    {
        Empty,
        Occupied
    };
}

namespace tcheck::vision
{
    TopInterpreter::TopInterpreter(config::TopVisionConfig config, const CalibrationEngine& calibration)
        : m_config(std::move(config))
        , m_calibration(calibration)
    {
    }

    model::TopResult TopInterpreter::interpret(const model::Detections& detections) const
    {
        model::TopResult result{};
        auto note = std::back_inserter(result.diagnostic);

        std::map<int, Slot> slots;
        for (const auto& det : detections) {
            if (det.confidence < m_config.confidence) {
                continue;
            }

            if (std::ranges::find(m_config.fault_classes, det.label) != m_config.fault_classes.end()) {
                result.quality_fault = true;
                std::format_to(note, "fault {} ({:.2f}); ", det.label, det.confidence);
            } else if (det.label == m_config.occupied_class) {
                slots[det.box.center_x()] = Slot::Occupied;
            } else if (det.label == m_config.empty_class) {
                slots.try_emplace(det.box.center_x(), Slot::Empty);
            }
        }

        if (!m_calibration.is_calibrated()) {
            result.quality_fault = true;
            std::format_to(note, "columns not calibrated");
            return result;
        }

        result.row_count = static_cast<int>(std::ranges::count(slots | std::views::values, Slot::Occupied));

        auto active{ std::ranges::find(slots, Slot::Occupied, [](const auto& slot) { return slot.second; }) };
        if (active == slots.end()) {
            std::format_to(note, "no occupied column, {} empty", slots.size());
            return result;
        }

        auto active_x{ active->first };
        auto match{ m_calibration.nearest_column(active_x) };
        if (!match) {
            result.quality_fault = true;
            std::format_to(note, "column lookup failed: {}", match.error().message());
            return result;
        }

        auto offset{ active_x - match->center_x };
        if (match->distance_px > m_config.column_tolerance_px) {
            result.lateral_correction_px = std::clamp(offset, -m_config.correction_limit_px, m_config.correction_limit_px);
            result.quality_fault = true;
            std::format_to(note,
                           "rows {}, column {} at x={} off by {} px (ideal {}), correction {} px",
                           result.row_count,
                           match->column,
                           active_x,
                           offset,
                           match->center_x,
                           result.lateral_correction_px);
        } else {
            std::format_to(note,
                           "rows {}, column {} at x={} within tolerance ({} px)",
                           result.row_count,
                           match->column,
                           active_x,
                           offset);
        }
        return result;
    }
}
