#include "SideInterpreter.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <optional>

namespace tcheck::vision
{
    SideInterpreter::SideInterpreter(config::SideVisionConfig config)
        : m_config(std::move(config))
    {
    }

    model::SideResult SideInterpreter::interpret(const model::Detections& detections, int image_height) const
    {
        std::optional<int> reference_y;
        std::optional<int> edge_y;
        std::optional<int> mid_y;

        for (const auto& det : detections) {
            if (det.confidence < m_config.confidence) {
                continue;
            }

            if (std::ranges::find(m_config.anomaly_classes, det.label) != m_config.anomaly_classes.end()) {
                return { .depth_correction_centi_mm = 0,
                         .stop = true,
                         .diagnostic = std::format("critical anomaly {}", det.label) };
            }

            // first occurrence of each landmark wins
            if (det.label == m_config.reference_class && !reference_y) {
                reference_y = det.box.center_y();
            } else if (det.label == m_config.edge_class && !edge_y) {
                edge_y = det.box.center_y();
            } else if (det.label == m_config.mid_class && !mid_y) {
                mid_y = det.box.center_y();
            }
        }

        std::string diagnostic;
        if (!reference_y) {
            reference_y = image_height / 2;
            diagnostic = std::format("reference missing, using image center y={}; ", *reference_y);
        }

        if (!edge_y || !mid_y) {
            diagnostic += "missing landmarks:";
            if (!edge_y) {
                diagnostic += " " + m_config.edge_class;
            }
            if (!mid_y) {
                diagnostic += " " + m_config.mid_class;
            }
            return { .depth_correction_centi_mm = 0, .stop = false, .diagnostic = std::move(diagnostic) };
        }

        if (*edge_y == *mid_y || m_config.real_distance_mm == 0.0) {
            diagnostic += std::format("scale collapse (edge y={}, mid y={}, distance {} mm)",
                                      *edge_y,
                                      *mid_y,
                                      m_config.real_distance_mm);
            return { .depth_correction_centi_mm = 0, .stop = false, .diagnostic = std::move(diagnostic) };
        }

        auto px_per_mm{ std::abs(*edge_y - *mid_y) / m_config.real_distance_mm };
        auto raw_error_px{ (*edge_y - *reference_y) - m_config.zero_offset_px };
        auto scaled{ raw_error_px / px_per_mm * 10.0 };
        auto limited{ std::clamp(scaled,
                                 static_cast<double>(std::numeric_limits<int32_t>::min()),
                                 static_cast<double>(std::numeric_limits<int32_t>::max())) };
        if (limited != scaled) {
            diagnostic += std::format("depth {:.0f} clamped; ", scaled);
        }
        auto depth{ static_cast<int32_t>(std::llround(limited)) };

        diagnostic += std::format("edge y={} ref y={} mid y={}, {:.3f} px/mm, error {:.1f} px, depth {:.2f} mm",
                                  *edge_y,
                                  *reference_y,
                                  *mid_y,
                                  px_per_mm,
                                  raw_error_px,
                                  depth / 100.0);
        return { .depth_correction_centi_mm = depth, .stop = false, .diagnostic = std::move(diagnostic) };
    }
}
