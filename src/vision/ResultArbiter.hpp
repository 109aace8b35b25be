#pragma once

#include "../config/Config.hpp"
#include "../model/Inspection.hpp"

#include <concepts>
#include <functional>
#include <type_traits>

namespace tcheck::vision
{
    /**
     * Merges both camera results into the outcome sent to the controller.
     * A side stop wins over everything and the top analysis is not run.
     */
    class ResultArbiter
    {
    public:
        explicit ResultArbiter(config::OutputConfig config)
            : m_config(config)
        {
        }

        template<std::invocable RunTop>
            requires std::same_as<std::invoke_result_t<RunTop>, model::TopResult>
        model::InspectionOutcome arbitrate(const model::SideResult& side, RunTop&& run_top) const
        {
            if (side.stop) {
                return { .code = model::OutcomeCode::SafetyStop,
                         .success = false,
                         .row_count = 0,
                         .deviation_mm = 0.0,
                         .lateral_correction_px = 0,
                         .depth_correction_centi_mm = 0,
                         .top_diagnostic = "skipped",
                         .side_diagnostic = side.diagnostic };
            }
            return merge(side, std::invoke(std::forward<RunTop>(run_top)));
        }

        model::InspectionOutcome arbitrate(const model::SideResult& side, const model::TopResult& top) const
        {
            return arbitrate(side, [&top] { return top; });
        }

        double deviation_mm(const model::SideResult& side, const model::TopResult& top) const
        {
            if (m_config.deviation_source == model::DeviationSource::TopLateral) {
                return top.lateral_correction_px * m_config.mm_per_pixel;
            }
            return side.depth_correction_centi_mm / 100.0;
        }

    private:
        model::InspectionOutcome merge(const model::SideResult& side, const model::TopResult& top) const
        {
            return { .code = top.quality_fault ? model::OutcomeCode::QualityFault : model::OutcomeCode::Ok,
                     .success = true,
                     .row_count = top.row_count,
                     .deviation_mm = deviation_mm(side, top),
                     .lateral_correction_px = top.lateral_correction_px,
                     .depth_correction_centi_mm = side.depth_correction_centi_mm,
                     .top_diagnostic = top.diagnostic,
                     .side_diagnostic = side.diagnostic };
        }

        config::OutputConfig m_config;
    };
}
