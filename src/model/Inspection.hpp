#pragma once

#include <cstdint>
#include <string>

namespace tcheck::model
{
    /**
     * Trigger register as seen by the station. Values that match none of
     * the configured codes read as Idle.
     */
    enum class TriggerState
    {
        Idle,
        RequestPending,
        LastSuccess,
        LastError
    };

    enum class OutcomeCode
    {
        Ok,
        QualityFault,
        SafetyStop
    };

    enum class DeviationSource
    {
        SideDepth,  // side depth correction, centi-mm / 100
        TopLateral  // top lateral correction, px * mm_per_pixel
    };

    struct TopResult
    {
        int row_count{ 0 };
        int lateral_correction_px{ 0 };
        bool quality_fault{ false };
        std::string diagnostic;
    };

    struct SideResult
    {
        int32_t depth_correction_centi_mm{ 0 };
        bool stop{ false };
        std::string diagnostic;
    };

    /**
     * Result of one inspection cycle. The first four members are what the
     * controller receives; the rest is the operator record.
     */
    struct InspectionOutcome
    {
        OutcomeCode code{ OutcomeCode::Ok };
        bool success{ true };
        int row_count{ 0 };
        double deviation_mm{ 0.0 };

        int lateral_correction_px{ 0 };
        int32_t depth_correction_centi_mm{ 0 };
        std::string top_diagnostic;
        std::string side_diagnostic;
    };
}
