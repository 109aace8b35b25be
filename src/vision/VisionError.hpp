#pragma once

#include <system_error>

namespace tcheck::vision
{
    enum class VisionError
    {
        None = 0,
        InsufficientMarkers, // fewer than two column markers in the calibration frame
        DegenerateSpacing,   // markers too close together to derive a column pitch
        NotCalibrated
    };

    auto vision_category() noexcept -> const std::error_category&;
    auto make_error_code(VisionError e) noexcept -> std::error_code;
}

namespace std
{
    template<>
    struct is_error_code_enum<tcheck::vision::VisionError> : true_type
    {
    };
}
