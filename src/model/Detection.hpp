#pragma once

#include <string>
#include <vector>

namespace tcheck::model
{
    /**
     * Axis aligned box in pixel coordinates, x1 < x2 and y1 < y2.
     */
    struct BoundingBox
    {
        double x1{ 0.0 };
        double y1{ 0.0 };
        double x2{ 0.0 };
        double y2{ 0.0 };

        // midpoints are truncated to whole pixels
        int center_x() const { return static_cast<int>((x1 + x2) / 2.0); }
        int center_y() const { return static_cast<int>((y1 + y2) / 2.0); }
    };

    /**
     * One object reported by the detection model for a frame.
     */
    struct Detection
    {
        std::string label;
        BoundingBox box;
        double confidence{ 0.0 };
    };

    using Detections = std::vector<Detection>;
}
