#pragma once

#include "../config/Config.hpp"
#include "../model/Detection.hpp"
#include "../model/Inspection.hpp"

namespace tcheck::vision
{
    /**
     * Depth correction and safety stop from the side camera.
     *
     * depth [centi-mm] = round(((edge_y - reference_y) - zero_offset) / (|edge_y - mid_y| / real_distance) * 10)
     */
    class SideInterpreter
    {
    public:
        explicit SideInterpreter(config::SideVisionConfig config);

        model::SideResult interpret(const model::Detections& detections, int image_height) const;

    private:
        config::SideVisionConfig m_config;
    };
}
