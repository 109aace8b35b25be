#pragma once

#include "../config/Config.hpp"
#include "../model/Detection.hpp"
#include "../model/Inspection.hpp"
#include "CalibrationEngine.hpp"

namespace tcheck::vision
{
    /**
     * Column occupancy and lateral alignment from the top camera.
     *
     * Markers are keyed by their pixel X. An occupied and an empty marker on
     * the same X count as occupied, whatever order the model reports them in.
     */
    class TopInterpreter
    {
    public:
        TopInterpreter(config::TopVisionConfig config, const CalibrationEngine& calibration);

        model::TopResult interpret(const model::Detections& detections) const;

    private:
        config::TopVisionConfig m_config;
        const CalibrationEngine& m_calibration;
    };
}
