#pragma once

#include "../config/Config.hpp"
#include "../model/Inspection.hpp"

#include <string>
#include <vector>

namespace tcheck::vision
{
    /**
     * Plausibility checks before a result goes out. Warnings only, the
     * result is written regardless.
     */
    class ResultValidator
    {
    public:
        ResultValidator(config::OutputConfig output, int column_count, int correction_limit_px);

        std::vector<std::string> validate(const model::InspectionOutcome& outcome) const;

    private:
        config::OutputConfig m_output;
        int m_column_count;
        int m_correction_limit_px;
    };
}
