#include "ResultValidator.hpp"

#include "mclink/log/format.hpp"

#include <cmath>
#include <cstdlib>
#include <format>

namespace tcheck::vision
{
    ResultValidator::ResultValidator(config::OutputConfig output, int column_count, int correction_limit_px)
        : m_output(output)
        , m_column_count(column_count)
        , m_correction_limit_px(correction_limit_px)
    {
    }

    std::vector<std::string> ResultValidator::validate(const model::InspectionOutcome& outcome) const
    {
        std::vector<std::string> warnings;

        if (!outcome.success) {
            warnings.push_back(std::format("outcome {} reported as error", outcome.code));
            return warnings;
        }

        if (std::abs(outcome.deviation_mm) > m_output.max_valid_correction_mm) {
            warnings.push_back(std::format("deviation {:.2f} mm exceeds {:.2f} mm",
                                           outcome.deviation_mm,
                                           m_output.max_valid_correction_mm));
        }
        if (std::abs(outcome.lateral_correction_px) > m_correction_limit_px + 1) {
            warnings.push_back(std::format("lateral correction {} px exceeds limit {} px",
                                           outcome.lateral_correction_px,
                                           m_correction_limit_px));
        }
        if (outcome.row_count < 0 || outcome.row_count > m_column_count) {
            warnings.push_back(std::format("row count {} outside 0..{}", outcome.row_count, m_column_count));
        }
        return warnings;
    }
}
