#include "vision/ResultArbiter.hpp"
#include "vision/ResultValidator.hpp"

#include <gtest/gtest.h>

using tcheck::config::OutputConfig;
using tcheck::model::DeviationSource;
using tcheck::model::InspectionOutcome;
using tcheck::model::OutcomeCode;
using tcheck::model::SideResult;
using tcheck::model::TopResult;
using tcheck::vision::ResultArbiter;
using tcheck::vision::ResultValidator;

TEST(ResultArbiter, StopSkipsTopAnalysis)
{
    ResultArbiter arbiter{ OutputConfig{} };
    auto top_runs{ 0 };

    auto outcome{ arbiter.arbitrate(SideResult{ .depth_correction_centi_mm = 0, .stop = true, .diagnostic = "fallen" },
                                    [&top_runs] {
                                        ++top_runs;
                                        return TopResult{ .row_count = 3 };
                                    }) };

    EXPECT_EQ(top_runs, 0);
    EXPECT_EQ(outcome.code, OutcomeCode::SafetyStop);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.row_count, 0);
    EXPECT_DOUBLE_EQ(outcome.deviation_mm, 0.0);
    EXPECT_EQ(outcome.side_diagnostic, "fallen");
}

TEST(ResultArbiter, MergesSideDepthAndTopRows)
{
    ResultArbiter arbiter{ OutputConfig{} };

    auto outcome{ arbiter.arbitrate(SideResult{ .depth_correction_centi_mm = 250 },
                                    TopResult{ .row_count = 3, .lateral_correction_px = 12 }) };

    EXPECT_EQ(outcome.code, OutcomeCode::Ok);
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.row_count, 3);
    EXPECT_DOUBLE_EQ(outcome.deviation_mm, 2.5);
    EXPECT_EQ(outcome.lateral_correction_px, 12);
}

TEST(ResultArbiter, QualityFaultStillSucceeds)
{
    ResultArbiter arbiter{ OutputConfig{} };

    auto outcome{ arbiter.arbitrate(SideResult{ .depth_correction_centi_mm = -125 },
                                    TopResult{ .row_count = 1, .lateral_correction_px = 50, .quality_fault = true }) };

    EXPECT_EQ(outcome.code, OutcomeCode::QualityFault);
    EXPECT_TRUE(outcome.success);
    EXPECT_DOUBLE_EQ(outcome.deviation_mm, -1.25);
}

TEST(ResultArbiter, LateralDeviationSource)
{
    OutputConfig cfg{};
    cfg.deviation_source = DeviationSource::TopLateral;
    cfg.mm_per_pixel = 0.5;
    ResultArbiter arbiter{ cfg };

    auto outcome{ arbiter.arbitrate(SideResult{ .depth_correction_centi_mm = 250 },
                                    TopResult{ .row_count = 2, .lateral_correction_px = -30 }) };

    EXPECT_DOUBLE_EQ(outcome.deviation_mm, -15.0);
}

TEST(ResultValidator, AcceptsPlausibleOutcome)
{
    ResultValidator validator{ OutputConfig{}, 8, 50 };

    auto warnings{ validator.validate(InspectionOutcome{ .row_count = 3, .deviation_mm = 2.5 }) };
    EXPECT_TRUE(warnings.empty());
}

TEST(ResultValidator, FlagsImplausibleValues)
{
    ResultValidator validator{ OutputConfig{}, 8, 50 };

    auto warnings{ validator.validate(
      InspectionOutcome{ .row_count = 9, .deviation_mm = -60.0, .lateral_correction_px = 52 }) };
    EXPECT_EQ(warnings.size(), 3u);
}

TEST(ResultValidator, ReportsErrorOutcome)
{
    ResultValidator validator{ OutputConfig{}, 8, 50 };

    auto warnings{ validator.validate(InspectionOutcome{ .code = OutcomeCode::SafetyStop, .success = false }) };
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("SafetyStop"), std::string::npos);
}
