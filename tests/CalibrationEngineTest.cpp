#include "Fakes.hpp"

#include "vision/CalibrationEngine.hpp"

#include <gtest/gtest.h>

using tcheck::config::TopVisionConfig;
using tcheck::test::detection;
using tcheck::vision::CalibrationEngine;
using tcheck::vision::VisionError;

namespace
{
    auto engine(int columns = 8) -> CalibrationEngine
    {
        TopVisionConfig cfg{};
        cfg.column_count = columns;
        return CalibrationEngine(cfg);
    }
}

TEST(CalibrationEngine, ExtrapolatesEvenSpacing)
{
    auto cal{ engine() };
    auto result{ cal.calibrate({ detection("posicion_columna", 250, 100),
                                 detection("posicion_vacia", 100, 100),
                                 detection("posicion_columna", 200, 100),
                                 detection("posicion_vacia", 150, 100) }) };

    ASSERT_TRUE(result);
    EXPECT_DOUBLE_EQ(result->spacing_px, 50.0);
    EXPECT_EQ(result->centers, (std::vector<int>{ 100, 150, 200, 250, 300, 350, 400, 450 }));
    EXPECT_EQ(result->center(1), 100);
    EXPECT_TRUE(cal.is_calibrated());
}

TEST(CalibrationEngine, UsesMeanSpacingOfUnevenMarkers)
{
    auto cal{ engine(4) };
    auto result{ cal.calibrate({ detection("posicion_columna", 100, 0),
                                 detection("posicion_columna", 140, 0),
                                 detection("posicion_vacia", 205, 0) }) };

    ASSERT_TRUE(result);
    EXPECT_DOUBLE_EQ(result->spacing_px, 52.5);
    EXPECT_EQ(result->centers, (std::vector<int>{ 100, 152, 205, 257 }));
}

TEST(CalibrationEngine, IgnoresOtherLabelsAndLowConfidence)
{
    auto cal{ engine() };
    auto result{ cal.calibrate({ detection("posicion_columna", 100, 0),
                                 detection("error_apilado", 300, 0),
                                 detection("posicion_vacia", 500, 0, 0.05) }) };

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), VisionError::InsufficientMarkers);
}

TEST(CalibrationEngine, FailureDiscardsPreviousCalibration)
{
    auto cal{ engine() };
    ASSERT_TRUE(cal.calibrate({ detection("posicion_columna", 100, 0), detection("posicion_columna", 150, 0) }));

    auto result{ cal.calibrate({ detection("posicion_columna", 100, 0) }) };
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), VisionError::InsufficientMarkers);
    EXPECT_FALSE(cal.is_calibrated());
    EXPECT_EQ(cal.nearest_column(100).error(), VisionError::NotCalibrated);
}

TEST(CalibrationEngine, RejectsCoincidentMarkers)
{
    auto cal{ engine() };
    auto result{ cal.calibrate({ detection("posicion_columna", 120, 0), detection("posicion_vacia", 120, 50) }) };

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), VisionError::DegenerateSpacing);
}

TEST(CalibrationEngine, FindsNearestColumn)
{
    auto cal{ engine(3) };
    ASSERT_TRUE(cal.calibrate({ detection("posicion_columna", 100, 0), detection("posicion_columna", 150, 0) }));

    auto match{ cal.nearest_column(180) };
    ASSERT_TRUE(match);
    EXPECT_EQ(match->column, 3);
    EXPECT_EQ(match->center_x, 200);
    EXPECT_EQ(match->distance_px, 20);

    // ties resolve to the lower column
    match = cal.nearest_column(125);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->column, 1);
}
