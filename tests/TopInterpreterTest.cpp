#include "Fakes.hpp"

#include "vision/CalibrationEngine.hpp"
#include "vision/TopInterpreter.hpp"

#include <gtest/gtest.h>

using tcheck::config::TopVisionConfig;
using tcheck::test::detection;
using tcheck::vision::CalibrationEngine;
using tcheck::vision::TopInterpreter;

namespace
{
    class TopInterpreterTest : public ::testing::Test
    {
    protected:
        TopInterpreterTest()
            : calibration(config())
            , interpreter(config(), calibration)
        {
        }

        static auto config() -> TopVisionConfig
        {
            TopVisionConfig cfg{};
            cfg.column_count = 2;
            return cfg;
        }

        void calibrate()
        {
            ASSERT_TRUE(calibration.calibrate({ detection("posicion_columna", 100, 0), detection("posicion_vacia", 150, 0) }));
        }

        CalibrationEngine calibration;
        TopInterpreter interpreter;
    };
}

TEST_F(TopInterpreterTest, WithinToleranceNeedsNoCorrection)
{
    calibrate();

    auto result{ interpreter.interpret({ detection("posicion_columna", 165, 50) }) };
    EXPECT_EQ(result.row_count, 1);
    EXPECT_EQ(result.lateral_correction_px, 0);
    EXPECT_FALSE(result.quality_fault);
}

TEST_F(TopInterpreterTest, OutOfToleranceIsCorrectedAndFlagged)
{
    calibrate();

    auto result{ interpreter.interpret({ detection("posicion_columna", 200, 50) }) };
    EXPECT_EQ(result.lateral_correction_px, 50);
    EXPECT_TRUE(result.quality_fault);
}

TEST_F(TopInterpreterTest, CorrectionIsClamped)
{
    calibrate();

    auto result{ interpreter.interpret({ detection("posicion_columna", 20, 50) }) };
    EXPECT_EQ(result.lateral_correction_px, -50);
    EXPECT_TRUE(result.quality_fault);
}

TEST_F(TopInterpreterTest, CountsOccupiedAndAlignsLeftmost)
{
    calibrate();

    auto result{ interpreter.interpret({ detection("posicion_columna", 152, 50),
                                         detection("posicion_vacia", 60, 50),
                                         detection("posicion_columna", 104, 50) }) };
    EXPECT_EQ(result.row_count, 2);
    EXPECT_EQ(result.lateral_correction_px, 0);
    EXPECT_FALSE(result.quality_fault);
}

TEST_F(TopInterpreterTest, OccupiedWinsOnSameX)
{
    calibrate();

    auto empty_last{ interpreter.interpret({ detection("posicion_columna", 100, 50), detection("posicion_vacia", 100, 60) }) };
    auto empty_first{ interpreter.interpret({ detection("posicion_vacia", 100, 60), detection("posicion_columna", 100, 50) }) };

    EXPECT_EQ(empty_last.row_count, 1);
    EXPECT_EQ(empty_first.row_count, 1);
}

TEST_F(TopInterpreterTest, FaultClassRaisesQualityFault)
{
    calibrate();

    auto result{ interpreter.interpret({ detection("posicion_columna", 100, 50), detection("error_apilado", 300, 50, 0.8) }) };
    EXPECT_TRUE(result.quality_fault);
    EXPECT_EQ(result.row_count, 1);
    EXPECT_NE(result.diagnostic.find("error_apilado"), std::string::npos);
}

TEST_F(TopInterpreterTest, LowConfidenceIsIgnored)
{
    calibrate();

    auto result{ interpreter.interpret({ detection("posicion_columna", 100, 50, 0.3), detection("error_alerta", 150, 50, 0.2) }) };
    EXPECT_EQ(result.row_count, 0);
    EXPECT_FALSE(result.quality_fault);
}

TEST_F(TopInterpreterTest, NoOccupiedColumnIsNotAFault)
{
    calibrate();

    auto result{ interpreter.interpret({ detection("posicion_vacia", 100, 50) }) };
    EXPECT_EQ(result.row_count, 0);
    EXPECT_EQ(result.lateral_correction_px, 0);
    EXPECT_FALSE(result.quality_fault);
}

TEST_F(TopInterpreterTest, UncalibratedIsAFault)
{
    auto result{ interpreter.interpret({ detection("posicion_columna", 100, 50) }) };
    EXPECT_TRUE(result.quality_fault);
    EXPECT_EQ(result.row_count, 0);
    EXPECT_EQ(result.lateral_correction_px, 0);
}
