#include "config/Config.hpp"
#include "replay/Recording.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using tcheck::config::ConfigError;
using tcheck::replay::ReplayCamera;
using tcheck::replay::ReplayDetector;
using tcheck::replay::View;
using tcheck::replay::parse_recording;

namespace
{
    constexpr auto TWO_FRAMES{ R"(
frames:
  - top:
      width: 640
      height: 480
      detections:
        - { label: posicion_columna, box: [90, 10, 110, 30], confidence: 0.9 }
        - { label: posicion_vacia, box: [140, 10, 160, 30] }
    side:
      width: 320
      height: 240
      detections:
        - { label: error_caido, box: [0, 0, 10, 10], confidence: 0.7 }
  - top:
      width: 640
      height: 480
)" };
}

TEST(Recording, ParsesFramesAndDetections)
{
    auto recording{ parse_recording(TWO_FRAMES) };
    ASSERT_EQ(recording->frames.size(), 2u);

    const auto& top{ recording->shot(0, View::Top) };
    EXPECT_EQ(top.width, 640);
    ASSERT_EQ(top.detections.size(), 2u);
    EXPECT_EQ(top.detections[0].label, "posicion_columna");
    EXPECT_EQ(top.detections[0].box.center_x(), 100);
    EXPECT_DOUBLE_EQ(top.detections[1].confidence, 1.0);

    EXPECT_EQ(recording->shot(0, View::Side).height, 240);
    EXPECT_TRUE(recording->shot(1, View::Side).detections.empty());
}

TEST(Recording, CameraAndDetectorReplayInOrder)
{
    auto recording{ parse_recording(TWO_FRAMES) };
    ReplayCamera camera(recording, View::Side);
    ReplayDetector detector(recording, View::Side);

    auto first{ camera.grab() };
    ASSERT_TRUE(first);
    EXPECT_EQ(first->height, 240);
    auto detections{ detector.infer(*first) };
    ASSERT_TRUE(detections);
    ASSERT_EQ(detections->size(), 1u);
    EXPECT_EQ((*detections)[0].label, "error_caido");

    auto second{ camera.grab() };
    ASSERT_TRUE(second);
    EXPECT_TRUE(detector.infer(*second)->empty());

    // rewinds
    auto third{ camera.grab() };
    ASSERT_TRUE(third);
    EXPECT_EQ(detector.infer(*third)->size(), 1u);
}

TEST(Recording, CameraRewindRestartsAtFirstFrame)
{
    auto recording{ parse_recording(TWO_FRAMES) };
    ReplayCamera camera(recording, View::Top);

    ASSERT_TRUE(camera.grab());
    camera.rewind();

    auto frame{ camera.grab() };
    ASSERT_TRUE(frame);
    EXPECT_EQ(frame->sequence, 0u);
}

TEST(Recording, RejectsInvalidDocuments)
{
    EXPECT_THROW(parse_recording("frames: []\n"), ConfigError);
    EXPECT_THROW(parse_recording("frames:\n  - top:\n      detections:\n        - { label: x, box: [1, 2, 3] }\n"),
                 ConfigError);
    EXPECT_THROW(parse_recording("frames: [unterminated"), ConfigError);
}

TEST(Recording, ShippedRecordingLoads)
{
    auto recording{ tcheck::replay::load_recording(std::filesystem::path{ TCHECK_CONFIG_DIR } / "recording.yaml") };
    EXPECT_EQ(recording->frames.size(), 3u);
}
