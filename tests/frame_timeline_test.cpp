#include <limits>
#include <vector>

#include <gtest/gtest.h>

#include "nodevis/common/errors.hpp"
#include "nodevis/io/frame_timeline.hpp"

namespace {

nodevis::io::Dataset MakeDataset(std::size_t frames) {
  nodevis::io::Dataset dataset;
  dataset.source_path = "synthetic.csv";
  nodevis::io::SensorSeries series{1, "1_SENSOR", {}};
  series.rotations.assign(frames, cv::Quatd(1.0, 0.0, 0.0, 0.0));
  dataset.series.push_back(series);
  dataset.frame_count = frames;
  return dataset;
}

}  // namespace

TEST(FrameTimelineTest, SeekClampsToValidRange) {
  const auto dataset = MakeDataset(100);
  nodevis::io::FrameTimeline timeline;
  timeline.Bind(&dataset);

  timeline.Seek(150);
  EXPECT_EQ(timeline.current_frame(), 99);

  timeline.Seek(-5);
  EXPECT_EQ(timeline.current_frame(), 0);

  timeline.Step(10);
  timeline.Step(-3);
  EXPECT_EQ(timeline.current_frame(), 7);
}

TEST(FrameTimelineTest, NotifiesListenersOnEveryChange) {
  const auto dataset = MakeDataset(10);
  nodevis::io::FrameTimeline timeline;
  std::vector<std::size_t> seen;
  timeline.AddListener([&seen](std::size_t frame) { seen.push_back(frame); });

  timeline.Bind(&dataset);
  timeline.Seek(4);
  timeline.Seek(40);

  EXPECT_EQ(seen, (std::vector<std::size_t>{0, 4, 9}));
}

TEST(FrameTimelineTest, SeekWithoutFramesThrows) {
  nodevis::io::FrameTimeline timeline;
  EXPECT_THROW(timeline.Seek(0), nodevis::EmptyDatasetError);
  timeline.SetPlaying(true);
  EXPECT_FALSE(timeline.playing());
}

TEST(FrameTimelineTest, AdvancesAndStopsAtEnd) {
  const auto dataset = MakeDataset(3);
  nodevis::io::FrameTimeline timeline;
  timeline.Bind(&dataset);
  timeline.SetFrameRate(10.0);
  timeline.SetPlaying(true);

  timeline.Update(0.15);
  EXPECT_EQ(timeline.current_frame(), 1);
  EXPECT_TRUE(timeline.playing());

  timeline.Update(0.5);
  EXPECT_EQ(timeline.current_frame(), 2);
  EXPECT_FALSE(timeline.playing());
}

TEST(FrameTimelineTest, LoopingWrapsAround) {
  const auto dataset = MakeDataset(4);
  nodevis::io::FrameTimeline timeline;
  timeline.Bind(&dataset);
  timeline.SetFrameRate(10.0);
  timeline.SetLooping(true);
  timeline.Seek(3);
  timeline.SetPlaying(true);

  timeline.Update(0.2);
  EXPECT_EQ(timeline.current_frame(), 1);
  EXPECT_TRUE(timeline.playing());
}

TEST(FrameTimelineTest, UsesDatasetFrameRateAndIgnoresInvalidRates) {
  auto dataset = MakeDataset(5);
  dataset.frame_rate_hz = 60.0;
  nodevis::io::FrameTimeline timeline;
  EXPECT_DOUBLE_EQ(timeline.frame_rate(), nodevis::io::FrameTimeline::kDefaultFrameRateHz);

  timeline.Bind(&dataset);
  EXPECT_DOUBLE_EQ(timeline.frame_rate(), 60.0);

  timeline.SetFrameRate(-1.0);
  EXPECT_DOUBLE_EQ(timeline.frame_rate(), 60.0);

  timeline.SetSpeed(0.0);
  EXPECT_DOUBLE_EQ(timeline.speed(), 0.01);
}

TEST(FrameTimelineTest, RebindClearsSelection) {
  const auto dataset = MakeDataset(5);
  nodevis::io::FrameTimeline timeline;
  timeline.Bind(&dataset);
  timeline.SetSelectedNode(1);
  timeline.Seek(3);

  timeline.Bind(&dataset);
  EXPECT_FALSE(timeline.selected_node().has_value());
  EXPECT_EQ(timeline.current_frame(), 0);
}

TEST(FrameTimelineTest, ExtremeStepsSaturate) {
  const auto dataset = MakeDataset(10);
  nodevis::io::FrameTimeline timeline;
  timeline.Bind(&dataset);

  timeline.Seek(5);
  timeline.Step(std::numeric_limits<long long>::max());
  EXPECT_EQ(timeline.current_frame(), 9);
  timeline.Step(std::numeric_limits<long long>::min());
  EXPECT_EQ(timeline.current_frame(), 0);
}

TEST(FrameTimelineTest, HugeTimeDeltaStopsAtLastFrame) {
  const auto dataset = MakeDataset(10);
  nodevis::io::FrameTimeline timeline;
  timeline.Bind(&dataset);
  timeline.SetPlaying(true);

  timeline.Update(1e300);
  EXPECT_EQ(timeline.current_frame(), 9);
  EXPECT_FALSE(timeline.playing());
}

TEST(FrameTimelineTest, HugeTimeDeltaWhileLoopingStaysInRange) {
  const auto dataset = MakeDataset(10);
  nodevis::io::FrameTimeline timeline;
  timeline.Bind(&dataset);
  timeline.SetLooping(true);
  timeline.SetPlaying(true);

  timeline.Update(1e300);
  EXPECT_LT(timeline.current_frame(), 10);
  EXPECT_TRUE(timeline.playing());

  timeline.Update(std::numeric_limits<double>::infinity());
  EXPECT_LT(timeline.current_frame(), 10);
}
