#include <cmath>
#include <stdexcept>

#include <gtest/gtest.h>

#include "nodevis/scene/node_pose_model.hpp"

namespace {

nodevis::io::Dataset MakeDataset() {
  nodevis::io::Dataset dataset;
  const double half = (90.0 * CV_PI / 180.0) / 2.0;
  dataset.series.push_back({2, "2_SENSOR", {cv::Quatd(1.0, 0.0, 0.0, 0.0), cv::Quatd(std::cos(half), 0.0, 0.0, std::sin(half))}});
  dataset.series.push_back({7, "7_SENSOR", {cv::Quatd(1.0, 0.0, 0.0, 0.0), cv::Quatd(1.0, 0.0, 0.0, 0.0)}});
  dataset.series.push_back({8, "8_SENSOR", {cv::Quatd(1.0, 0.0, 0.0, 0.0), cv::Quatd(1.0, 0.0, 0.0, 0.0)}});
  dataset.frame_count = 2;
  return dataset;
}

}  // namespace

TEST(NodePoseModelTest, AssignsSlotsInDetectionOrder) {
  const auto dataset = MakeDataset();
  const nodevis::scene::NodePoseModel model(&dataset, nodevis::scene::LayoutConfig{});

  ASSERT_EQ(model.node_count(), 3);
  EXPECT_EQ(*model.SlotPosition(2), cv::Vec3d(0.0, 0.0, 0.0));
  EXPECT_NEAR((*model.SlotPosition(7))[0], 0.2, 1e-12);
  EXPECT_NEAR((*model.SlotPosition(8))[0], 0.4, 1e-12);
  EXPECT_FALSE(model.SlotPosition(1).has_value());
  EXPECT_NEAR(model.LayoutCenter()[0], 0.2, 1e-12);
}

TEST(NodePoseModelTest, PoseCarriesRotationTransformAndLabel) {
  const auto dataset = MakeDataset();
  const nodevis::scene::NodePoseModel model(&dataset, nodevis::scene::LayoutConfig{0.5});

  const auto pose = model.Pose(7, 1);
  ASSERT_TRUE(pose.has_value());
  EXPECT_EQ(pose->label, "7");
  EXPECT_NEAR(pose->transform(0, 3), 0.5, 1e-12);
  EXPECT_NEAR(pose->label_position[0], 0.49, 1e-12);
  EXPECT_NEAR(pose->label_position[1], 0.01, 1e-12);
  EXPECT_NEAR(pose->label_position[2], 0.1, 1e-12);

  // 90 degrees about z maps x onto y.
  const auto turned = model.Pose(2, 1);
  ASSERT_TRUE(turned.has_value());
  const cv::Vec3d x_axis = turned->rotation * cv::Vec3d(1.0, 0.0, 0.0);
  EXPECT_NEAR(x_axis[0], 0.0, 1e-12);
  EXPECT_NEAR(x_axis[1], 1.0, 1e-12);
  EXPECT_NEAR(turned->transform(1, 0), 1.0, 1e-12);
}

TEST(NodePoseModelTest, IsDeterministic) {
  const auto dataset = MakeDataset();
  const nodevis::scene::NodePoseModel model(&dataset, nodevis::scene::LayoutConfig{});

  const auto first = model.FramePoses(1);
  const auto second = model.FramePoses(1);
  ASSERT_EQ(first.size(), second.size());
  for (std::size_t index = 0; index < first.size(); ++index) {
    EXPECT_EQ(first[index].node_id, second[index].node_id);
    EXPECT_EQ(first[index].transform, second[index].transform);
  }
}

TEST(NodePoseModelTest, UnknownNodeAndBadFrame) {
  const auto dataset = MakeDataset();
  const nodevis::scene::NodePoseModel model(&dataset, nodevis::scene::LayoutConfig{});

  EXPECT_FALSE(model.Pose(4, 0).has_value());
  EXPECT_THROW(model.Pose(2, 2), std::out_of_range);
  EXPECT_THROW(model.FramePoses(5), std::out_of_range);
}
