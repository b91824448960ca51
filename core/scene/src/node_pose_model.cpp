#include "nodevis/scene/node_pose_model.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace nodevis::scene {
namespace {

const cv::Vec3d kLabelOffset(-0.01, 0.01, 0.1);

cv::Matx44d ComposeTransform(const cv::Matx33d& rotation, const cv::Vec3d& translation) {
  cv::Matx44d transform = cv::Matx44d::eye();
  for (int row = 0; row < 3; ++row) {
    for (int col = 0; col < 3; ++col) {
      transform(row, col) = rotation(row, col);
    }
    transform(row, 3) = translation[row];
  }
  return transform;
}

}  // namespace

NodePoseModel::NodePoseModel(const io::Dataset* dataset, const LayoutConfig& layout) : dataset_(dataset) {
  if (dataset_ == nullptr) {
    return;
  }
  slots_.reserve(dataset_->series.size());
  for (std::size_t index = 0; index < dataset_->series.size(); ++index) {
    const auto& series = dataset_->series[index];
    slots_.push_back(NodeSlot{series.node_id, &series, SlotForIndex(index, layout)});
  }
}

cv::Vec3d NodePoseModel::SlotForIndex(std::size_t index, const LayoutConfig& layout) {
  return cv::Vec3d(static_cast<double>(index) * layout.spacing, 0.0, 0.0);
}

std::optional<NodePose> NodePoseModel::Pose(int node_id, std::size_t frame) const {
  const NodeSlot* slot = FindSlot(node_id);
  if (slot == nullptr) {
    return std::nullopt;
  }
  return PoseForSlot(*slot, frame);
}

std::vector<NodePose> NodePoseModel::FramePoses(std::size_t frame) const {
  std::vector<NodePose> poses;
  poses.reserve(slots_.size());
  for (const auto& slot : slots_) {
    poses.push_back(PoseForSlot(slot, frame));
  }
  return poses;
}

std::optional<cv::Vec3d> NodePoseModel::SlotPosition(int node_id) const {
  const NodeSlot* slot = FindSlot(node_id);
  if (slot == nullptr) {
    return std::nullopt;
  }
  return slot->position;
}

cv::Vec3d NodePoseModel::LayoutCenter() const {
  if (slots_.empty()) {
    return cv::Vec3d(0.0, 0.0, 0.0);
  }
  cv::Vec3d sum(0.0, 0.0, 0.0);
  for (const auto& slot : slots_) {
    sum += slot.position;
  }
  return sum * (1.0 / static_cast<double>(slots_.size()));
}

std::size_t NodePoseModel::node_count() const {
  return slots_.size();
}

std::size_t NodePoseModel::frame_count() const {
  return dataset_ == nullptr ? 0 : dataset_->frame_count;
}

const std::vector<NodePoseModel::NodeSlot>& NodePoseModel::slots() const {
  return slots_;
}

NodePose NodePoseModel::PoseForSlot(const NodeSlot& slot, std::size_t frame) const {
  if (frame >= slot.series->rotations.size()) {
    throw std::out_of_range(
        fmt::format("Frame {} is out of range for node {} ({} frames)", frame, slot.node_id, slot.series->rotations.size()));
  }

  NodePose pose;
  pose.node_id = slot.node_id;
  pose.label = std::to_string(slot.node_id);
  pose.slot_position = slot.position;
  pose.orientation = slot.series->rotations[frame];
  pose.rotation = pose.orientation.toRotMat3x3(cv::QUAT_ASSUME_UNIT);
  pose.transform = ComposeTransform(pose.rotation, slot.position);
  pose.label_position = slot.position + kLabelOffset;
  pose.axis_orientation = pose.orientation;
  return pose;
}

const NodePoseModel::NodeSlot* NodePoseModel::FindSlot(int node_id) const {
  const auto it = std::find_if(slots_.begin(), slots_.end(), [node_id](const NodeSlot& slot) {
    return slot.node_id == node_id;
  });
  return it == slots_.end() ? nullptr : &*it;
}

}  // namespace nodevis::scene
