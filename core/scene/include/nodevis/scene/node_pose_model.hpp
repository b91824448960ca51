#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/core/quaternion.hpp>

#include "nodevis/io/orientation_dataset.hpp"
#include "nodevis/scene/viewer_config.hpp"

namespace nodevis::scene {

struct NodePose {
  int node_id = 0;
  std::string label;
  cv::Vec3d slot_position;
  cv::Quatd orientation;
  cv::Matx33d rotation;
  // Rotation in the upper-left block, slot position in the last column.
  cv::Matx44d transform;
  cv::Vec3d label_position;
  cv::Quatd axis_orientation;
};

class NodePoseModel {
 public:
  struct NodeSlot {
    int node_id = 0;
    const io::SensorSeries* series = nullptr;
    cv::Vec3d position;
  };

  NodePoseModel() = default;
  NodePoseModel(const io::Dataset* dataset, const LayoutConfig& layout);

  // nullopt for a node that is not in the dataset; throws std::out_of_range for a bad frame.
  std::optional<NodePose> Pose(int node_id, std::size_t frame) const;
  std::vector<NodePose> FramePoses(std::size_t frame) const;

  std::optional<cv::Vec3d> SlotPosition(int node_id) const;
  cv::Vec3d LayoutCenter() const;

  std::size_t node_count() const;
  std::size_t frame_count() const;
  const std::vector<NodeSlot>& slots() const;

  static cv::Vec3d SlotForIndex(std::size_t index, const LayoutConfig& layout);

 private:
  NodePose PoseForSlot(const NodeSlot& slot, std::size_t frame) const;
  const NodeSlot* FindSlot(int node_id) const;

  const io::Dataset* dataset_ = nullptr;
  std::vector<NodeSlot> slots_;
};

}  // namespace nodevis::scene
