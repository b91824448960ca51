#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "nodevis/io/frame_timeline.hpp"
#include "nodevis/io/orientation_dataset.hpp"
#include "nodevis/scene/camera_controller.hpp"
#include "nodevis/scene/node_pose_model.hpp"
#include "nodevis/scene/viewer_config.hpp"

namespace nodevis::scene {

// Everything one viewing session owns: the loaded dataset, playback position and camera.
// The presentation layer reads and drives it each tick but holds no orientation or camera state itself.
class Session {
 public:
  explicit Session(const ViewerConfig& config = {});

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // On failure the exception propagates and the previously loaded dataset stays active.
  void Load(const std::filesystem::path& path);
  void Adopt(io::Dataset dataset);

  bool has_dataset() const;
  const io::Dataset* dataset() const;

  std::size_t frame_count() const;
  std::size_t current_frame() const;
  void Seek(long long frame);
  void Step(long long delta);
  void AddFrameListener(io::FrameTimeline::FrameListener listener);

  std::optional<NodePose> NodePoseAt(int node_id, std::size_t frame) const;
  std::vector<NodePose> CurrentPoses() const;

  const CameraPose& camera_pose() const;
  CameraState camera_state() const;
  bool DispatchGesture(const GestureEvent& event);
  // No-op returning false when no node with this id was detected.
  bool JumpToNode(int node_id);
  void ResetCamera();

  void Update(double delta_seconds);
  void TogglePlaying();
  bool playing() const;

  const io::FrameTimeline& timeline() const;
  const NodePoseModel& pose_model() const;
  const ViewerConfig& config() const;

 private:
  ViewerConfig config_;
  std::unique_ptr<io::Dataset> dataset_;
  io::FrameTimeline timeline_;
  NodePoseModel pose_model_;
  CameraController camera_;
};

}  // namespace nodevis::scene
