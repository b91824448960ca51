#include "nodevis/scene/session.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "nodevis/io/dataset_loader.hpp"

namespace nodevis::scene {

Session::Session(const ViewerConfig& config) : config_(config), camera_(config.camera) {
  config_.Validate();
  timeline_.SetFrameRate(config_.playback.frame_rate_hz);
  timeline_.SetSpeed(config_.playback.speed);
  timeline_.SetLooping(config_.playback.loop);
}

void Session::Load(const std::filesystem::path& path) {
  Adopt(io::LoadDataset(path));
}

void Session::Adopt(io::Dataset dataset) {
  dataset_ = std::make_unique<io::Dataset>(std::move(dataset));
  pose_model_ = NodePoseModel(dataset_.get(), config_.layout);
  timeline_.SetFrameRate(config_.playback.frame_rate_hz);
  timeline_.Bind(dataset_.get());
  camera_.Reset(pose_model_.LayoutCenter());

  spdlog::info("Session ready: {} nodes, {} frames at {:.1f} Hz",
               pose_model_.node_count(), timeline_.frame_count(), timeline_.frame_rate());
}

bool Session::has_dataset() const {
  return dataset_ != nullptr;
}

const io::Dataset* Session::dataset() const {
  return dataset_.get();
}

std::size_t Session::frame_count() const {
  return timeline_.frame_count();
}

std::size_t Session::current_frame() const {
  return timeline_.current_frame();
}

void Session::Seek(long long frame) {
  timeline_.Seek(frame);
}

void Session::Step(long long delta) {
  timeline_.Step(delta);
}

void Session::AddFrameListener(io::FrameTimeline::FrameListener listener) {
  timeline_.AddListener(std::move(listener));
}

std::optional<NodePose> Session::NodePoseAt(int node_id, std::size_t frame) const {
  return pose_model_.Pose(node_id, frame);
}

std::vector<NodePose> Session::CurrentPoses() const {
  if (!has_dataset()) {
    return {};
  }
  return pose_model_.FramePoses(timeline_.current_frame());
}

const CameraPose& Session::camera_pose() const {
  return camera_.pose();
}

CameraState Session::camera_state() const {
  return camera_.state();
}

bool Session::DispatchGesture(const GestureEvent& event) {
  return camera_.Dispatch(event);
}

bool Session::JumpToNode(int node_id) {
  const auto slot = pose_model_.SlotPosition(node_id);
  if (!slot.has_value()) {
    spdlog::debug("Ignoring jump to node {}: not present in dataset", node_id);
    return false;
  }
  camera_.JumpTo(*slot);
  timeline_.SetSelectedNode(node_id);
  return true;
}

void Session::ResetCamera() {
  camera_.Reset(pose_model_.LayoutCenter());
  timeline_.SetSelectedNode(std::nullopt);
}

void Session::Update(double delta_seconds) {
  timeline_.Update(delta_seconds);
}

void Session::TogglePlaying() {
  timeline_.TogglePlaying();
}

bool Session::playing() const {
  return timeline_.playing();
}

const io::FrameTimeline& Session::timeline() const {
  return timeline_;
}

const NodePoseModel& Session::pose_model() const {
  return pose_model_;
}

const ViewerConfig& Session::config() const {
  return config_;
}

}  // namespace nodevis::scene
