#pragma once

#include <array>
#include <cstddef>

#include <opencv2/core.hpp>

#include "nodevis/scene/viewer_config.hpp"

namespace nodevis::scene {

enum class CameraState {
  kIdle,
  kRotating,
  kPanning,
  kZooming,
};

enum class GestureKind {
  kRotateBegin,
  kRotateDrag,
  kRotateEnd,
  kPanBegin,
  kPanDrag,
  kPanEnd,
  kZoomBegin,
  kZoomDrag,
  kZoomEnd,
  kScroll,
};

inline constexpr std::size_t kCameraStateCount = 4;
inline constexpr std::size_t kGestureKindCount = 10;

// Drag deltas are in screen pixels with +y pointing down. Scroll steps are positive when zooming in.
struct GestureEvent {
  GestureKind kind = GestureKind::kScroll;
  double dx = 0.0;
  double dy = 0.0;
  double scroll_steps = 0.0;
};

struct CameraPose {
  cv::Vec3d eye;
  cv::Vec3d focal_point;
  cv::Vec3d view_up;
  double distance = 0.0;
};

struct CameraTransition {
  bool accepted = false;
  CameraState next = CameraState::kIdle;
};

class CameraController {
 public:
  static const cv::Vec3d kDefaultEyeOffset;
  static const cv::Vec3d kDefaultViewUp;

  explicit CameraController(const CameraConfig& config = {});

  // Restores the default view looking at `focal_point`, and returns to Idle.
  void Reset(const cv::Vec3d& focal_point);
  void SetPose(const cv::Vec3d& eye, const cv::Vec3d& focal_point, const cv::Vec3d& view_up);

  // Returns false when the transition table rejects the event in the current state.
  bool Dispatch(const GestureEvent& event);

  // Re-targets the focal point, keeping the view direction. Cancels any drag in progress.
  void JumpTo(const cv::Vec3d& target);

  const CameraPose& pose() const;
  CameraState state() const;
  const CameraConfig& config() const;

  static CameraTransition Transition(CameraState state, GestureKind kind);

 private:
  void Rotate(double dx, double dy);
  void Pan(double dx, double dy);
  void Zoom(double steps);
  void PlaceEye(const cv::Vec3d& direction, double distance);
  cv::Vec3d ViewDirection() const;
  cv::Vec3d RightVector() const;

  CameraConfig config_;
  CameraPose pose_;
  CameraState state_ = CameraState::kIdle;
};

}  // namespace nodevis::scene
