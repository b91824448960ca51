#include "nodevis/scene/camera_controller.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/core/quaternion.hpp>
#include <spdlog/spdlog.h>

namespace nodevis::scene {
namespace {

constexpr double kDegreesToRadians = CV_PI / 180.0;
constexpr double kParallelEpsilon = 1e-9;

constexpr CameraTransition kIgnore{false, CameraState::kIdle};

constexpr CameraTransition Go(CameraState next) {
  return CameraTransition{true, next};
}

using S = CameraState;

// Rows: current state. Columns follow GestureKind order:
// RotateBegin RotateDrag RotateEnd PanBegin PanDrag PanEnd ZoomBegin ZoomDrag ZoomEnd Scroll
constexpr std::array<std::array<CameraTransition, kGestureKindCount>, kCameraStateCount> kTransitions = {{
    // kIdle
    {Go(S::kRotating), kIgnore, kIgnore, Go(S::kPanning), kIgnore, kIgnore, Go(S::kZooming), kIgnore, kIgnore,
     Go(S::kIdle)},
    // kRotating
    {kIgnore, Go(S::kRotating), Go(S::kIdle), kIgnore, kIgnore, kIgnore, kIgnore, kIgnore, kIgnore,
     Go(S::kRotating)},
    // kPanning
    {kIgnore, kIgnore, kIgnore, kIgnore, Go(S::kPanning), Go(S::kIdle), kIgnore, kIgnore, kIgnore,
     Go(S::kPanning)},
    // kZooming
    {kIgnore, kIgnore, kIgnore, kIgnore, kIgnore, kIgnore, kIgnore, Go(S::kZooming), Go(S::kIdle),
     Go(S::kZooming)},
}};

cv::Vec3d RotateVector(const cv::Vec3d& vector, double angle_rad, const cv::Vec3d& axis) {
  if (angle_rad == 0.0 || cv::norm(axis) < kParallelEpsilon) {
    return vector;
  }
  const cv::Quatd rotation = cv::Quatd::createFromAngleAxis(angle_rad, axis);
  return rotation.toRotMat3x3(cv::QUAT_ASSUME_UNIT) * vector;
}

cv::Vec3d AnyPerpendicular(const cv::Vec3d& direction) {
  const cv::Vec3d candidate = std::abs(direction[2]) < 0.9 ? cv::Vec3d(0.0, 0.0, 1.0) : cv::Vec3d(1.0, 0.0, 0.0);
  return cv::normalize(direction.cross(candidate));
}

}  // namespace

const cv::Vec3d CameraController::kDefaultEyeOffset(0.0, -3.0, 0.0);
const cv::Vec3d CameraController::kDefaultViewUp(0.0, 0.0, 1.0);

CameraController::CameraController(const CameraConfig& config) : config_(config) {
  Reset(cv::Vec3d(0.0, 0.0, 0.0));
}

void CameraController::Reset(const cv::Vec3d& focal_point) {
  SetPose(focal_point + kDefaultEyeOffset, focal_point, kDefaultViewUp);
}

void CameraController::SetPose(const cv::Vec3d& eye, const cv::Vec3d& focal_point, const cv::Vec3d& view_up) {
  pose_.focal_point = focal_point;
  pose_.eye = eye;
  if (cv::norm(pose_.eye - pose_.focal_point) < config_.min_distance) {
    pose_.eye = pose_.focal_point + kDefaultEyeOffset * (config_.min_distance / cv::norm(kDefaultEyeOffset));
  }
  pose_.view_up = view_up;

  const cv::Vec3d direction = ViewDirection();
  cv::Vec3d right = direction.cross(pose_.view_up);
  if (cv::norm(right) < kParallelEpsilon) {
    right = AnyPerpendicular(direction);
  }
  pose_.view_up = cv::normalize(cv::normalize(right).cross(direction));
  pose_.distance = cv::norm(pose_.eye - pose_.focal_point);
  state_ = CameraState::kIdle;
}

CameraTransition CameraController::Transition(CameraState state, GestureKind kind) {
  return kTransitions[static_cast<std::size_t>(state)][static_cast<std::size_t>(kind)];
}

bool CameraController::Dispatch(const GestureEvent& event) {
  const CameraTransition transition = Transition(state_, event.kind);
  if (!transition.accepted) {
    return false;
  }
  state_ = transition.next;

  switch (event.kind) {
    case GestureKind::kRotateDrag:
      Rotate(event.dx, event.dy);
      break;
    case GestureKind::kPanDrag:
      Pan(event.dx, event.dy);
      break;
    case GestureKind::kZoomDrag:
      Zoom(-event.dy * config_.zoom_drag_steps_per_pixel);
      break;
    case GestureKind::kScroll:
      Zoom(event.scroll_steps);
      break;
    default:
      break;
  }
  return true;
}

void CameraController::JumpTo(const cv::Vec3d& target) {
  const cv::Vec3d direction = ViewDirection();
  const double distance = config_.jump_distance > 0.0 ? config_.jump_distance : pose_.distance;
  pose_.focal_point = target;
  PlaceEye(direction, std::clamp(distance, config_.min_distance, config_.max_distance));
  state_ = CameraState::kIdle;
  spdlog::debug("Camera jumped to ({:.3f}, {:.3f}, {:.3f}) at distance {:.3f}",
                target[0], target[1], target[2], pose_.distance);
}

const CameraPose& CameraController::pose() const {
  return pose_;
}

CameraState CameraController::state() const {
  return state_;
}

const CameraConfig& CameraController::config() const {
  return config_;
}

void CameraController::Rotate(double dx, double dy) {
  const double azimuth = -dx * config_.rotate_degrees_per_pixel * kDegreesToRadians;
  const double elevation = dy * config_.rotate_degrees_per_pixel * kDegreesToRadians;

  cv::Vec3d offset = RotateVector(pose_.eye - pose_.focal_point, azimuth, pose_.view_up);
  cv::Vec3d up = pose_.view_up;

  cv::Vec3d right = (-offset).cross(up);
  if (cv::norm(right) < kParallelEpsilon) {
    right = AnyPerpendicular(-offset);
  }
  right = cv::normalize(right);
  offset = RotateVector(offset, elevation, right);
  up = RotateVector(up, elevation, right);

  const cv::Vec3d direction = cv::normalize(-offset);
  right = direction.cross(up);
  if (cv::norm(right) < kParallelEpsilon) {
    right = AnyPerpendicular(direction);
  }
  pose_.view_up = cv::normalize(cv::normalize(right).cross(direction));
  PlaceEye(direction, pose_.distance);
}

void CameraController::Pan(double dx, double dy) {
  const cv::Vec3d right = RightVector();
  const cv::Vec3d translation = (right * -dx + pose_.view_up * dy) * (config_.pan_scale * pose_.distance);
  pose_.eye += translation;
  pose_.focal_point += translation;
  pose_.distance = cv::norm(pose_.eye - pose_.focal_point);
}

void CameraController::Zoom(double steps) {
  if (steps == 0.0 || !std::isfinite(steps)) {
    return;
  }
  const double scaled = pose_.distance * std::pow(config_.zoom_factor, -steps);
  PlaceEye(ViewDirection(), std::clamp(scaled, config_.min_distance, config_.max_distance));
}

void CameraController::PlaceEye(const cv::Vec3d& direction, double distance) {
  pose_.eye = pose_.focal_point - direction * distance;
  pose_.distance = cv::norm(pose_.eye - pose_.focal_point);
}

cv::Vec3d CameraController::ViewDirection() const {
  const cv::Vec3d offset = pose_.focal_point - pose_.eye;
  const double length = cv::norm(offset);
  if (length < kParallelEpsilon) {
    return cv::normalize(-kDefaultEyeOffset);
  }
  return offset * (1.0 / length);
}

cv::Vec3d CameraController::RightVector() const {
  const cv::Vec3d direction = ViewDirection();
  const cv::Vec3d right = direction.cross(pose_.view_up);
  if (cv::norm(right) < kParallelEpsilon) {
    return AnyPerpendicular(direction);
  }
  return cv::normalize(right);
}

}  // namespace nodevis::scene
