#include "nodevis/io/frame_timeline.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "nodevis/common/errors.hpp"

namespace nodevis::io {

void FrameTimeline::Bind(const Dataset* dataset) {
  dataset_ = dataset;
  frame_count_ = dataset_ == nullptr ? 0 : dataset_->frame_count;
  if (dataset_ != nullptr && dataset_->frame_rate_hz.has_value()) {
    SetFrameRate(*dataset_->frame_rate_hz);
  }
  Reset();
}

void FrameTimeline::Reset() {
  current_frame_ = 0;
  frame_accumulator_ = 0.0;
  playing_ = false;
  selected_node_.reset();
  if (frame_count_ > 0) {
    Notify();
  }
}

std::size_t FrameTimeline::frame_count() const {
  return frame_count_;
}

std::size_t FrameTimeline::current_frame() const {
  return current_frame_;
}

void FrameTimeline::Seek(long long frame) {
  if (frame_count_ == 0) {
    throw EmptyDatasetError("Cannot seek: dataset has no frames",
                            ErrorContext{dataset_ != nullptr ? dataset_->source_path : std::filesystem::path{}});
  }

  const long long last = static_cast<long long>(frame_count_) - 1;
  current_frame_ = static_cast<std::size_t>(std::clamp(frame, 0LL, last));
  frame_accumulator_ = 0.0;
  Notify();
}

void FrameTimeline::Step(long long delta) {
  const auto span = static_cast<long long>(frame_count_);
  Seek(static_cast<long long>(current_frame_) + std::clamp(delta, -span, span));
}

void FrameTimeline::AddListener(FrameListener listener) {
  listeners_.push_back(std::move(listener));
}

void FrameTimeline::SetPlaying(bool playing) {
  playing_ = playing && frame_count_ > 0;
}

void FrameTimeline::TogglePlaying() {
  SetPlaying(!playing_);
}

bool FrameTimeline::playing() const {
  return playing_;
}

void FrameTimeline::SetLooping(bool looping) {
  looping_ = looping;
}

bool FrameTimeline::looping() const {
  return looping_;
}

void FrameTimeline::SetFrameRate(double frame_rate_hz) {
  if (frame_rate_hz > 0.0 && std::isfinite(frame_rate_hz)) {
    frame_rate_hz_ = frame_rate_hz;
  }
}

double FrameTimeline::frame_rate() const {
  return frame_rate_hz_;
}

void FrameTimeline::SetSpeed(double speed) {
  speed_ = std::max(0.01, speed);
}

double FrameTimeline::speed() const {
  return speed_;
}

void FrameTimeline::Update(double delta_seconds) {
  if (!playing_ || frame_count_ == 0 || !(delta_seconds > 0.0) || !std::isfinite(delta_seconds)) {
    return;
  }

  frame_accumulator_ += delta_seconds * frame_rate_hz_ * speed_;
  if (!std::isfinite(frame_accumulator_)) {
    frame_accumulator_ = static_cast<double>(frame_count_);
  }
  const double whole = std::floor(frame_accumulator_);
  if (whole < 1.0) {
    return;
  }
  const double remainder = frame_accumulator_ - whole;
  // At most one pass over the recording, so the frame arithmetic stays in range.
  const double count = static_cast<double>(frame_count_);
  const auto whole_frames = static_cast<long long>(looping_ ? std::fmod(whole, count) : std::min(whole, count));

  const long long last = static_cast<long long>(frame_count_) - 1;
  long long target = static_cast<long long>(current_frame_) + whole_frames;
  if (target > last) {
    if (looping_) {
      target %= static_cast<long long>(frame_count_);
    } else {
      target = last;
      playing_ = false;
    }
  }

  Seek(target);
  frame_accumulator_ = playing_ ? remainder : 0.0;
}

void FrameTimeline::SetSelectedNode(std::optional<int> node_id) {
  selected_node_ = node_id;
}

std::optional<int> FrameTimeline::selected_node() const {
  return selected_node_;
}

void FrameTimeline::Notify() {
  for (const auto& listener : listeners_) {
    listener(current_frame_);
  }
}

}  // namespace nodevis::io
