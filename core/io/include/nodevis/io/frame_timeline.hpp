#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "nodevis/io/orientation_dataset.hpp"

namespace nodevis::io {

class FrameTimeline {
 public:
  using FrameListener = std::function<void(std::size_t frame)>;

  static constexpr double kDefaultFrameRateHz = 100.0;

  FrameTimeline() = default;

  void Bind(const Dataset* dataset);
  void Reset();

  std::size_t frame_count() const;
  std::size_t current_frame() const;

  // Clamps to [0, frame_count) and notifies listeners. Throws EmptyDatasetError when there are no frames.
  void Seek(long long frame);
  void Step(long long delta);

  void AddListener(FrameListener listener);

  void SetPlaying(bool playing);
  void TogglePlaying();
  bool playing() const;

  void SetLooping(bool looping);
  bool looping() const;

  void SetFrameRate(double frame_rate_hz);
  double frame_rate() const;

  void SetSpeed(double speed);
  double speed() const;

  void Update(double delta_seconds);

  void SetSelectedNode(std::optional<int> node_id);
  std::optional<int> selected_node() const;

 private:
  void Notify();

  const Dataset* dataset_ = nullptr;
  std::size_t frame_count_ = 0;
  std::size_t current_frame_ = 0;
  double frame_accumulator_ = 0.0;
  bool playing_ = false;
  bool looping_ = false;
  double frame_rate_hz_ = kDefaultFrameRateHz;
  double speed_ = 1.0;
  std::optional<int> selected_node_;
  std::vector<FrameListener> listeners_;
};

}  // namespace nodevis::io
