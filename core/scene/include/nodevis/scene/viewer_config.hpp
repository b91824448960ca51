#pragma once

#include <filesystem>
#include <string>

namespace nodevis::scene {

struct LayoutConfig {
  double spacing = 0.2;
};

struct CameraConfig {
  double rotate_degrees_per_pixel = 0.4;
  double pan_scale = 0.002;
  double zoom_factor = 1.12;
  double zoom_drag_steps_per_pixel = 0.02;
  double min_distance = 0.05;
  double max_distance = 200.0;
  // When > 0, jumps use this distance instead of the current one.
  double jump_distance = 0.0;
};

struct PlaybackConfig {
  double frame_rate_hz = 100.0;
  double speed = 1.0;
  bool loop = false;
};

struct WindowConfig {
  int width = 1000;
  int height = 800;
};

struct ViewerConfig {
  LayoutConfig layout;
  CameraConfig camera;
  PlaybackConfig playback;
  WindowConfig window;

  static ViewerConfig FromYaml(const std::string& yaml_text);
  static ViewerConfig FromYamlFile(const std::filesystem::path& path);

  // Throws std::runtime_error naming the first invalid key.
  void Validate() const;
};

}  // namespace nodevis::scene
