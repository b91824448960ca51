#include "nodevis/scene/viewer_config.hpp"

#include <stdexcept>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace nodevis::scene {
namespace {

template <typename T>
void ReadKey(const YAML::Node& section, const char* section_name, const char* key, T* value) {
  if (!section) {
    return;
  }
  if (!section.IsMap()) {
    throw std::runtime_error(fmt::format("Viewer config section '{}' must be a mapping", section_name));
  }
  const YAML::Node node = section[key];
  if (!node) {
    return;
  }
  try {
    *value = node.as<T>();
  } catch (const YAML::Exception& ex) {
    throw std::runtime_error(fmt::format("Invalid value for {}.{}: {}", section_name, key, ex.what()));
  }
}

void RequirePositive(double value, const char* key) {
  if (!(value > 0.0)) {
    throw std::runtime_error(fmt::format("{} must be positive, got {}", key, value));
  }
}

ViewerConfig FromNode(const YAML::Node& root) {
  ViewerConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw std::runtime_error("Viewer config must be a YAML mapping");
  }

  const YAML::Node layout = root["layout"];
  ReadKey(layout, "layout", "spacing", &config.layout.spacing);

  const YAML::Node camera = root["camera"];
  ReadKey(camera, "camera", "rotate_degrees_per_pixel", &config.camera.rotate_degrees_per_pixel);
  ReadKey(camera, "camera", "pan_scale", &config.camera.pan_scale);
  ReadKey(camera, "camera", "zoom_factor", &config.camera.zoom_factor);
  ReadKey(camera, "camera", "zoom_drag_steps_per_pixel", &config.camera.zoom_drag_steps_per_pixel);
  ReadKey(camera, "camera", "min_distance", &config.camera.min_distance);
  ReadKey(camera, "camera", "max_distance", &config.camera.max_distance);
  ReadKey(camera, "camera", "jump_distance", &config.camera.jump_distance);

  const YAML::Node playback = root["playback"];
  ReadKey(playback, "playback", "frame_rate_hz", &config.playback.frame_rate_hz);
  ReadKey(playback, "playback", "speed", &config.playback.speed);
  ReadKey(playback, "playback", "loop", &config.playback.loop);

  const YAML::Node window = root["window"];
  ReadKey(window, "window", "width", &config.window.width);
  ReadKey(window, "window", "height", &config.window.height);

  config.Validate();
  return config;
}

}  // namespace

ViewerConfig ViewerConfig::FromYaml(const std::string& yaml_text) {
  try {
    return FromNode(YAML::Load(yaml_text));
  } catch (const YAML::ParserException& ex) {
    throw std::runtime_error(fmt::format("Failed to parse viewer config: {}", ex.what()));
  }
}

ViewerConfig ViewerConfig::FromYamlFile(const std::filesystem::path& path) {
  try {
    return FromNode(YAML::LoadFile(path.string()));
  } catch (const YAML::BadFile& ex) {
    throw std::runtime_error(fmt::format("Could not open viewer config {}: {}", path.string(), ex.what()));
  } catch (const YAML::ParserException& ex) {
    throw std::runtime_error(fmt::format("Failed to parse viewer config {}: {}", path.string(), ex.what()));
  }
}

void ViewerConfig::Validate() const {
  RequirePositive(layout.spacing, "layout.spacing");
  RequirePositive(camera.rotate_degrees_per_pixel, "camera.rotate_degrees_per_pixel");
  RequirePositive(camera.pan_scale, "camera.pan_scale");
  if (!(camera.zoom_factor > 1.0)) {
    throw std::runtime_error(fmt::format("camera.zoom_factor must be greater than 1, got {}", camera.zoom_factor));
  }
  RequirePositive(camera.zoom_drag_steps_per_pixel, "camera.zoom_drag_steps_per_pixel");
  RequirePositive(camera.min_distance, "camera.min_distance");
  if (!(camera.max_distance > camera.min_distance)) {
    throw std::runtime_error(fmt::format("camera.max_distance ({}) must exceed camera.min_distance ({})",
                                         camera.max_distance, camera.min_distance));
  }
  if (camera.jump_distance < 0.0) {
    throw std::runtime_error(fmt::format("camera.jump_distance must not be negative, got {}", camera.jump_distance));
  }
  RequirePositive(playback.frame_rate_hz, "playback.frame_rate_hz");
  RequirePositive(playback.speed, "playback.speed");
  if (window.width <= 0 || window.height <= 0) {
    throw std::runtime_error(fmt::format("window size must be positive, got {}x{}", window.width, window.height));
  }
}

}  // namespace nodevis::scene
