#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core/quaternion.hpp>

namespace nodevis::io {

inline constexpr std::size_t kMaxNodes = 8;
inline constexpr double kMinQuaternionNorm = 1e-9;

enum class DataFormat {
  kCsv,
  kXlsx,
  kSto,
};

std::string_view ToString(DataFormat format);

struct SensorSeries {
  int node_id = 0;
  std::string name;
  // Unit quaternions, scalar-first, one per frame.
  std::vector<cv::Quatd> rotations;

  std::size_t frame_count() const { return rotations.size(); }
};

struct Dataset {
  std::filesystem::path source_path;
  DataFormat format = DataFormat::kCsv;
  std::vector<SensorSeries> series;
  std::size_t frame_count = 0;
  std::optional<std::vector<double>> time_column;
  std::optional<double> frame_rate_hz;

  const SensorSeries* FindSeries(int node_id) const;
  std::vector<int> node_ids() const;
};

// Returns q / |q|. Returns nullopt when |q| < kMinQuaternionNorm or a component is not finite.
std::optional<cv::Quatd> NormalizeQuaternion(const cv::Quatd& q);

}  // namespace nodevis::io
