#include "nodevis/io/orientation_dataset.hpp"

#include <algorithm>
#include <cmath>

namespace nodevis::io {

std::string_view ToString(DataFormat format) {
  switch (format) {
    case DataFormat::kCsv:
      return "csv";
    case DataFormat::kXlsx:
      return "xlsx";
    case DataFormat::kSto:
      return "sto";
  }
  return "unknown";
}

const SensorSeries* Dataset::FindSeries(int node_id) const {
  const auto it = std::find_if(series.begin(), series.end(), [node_id](const SensorSeries& candidate) {
    return candidate.node_id == node_id;
  });
  return it == series.end() ? nullptr : &*it;
}

std::vector<int> Dataset::node_ids() const {
  std::vector<int> ids;
  ids.reserve(series.size());
  for (const auto& entry : series) {
    ids.push_back(entry.node_id);
  }
  return ids;
}

std::optional<cv::Quatd> NormalizeQuaternion(const cv::Quatd& q) {
  if (!std::isfinite(q.w) || !std::isfinite(q.x) || !std::isfinite(q.y) || !std::isfinite(q.z)) {
    return std::nullopt;
  }
  // Scale by the largest component first so that sqrt(dot) cannot overflow.
  const double scale = std::max({std::abs(q.w), std::abs(q.x), std::abs(q.y), std::abs(q.z)});
  if (scale < kMinQuaternionNorm / 2.0) {
    return std::nullopt;
  }
  const cv::Quatd scaled(q.w / scale, q.x / scale, q.y / scale, q.z / scale);
  const double scaled_norm = scaled.norm();
  if (scaled_norm * scale < kMinQuaternionNorm) {
    return std::nullopt;
  }
  return cv::Quatd(scaled.w / scaled_norm, scaled.x / scaled_norm, scaled.y / scaled_norm, scaled.z / scaled_norm);
}

}  // namespace nodevis::io
