#include <cstdlib>
#include <exception>
#include <string>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "nodevis/common/version.hpp"
#include "nodevis/io/dataset_loader.hpp"
#include "nodevis/scene/node_pose_model.hpp"
#include "nodevis/scene/viewer_config.hpp"

int main(int argc, char** argv) {
  CLI::App app{"nodevis dataset inspector"};
  std::string data_path;
  std::size_t frame = 0;
  bool verbose = false;
  app.add_option("--data", data_path, "Orientation data file (.csv, .xlsx or .sto)")->required();
  app.add_option("--frame", frame, "Frame whose node poses are printed");
  app.add_flag("-v,--verbose", verbose, "Enable debug logging");

  CLI11_PARSE(app, argc, argv);

  if (verbose) {
    spdlog::set_level(spdlog::level::debug);
  }
  spdlog::info("nodevis version: {}", nodevis::common::version());

  nodevis::io::Dataset dataset;
  try {
    dataset = nodevis::io::LoadDataset(data_path);
  } catch (const std::exception& ex) {
    spdlog::error("Failed to load dataset: {}", ex.what());
    return EXIT_FAILURE;
  }

  spdlog::info("Format: {}", nodevis::io::ToString(dataset.format));
  spdlog::info("Frames: {}", dataset.frame_count);
  if (dataset.frame_rate_hz.has_value()) {
    spdlog::info("Data rate: {} Hz", *dataset.frame_rate_hz);
  }
  if (dataset.time_column.has_value() && !dataset.time_column->empty()) {
    spdlog::info("Time span: {} .. {}", dataset.time_column->front(), dataset.time_column->back());
  }

  const nodevis::scene::NodePoseModel model(&dataset, nodevis::scene::LayoutConfig{});
  if (frame >= dataset.frame_count) {
    spdlog::warn("Frame {} is out of range, using last frame {}", frame, dataset.frame_count - 1);
    frame = dataset.frame_count - 1;
  }

  for (const auto& pose : model.FramePoses(frame)) {
    const auto* series = dataset.FindSeries(pose.node_id);
    spdlog::info("Node {} ({}) slot ({:.2f}, {:.2f}, {:.2f}) q[{}] = ({:.6f}, {:.6f}, {:.6f}, {:.6f})",
                 pose.node_id,
                 series != nullptr ? series->name : std::string{},
                 pose.slot_position[0],
                 pose.slot_position[1],
                 pose.slot_position[2],
                 frame,
                 pose.orientation.w,
                 pose.orientation.x,
                 pose.orientation.y,
                 pose.orientation.z);
  }

  return EXIT_SUCCESS;
}
