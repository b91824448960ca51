#include "nodevis/io/dataset_loader.hpp"

#include <array>
#include <fstream>
#include <map>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "nodevis/common/errors.hpp"

namespace nodevis::io {
namespace {

constexpr std::array<char, 4> kZipMagic = {'P', 'K', '\x03', '\x04'};

struct NodeColumns {
  int node_id = 0;
  std::string name;
  std::array<std::optional<std::size_t>, 4> columns;

  bool complete() const {
    for (const auto& column : columns) {
      if (!column.has_value()) {
        return false;
      }
    }
    return true;
  }
};

std::string QuatColumnName(int component, const std::string& name) {
  return fmt::format("Quat{}_{}", component, name);
}

bool IsTimeHeader(const std::string& header) {
  return ToLower(header).starts_with("time");
}

std::map<int, NodeColumns> DetectQuaternionColumns(const TextTable& table, const std::filesystem::path& path) {
  const auto& header = table.header;
  static const std::regex kQuatColumn(R"(^Quat([1-4])_([0-9]+)_SENSOR$)");

  std::map<int, NodeColumns> nodes;
  for (std::size_t column = 0; column < header.size(); ++column) {
    std::smatch match;
    if (!std::regex_match(header[column], match, kQuatColumn)) {
      continue;
    }
    const int component = std::stoi(match[1].str());
    int node_id = 0;
    try {
      node_id = std::stoi(match[2].str());
    } catch (const std::out_of_range&) {
      throw DataFormatError(fmt::format("Node id '{}' is out of range", match[2].str()),
                            ErrorContext{path, table.header_row, header[column]});
    }
    if (node_id <= 0) {
      continue;
    }
    auto& node = nodes[node_id];
    node.node_id = node_id;
    node.name = fmt::format("{}_SENSOR", match[2].str());
    node.columns[static_cast<std::size_t>(component - 1)] = column;
  }
  return nodes;
}

std::string_view CellAt(const TextRow& row, std::size_t column) {
  if (column >= row.cells.size()) {
    return {};
  }
  return row.cells[column];
}

std::optional<std::vector<double>> ReadTimeColumn(const TextTable& table,
                                                  std::size_t column,
                                                  std::size_t frame_count,
                                                  const std::filesystem::path& path) {
  std::vector<double> values;
  values.reserve(frame_count);
  for (std::size_t index = 0; index < frame_count && index < table.rows.size(); ++index) {
    const auto& row = table.rows[index];
    try {
      values.push_back(ParseNumber(CellAt(row, column), ErrorContext{path, row.source_row, table.header[column]}));
    } catch (const DataFormatError& ex) {
      spdlog::warn("Ignoring time column '{}': {}", table.header[column], ex.what());
      return std::nullopt;
    }
  }
  return values;
}

bool StartsWithZipMagic(const std::filesystem::path& path) {
  std::ifstream stream(path, std::ios::binary);
  std::array<char, 4> magic{};
  if (!stream.read(magic.data(), static_cast<std::streamsize>(magic.size()))) {
    return false;
  }
  return magic == kZipMagic;
}

std::optional<DataFormat> SniffTextFormat(const std::filesystem::path& path) {
  std::ifstream stream(path);
  if (!stream.is_open()) {
    return std::nullopt;
  }

  std::string line;
  std::string first_content_line;
  int inspected = 0;
  while (std::getline(stream, line) && inspected < 64) {
    ++inspected;
    const std::string trimmed = Trim(line);
    if (trimmed == "endheader") {
      return DataFormat::kSto;
    }
    if (trimmed.empty()) {
      continue;
    }
    if (trimmed.find("Quat1_") != std::string::npos) {
      return DataFormat::kCsv;
    }
    if (first_content_line.empty()) {
      first_content_line = trimmed;
    }
  }

  const auto header = SplitWhitespace(first_content_line);
  if (!header.empty() && ToLower(header.front()) == "time") {
    return DataFormat::kSto;
  }
  return std::nullopt;
}

}  // namespace

DataFormat DetectFormat(const std::filesystem::path& path) {
  const std::string extension = ToLower(path.extension().string());
  if (extension == ".csv") {
    return DataFormat::kCsv;
  }
  if (extension == ".xlsx") {
    return DataFormat::kXlsx;
  }
  if (extension == ".sto") {
    return DataFormat::kSto;
  }

  if (!std::filesystem::exists(path)) {
    throw DataFormatError("File does not exist", ErrorContext{path});
  }
  if (StartsWithZipMagic(path)) {
    return DataFormat::kXlsx;
  }
  if (const auto sniffed = SniffTextFormat(path)) {
    return *sniffed;
  }
  throw DataFormatError(
      fmt::format("Unsupported file type '{}'; expected .csv, .xlsx or .sto", path.extension().string()),
      ErrorContext{path});
}

DataSource MakeSource(const std::filesystem::path& path, DataFormat format) {
  switch (format) {
    case DataFormat::kCsv:
      return CsvSource{path};
    case DataFormat::kXlsx:
      return XlsxSource{path};
    case DataFormat::kSto:
      return StoSource{path};
  }
  throw DataFormatError("Unknown data format", ErrorContext{path});
}

Dataset ReadDataset(const CsvSource& source) {
  return BuildQuaternionColumnDataset(ReadCsvTable(source.path), source.path, DataFormat::kCsv);
}

Dataset BuildQuaternionColumnDataset(const TextTable& table, const std::filesystem::path& path, DataFormat format) {
  const auto detected = DetectQuaternionColumns(table, path);

  std::vector<NodeColumns> nodes;
  for (const auto& [node_id, node] : detected) {
    if (!node.complete()) {
      spdlog::warn("Skipping node {} in {}: not all of Quat1..Quat4_{} are present", node_id, path.string(), node.name);
      continue;
    }
    nodes.push_back(node);
  }

  if (nodes.empty()) {
    throw DataFormatError("No complete Quat{1..4}_N_SENSOR column group in header", ErrorContext{path, table.header_row});
  }
  if (nodes.size() > kMaxNodes) {
    throw TooManyNodesError(nodes.size(), kMaxNodes, ErrorContext{path, table.header_row});
  }

  std::optional<std::size_t> time_column;
  for (std::size_t column = 0; column < table.header.size(); ++column) {
    if (IsTimeHeader(table.header[column])) {
      time_column = column;
      break;
    }
  }

  Dataset dataset;
  dataset.source_path = path;
  dataset.format = format;
  dataset.series.reserve(nodes.size());
  for (const auto& node : nodes) {
    SensorSeries series;
    series.node_id = node.node_id;
    series.name = node.name;
    series.rotations.reserve(table.rows.size());
    dataset.series.push_back(std::move(series));
  }

  SeriesAssembler assembler(path, std::move(dataset.series));
  for (const auto& row : table.rows) {
    if (row.cells.size() > table.header.size()) {
      for (std::size_t column = table.header.size(); column < row.cells.size(); ++column) {
        if (!IsBlank(row.cells[column])) {
          throw DataFormatError(
              fmt::format("Row has {} columns but the header has {}", row.cells.size(), table.header.size()),
              ErrorContext{path, row.source_row});
        }
      }
    }

    for (std::size_t index = 0; index < nodes.size(); ++index) {
      const auto& node = nodes[index];
      std::array<double, 4> values{};
      for (std::size_t component = 0; component < values.size(); ++component) {
        const std::string column_name = QuatColumnName(static_cast<int>(component) + 1, node.name);
        values[component] = ParseNumber(CellAt(row, *node.columns[component]),
                                        ErrorContext{path, row.source_row, column_name, node.node_id});
      }
      const std::string first_column = QuatColumnName(1, node.name);
      assembler.Append(index, RequireUnitQuaternion(values[0], values[1], values[2], values[3],
                                                    ErrorContext{path, row.source_row, first_column, node.node_id}));
    }
  }

  dataset.series = assembler.Finish();
  const std::size_t frame_count = dataset.series.front().frame_count();
  dataset.frame_count = frame_count;
  if (time_column.has_value()) {
    dataset.time_column = ReadTimeColumn(table, *time_column, frame_count, path);
  }
  return dataset;
}

Dataset DatasetLoader::Load(const std::filesystem::path& path) const {
  return Load(path, DetectFormat(path));
}

Dataset DatasetLoader::Load(const std::filesystem::path& path, DataFormat format) const {
  const DataSource source = MakeSource(path, format);
  Dataset dataset = std::visit([](const auto& typed_source) { return ReadDataset(typed_source); }, source);

  spdlog::info("Loaded {} dataset {} with {} nodes and {} frames",
               ToString(dataset.format), path.string(), dataset.series.size(), dataset.frame_count);
  for (const auto& series : dataset.series) {
    spdlog::debug("  node {} ({}): {} rotations", series.node_id, series.name, series.frame_count());
  }
  return dataset;
}

Dataset LoadDataset(const std::filesystem::path& path) {
  const DatasetLoader loader;
  return loader.Load(path);
}

}  // namespace nodevis::io
