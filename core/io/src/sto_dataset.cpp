#include <algorithm>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "nodevis/common/errors.hpp"
#include "nodevis/io/dataset_loader.hpp"
#include "nodevis/io/table_parsing.hpp"

namespace nodevis::io {
namespace {

enum class ColumnDelimiter {
  kTab,
  kComma,
  kWhitespace,
};

struct StoLine {
  std::size_t line_number = 0;
  std::string text;
};

ColumnDelimiter ChooseDelimiter(const std::string& header_line) {
  if (header_line.find('\t') != std::string::npos) {
    return ColumnDelimiter::kTab;
  }
  if (header_line.find(',') != std::string::npos) {
    return ColumnDelimiter::kComma;
  }
  return ColumnDelimiter::kWhitespace;
}

std::vector<std::string> SplitColumns(const std::string& line, ColumnDelimiter delimiter) {
  switch (delimiter) {
    case ColumnDelimiter::kTab:
      return SplitDelimited(line, '\t');
    case ColumnDelimiter::kComma:
      return SplitDelimited(line, ',');
    case ColumnDelimiter::kWhitespace:
      return SplitWhitespace(line);
  }
  return {};
}

std::vector<std::string> SplitComponents(const std::string& cell) {
  std::string spaced = cell;
  std::replace(spaced.begin(), spaced.end(), ',', ' ');
  return SplitWhitespace(spaced);
}

std::optional<double> ParseDataRate(const std::string& metadata_line) {
  const auto separator = metadata_line.find('=');
  if (separator == std::string::npos || ToLower(Trim(metadata_line.substr(0, separator))) != "datarate") {
    return std::nullopt;
  }
  try {
    const double rate = std::stod(Trim(metadata_line.substr(separator + 1)));
    if (rate > 0.0) {
      return rate;
    }
  } catch (const std::exception& ex) {
    spdlog::warn("Ignoring unparseable DataRate '{}': {}", metadata_line, ex.what());
  }
  return std::nullopt;
}

}  // namespace

Dataset ReadDataset(const StoSource& source) {
  const auto& path = source.path;
  std::ifstream stream(path);
  if (!stream.is_open()) {
    throw DataFormatError("Could not open STO file", ErrorContext{path});
  }

  std::vector<StoLine> lines;
  std::string text;
  std::size_t line_number = 0;
  while (std::getline(stream, text)) {
    ++line_number;
    if (!text.empty() && text.back() == '\r') {
      text.pop_back();
    }
    lines.push_back(StoLine{line_number, text});
  }

  std::size_t body_start = 0;
  const auto end_header = std::find_if(lines.begin(), lines.end(), [](const StoLine& line) {
    return Trim(line.text) == "endheader";
  });

  Dataset dataset;
  dataset.source_path = path;
  dataset.format = DataFormat::kSto;
  if (end_header != lines.end()) {
    for (auto it = lines.begin(); it != end_header; ++it) {
      if (const auto rate = ParseDataRate(it->text)) {
        dataset.frame_rate_hz = rate;
      }
    }
    body_start = static_cast<std::size_t>(std::distance(lines.begin(), end_header)) + 1;
  }

  while (body_start < lines.size() && IsBlank(lines[body_start].text)) {
    ++body_start;
  }
  if (body_start >= lines.size()) {
    throw DataFormatError("STO file has no column header", ErrorContext{path});
  }

  const StoLine& header_line = lines[body_start];
  const ColumnDelimiter delimiter = ChooseDelimiter(header_line.text);
  const std::vector<std::string> header = SplitColumns(Trim(header_line.text), delimiter);

  std::optional<std::size_t> time_column;
  std::vector<std::size_t> node_columns;
  for (std::size_t column = 0; column < header.size(); ++column) {
    if (header[column].empty()) {
      throw DataFormatError(fmt::format("Column {} has an empty name", column + 1),
                            ErrorContext{path, header_line.line_number});
    }
    if (ToLower(header[column]) == "time" && !time_column.has_value()) {
      time_column = column;
      continue;
    }
    node_columns.push_back(column);
  }

  if (node_columns.empty()) {
    throw DataFormatError("STO header has no orientation columns", ErrorContext{path, header_line.line_number});
  }
  if (node_columns.size() > kMaxNodes) {
    throw TooManyNodesError(node_columns.size(), kMaxNodes, ErrorContext{path, header_line.line_number});
  }

  std::vector<SensorSeries> series;
  series.reserve(node_columns.size());
  for (std::size_t index = 0; index < node_columns.size(); ++index) {
    SensorSeries entry;
    entry.node_id = static_cast<int>(index) + 1;
    entry.name = header[node_columns[index]];
    series.push_back(std::move(entry));
  }

  SeriesAssembler assembler(path, std::move(series));
  std::vector<double> times;
  bool times_valid = time_column.has_value();
  for (std::size_t line_index = body_start + 1; line_index < lines.size(); ++line_index) {
    const StoLine& line = lines[line_index];
    if (IsBlank(line.text)) {
      continue;
    }

    const std::vector<std::string> cells = SplitColumns(Trim(line.text), delimiter);
    if (cells.size() > header.size()) {
      throw DataFormatError(fmt::format("Row has {} columns but the header has {}", cells.size(), header.size()),
                            ErrorContext{path, line.line_number});
    }

    for (std::size_t index = 0; index < node_columns.size(); ++index) {
      const std::size_t column = node_columns[index];
      const int node_id = static_cast<int>(index) + 1;
      const ErrorContext context{path, line.line_number, header[column], node_id};
      if (column >= cells.size() || IsBlank(cells[column])) {
        throw DataFormatError("Missing quaternion value", context);
      }

      const auto components = SplitComponents(cells[column]);
      if (components.size() != 4) {
        throw DataFormatError(
            fmt::format("Expected 4 quaternion components, found {} in '{}'", components.size(), cells[column]),
            context);
      }
      assembler.Append(index,
                       RequireUnitQuaternion(ParseNumber(components[0], context),
                                             ParseNumber(components[1], context),
                                             ParseNumber(components[2], context),
                                             ParseNumber(components[3], context),
                                             context));
    }

    if (times_valid) {
      const std::size_t column = *time_column;
      try {
        times.push_back(ParseNumber(column < cells.size() ? cells[column] : std::string{},
                                    ErrorContext{path, line.line_number, header[column]}));
      } catch (const DataFormatError& ex) {
        spdlog::warn("Ignoring time column: {}", ex.what());
        times_valid = false;
      }
    }
  }

  dataset.series = assembler.Finish();
  dataset.frame_count = dataset.series.front().frame_count();
  if (times_valid) {
    times.resize(std::min(times.size(), dataset.frame_count));
    dataset.time_column = std::move(times);
  }
  return dataset;
}

}  // namespace nodevis::io
