#include "nodevis/io/table_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>


namespace nodevis::io {
namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

}  // namespace

std::string Trim(std::string_view value) {
  const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (first >= last) {
    return {};
  }
  return std::string(first, last);
}

std::string StripQuotes(std::string_view value) {
  std::string trimmed = Trim(value);
  if (trimmed.size() >= 2 && trimmed.front() == '"' && trimmed.back() == '"') {
    return Trim(std::string_view(trimmed).substr(1, trimmed.size() - 2));
  }
  return trimmed;
}

std::string ToLower(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

bool IsBlank(std::string_view value) {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::vector<std::string> SplitDelimited(std::string_view line, char delimiter) {
  std::vector<std::string> fields;
  std::stringstream stream{std::string(line)};
  std::string field;
  while (std::getline(stream, field, delimiter)) {
    fields.push_back(StripQuotes(field));
  }
  if (!line.empty() && line.back() == delimiter) {
    fields.emplace_back();
  }
  return fields;
}

std::vector<std::string> SplitWhitespace(std::string_view line) {
  std::vector<std::string> fields;
  std::stringstream stream{std::string(line)};
  std::string field;
  while (stream >> field) {
    fields.push_back(StripQuotes(field));
  }
  return fields;
}

double ParseNumber(std::string_view cell, const ErrorContext& context) {
  const std::string text = StripQuotes(cell);
  if (text.empty()) {
    throw DataFormatError("Missing numeric value", context);
  }

  double value = 0.0;
  std::size_t consumed = 0;
  try {
    value = std::stod(text, &consumed);
  } catch (const std::exception& ex) {
    throw DataFormatError(fmt::format("Failed to parse '{}' as a number: {}", text, ex.what()), context);
  }
  if (consumed != text.size()) {
    throw DataFormatError(fmt::format("Failed to parse '{}' as a number", text), context);
  }
  if (!std::isfinite(value)) {
    throw DataFormatError(fmt::format("Non-finite value '{}'", text), context);
  }
  return value;
}

cv::Quatd RequireUnitQuaternion(double w, double x, double y, double z, const ErrorContext& context) {
  const cv::Quatd raw(w, x, y, z);
  const auto unit = NormalizeQuaternion(raw);
  if (!unit.has_value()) {
    throw InvalidQuaternionError(raw.norm(), context);
  }
  return *unit;
}

TextTable ReadCsvTable(const std::filesystem::path& csv_path) {
  std::ifstream stream(csv_path);
  if (!stream.is_open()) {
    throw DataFormatError("Could not open CSV file", ErrorContext{csv_path});
  }

  TextTable table;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    if (line_number == 1 && line.starts_with(kUtf8Bom)) {
      line.erase(0, kUtf8Bom.size());
    }
    if (IsBlank(line)) {
      continue;
    }

    auto fields = SplitDelimited(Trim(line), ',');
    if (std::all_of(fields.begin(), fields.end(), [](const std::string& field) { return IsBlank(field); })) {
      continue;
    }
    if (table.header.empty()) {
      table.header_row = line_number;
      table.header = std::move(fields);
      continue;
    }
    table.rows.push_back(TextRow{line_number, std::move(fields)});
  }

  if (table.header.empty()) {
    throw DataFormatError("CSV file has no header row", ErrorContext{csv_path});
  }
  return table;
}

SeriesAssembler::SeriesAssembler(std::filesystem::path path, std::vector<SensorSeries> series)
    : path_(std::move(path)), series_(std::move(series)) {}

void SeriesAssembler::Append(std::size_t index, const cv::Quatd& rotation) {
  series_[index].rotations.push_back(rotation);
}

std::vector<SensorSeries> SeriesAssembler::Finish() {
  if (series_.empty()) {
    throw DataFormatError("No sensor nodes detected", ErrorContext{path_});
  }

  const SensorSeries& reference = series_.front();
  for (const auto& series : series_) {
    if (series.frame_count() != reference.frame_count()) {
      throw RaggedSeriesError(
          fmt::format("Node {} has {} frames but node {} has {}",
                      series.node_id, series.frame_count(), reference.node_id, reference.frame_count()),
          ErrorContext{path_, std::nullopt, std::nullopt, series.node_id});
    }
  }
  if (reference.frame_count() == 0) {
    throw EmptyDatasetError("Dataset contains no frames", ErrorContext{path_});
  }
  return std::move(series_);
}

}  // namespace nodevis::io
