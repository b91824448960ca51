#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core/quaternion.hpp>

#include "nodevis/common/errors.hpp"
#include "nodevis/io/orientation_dataset.hpp"

namespace nodevis::io {

struct TextRow {
  // 1-based row in the source (line number for text files, sheet row for workbooks).
  std::size_t source_row = 0;
  std::vector<std::string> cells;
};

struct TextTable {
  std::size_t header_row = 0;
  std::vector<std::string> header;
  std::vector<TextRow> rows;
};

std::string Trim(std::string_view value);
std::string StripQuotes(std::string_view value);
std::string ToLower(std::string_view value);
bool IsBlank(std::string_view value);

std::vector<std::string> SplitDelimited(std::string_view line, char delimiter);
std::vector<std::string> SplitWhitespace(std::string_view line);

// Parses a finite double; anything else throws DataFormatError with the given context.
double ParseNumber(std::string_view cell, const ErrorContext& context);

// Normalizes (w, x, y, z); throws InvalidQuaternionError when the norm is below kMinQuaternionNorm.
cv::Quatd RequireUnitQuaternion(double w, double x, double y, double z, const ErrorContext& context);

TextTable ReadCsvTable(const std::filesystem::path& csv_path);

// Collects per-node rotations row by row. Finish() rejects series of different lengths.
class SeriesAssembler {
 public:
  SeriesAssembler(std::filesystem::path path, std::vector<SensorSeries> series);

  void Append(std::size_t index, const cv::Quatd& rotation);

  std::vector<SensorSeries> Finish();

 private:
  std::filesystem::path path_;
  std::vector<SensorSeries> series_;
};

}  // namespace nodevis::io
