#pragma once

#include <filesystem>
#include <variant>

#include "nodevis/io/orientation_dataset.hpp"
#include "nodevis/io/table_parsing.hpp"

namespace nodevis::io {

struct CsvSource {
  std::filesystem::path path;
};

struct XlsxSource {
  std::filesystem::path path;
};

struct StoSource {
  std::filesystem::path path;
};

using DataSource = std::variant<CsvSource, XlsxSource, StoSource>;

// Picks the format from the extension, falling back to sniffing the file contents.
DataFormat DetectFormat(const std::filesystem::path& path);
DataSource MakeSource(const std::filesystem::path& path, DataFormat format);

Dataset ReadDataset(const CsvSource& source);
Dataset ReadDataset(const XlsxSource& source);
Dataset ReadDataset(const StoSource& source);

// Builds a dataset from a table whose header carries Quat{1..4}_N_SENSOR column groups.
Dataset BuildQuaternionColumnDataset(const TextTable& table, const std::filesystem::path& path, DataFormat format);

class DatasetLoader {
 public:
  Dataset Load(const std::filesystem::path& path) const;
  Dataset Load(const std::filesystem::path& path, DataFormat format) const;
};

Dataset LoadDataset(const std::filesystem::path& path);

}  // namespace nodevis::io
