#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "nodevis/io/table_parsing.hpp"
#include "nodevis/io/zip_archive.hpp"

namespace nodevis::io {

class XlsxWorkbook {
 public:
  struct Sheet {
    std::string name;
    std::string part;
  };

  static XlsxWorkbook Open(const std::filesystem::path& path);

  const std::vector<Sheet>& sheets() const;
  const std::vector<std::string>& shared_strings() const;

  // Cells of one worksheet as text. Rows with no content are dropped; the first remaining row is the header.
  TextTable ReadSheet(std::size_t sheet_index) const;

 private:
  explicit XlsxWorkbook(ZipArchive archive);

  void LoadSheets();
  void LoadSharedStrings();

  ZipArchive archive_;
  std::vector<Sheet> sheets_;
  std::vector<std::string> shared_strings_;
};

TextTable ReadXlsxTable(const std::filesystem::path& path);

}  // namespace nodevis::io
