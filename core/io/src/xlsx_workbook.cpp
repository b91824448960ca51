#include "nodevis/io/xlsx_workbook.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>

#include "nodevis/common/errors.hpp"
#include "nodevis/io/dataset_loader.hpp"

namespace nodevis::io {
namespace {

constexpr const char* kWorkbookPart = "xl/workbook.xml";
constexpr const char* kWorkbookRelsPart = "xl/_rels/workbook.xml.rels";
constexpr const char* kSharedStringsPart = "xl/sharedStrings.xml";
constexpr const char* kFallbackSheetPart = "xl/worksheets/sheet1.xml";
// Column XFD, the widest sheet Excel can produce.
constexpr std::size_t kMaxColumns = 16384;

std::string_view LocalName(const tinyxml2::XMLElement* element) {
  std::string_view name = element->Name();
  const auto colon = name.find(':');
  return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

const tinyxml2::XMLElement* FirstChild(const tinyxml2::XMLNode* parent, std::string_view local_name) {
  for (const auto* child = parent->FirstChildElement(); child != nullptr; child = child->NextSiblingElement()) {
    if (LocalName(child) == local_name) {
      return child;
    }
  }
  return nullptr;
}

const tinyxml2::XMLElement* NextSibling(const tinyxml2::XMLElement* element, std::string_view local_name) {
  for (const auto* sibling = element->NextSiblingElement(); sibling != nullptr; sibling = sibling->NextSiblingElement()) {
    if (LocalName(sibling) == local_name) {
      return sibling;
    }
  }
  return nullptr;
}

const char* RelationshipId(const tinyxml2::XMLElement* element) {
  for (const auto* attribute = element->FirstAttribute(); attribute != nullptr; attribute = attribute->Next()) {
    const std::string_view name = attribute->Name();
    if (name == "r:id" || name.ends_with(":id")) {
      return attribute->Value();
    }
  }
  return nullptr;
}

void ParseXml(const std::string& xml, const std::string& part, const std::filesystem::path& path,
              tinyxml2::XMLDocument* document) {
  if (document->Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
    throw DataFormatError(fmt::format("Malformed XML in '{}': {}", part, document->ErrorStr()), ErrorContext{path});
  }
}

// Concatenates every <t> below `element`, skipping phonetic runs.
std::string CollectText(const tinyxml2::XMLElement* element) {
  std::string text;
  for (const auto* child = element->FirstChildElement(); child != nullptr; child = child->NextSiblingElement()) {
    const auto name = LocalName(child);
    if (name == "t") {
      if (const char* value = child->GetText()) {
        text += value;
      }
    } else if (name == "r") {
      text += CollectText(child);
    }
  }
  return text;
}

// "BC12" -> 54 (0-based column). Returns npos when the reference has no letters.
std::size_t ColumnFromReference(const char* reference) {
  if (reference == nullptr) {
    return std::string::npos;
  }
  std::size_t column = 0;
  std::size_t letters = 0;
  for (const char* cursor = reference; *cursor != '\0' && std::isalpha(static_cast<unsigned char>(*cursor)); ++cursor) {
    column = std::min(column * 26 + static_cast<std::size_t>(std::toupper(static_cast<unsigned char>(*cursor)) - 'A' + 1),
                      kMaxColumns + 1);
    ++letters;
  }
  return letters == 0 ? std::string::npos : column - 1;
}

std::string ResolveTarget(const std::string& target) {
  if (target.starts_with("/")) {
    return target.substr(1);
  }
  return "xl/" + target;
}

}  // namespace

XlsxWorkbook::XlsxWorkbook(ZipArchive archive) : archive_(std::move(archive)) {}

XlsxWorkbook XlsxWorkbook::Open(const std::filesystem::path& path) {
  XlsxWorkbook workbook(ZipArchive::Open(path));
  workbook.LoadSheets();
  workbook.LoadSharedStrings();
  return workbook;
}

const std::vector<XlsxWorkbook::Sheet>& XlsxWorkbook::sheets() const {
  return sheets_;
}

const std::vector<std::string>& XlsxWorkbook::shared_strings() const {
  return shared_strings_;
}

void XlsxWorkbook::LoadSheets() {
  const auto& path = archive_.path();
  if (!archive_.Contains(kWorkbookPart)) {
    if (archive_.Contains(kFallbackSheetPart)) {
      sheets_.push_back(Sheet{"sheet1", kFallbackSheetPart});
      return;
    }
    throw DataFormatError("Archive is not an XLSX workbook", ErrorContext{path});
  }

  std::map<std::string, std::string> targets;
  if (archive_.Contains(kWorkbookRelsPart)) {
    tinyxml2::XMLDocument rels;
    ParseXml(archive_.Read(kWorkbookRelsPart), kWorkbookRelsPart, path, &rels);
    if (const auto* root = rels.RootElement()) {
      for (const auto* rel = FirstChild(root, "Relationship"); rel != nullptr; rel = NextSibling(rel, "Relationship")) {
        const char* id = rel->Attribute("Id");
        const char* target = rel->Attribute("Target");
        if (id != nullptr && target != nullptr) {
          targets[id] = ResolveTarget(target);
        }
      }
    }
  }

  tinyxml2::XMLDocument workbook;
  ParseXml(archive_.Read(kWorkbookPart), kWorkbookPart, path, &workbook);
  const auto* root = workbook.RootElement();
  const auto* sheets = root != nullptr ? FirstChild(root, "sheets") : nullptr;
  if (sheets != nullptr) {
    for (const auto* sheet = FirstChild(sheets, "sheet"); sheet != nullptr; sheet = NextSibling(sheet, "sheet")) {
      const char* name = sheet->Attribute("name");
      const char* id = RelationshipId(sheet);
      const auto target = id != nullptr ? targets.find(id) : targets.end();
      if (target == targets.end()) {
        spdlog::warn("Sheet '{}' in {} has no resolvable part", name != nullptr ? name : "?", path.string());
        continue;
      }
      sheets_.push_back(Sheet{name != nullptr ? name : target->second, target->second});
    }
  }

  if (sheets_.empty() && archive_.Contains(kFallbackSheetPart)) {
    sheets_.push_back(Sheet{"sheet1", kFallbackSheetPart});
  }
  if (sheets_.empty()) {
    throw DataFormatError("Workbook contains no worksheets", ErrorContext{path});
  }
}

void XlsxWorkbook::LoadSharedStrings() {
  if (!archive_.Contains(kSharedStringsPart)) {
    return;
  }
  tinyxml2::XMLDocument document;
  ParseXml(archive_.Read(kSharedStringsPart), kSharedStringsPart, archive_.path(), &document);
  const auto* root = document.RootElement();
  if (root == nullptr) {
    return;
  }
  for (const auto* item = FirstChild(root, "si"); item != nullptr; item = NextSibling(item, "si")) {
    shared_strings_.push_back(CollectText(item));
  }
}

TextTable XlsxWorkbook::ReadSheet(std::size_t sheet_index) const {
  const auto& path = archive_.path();
  if (sheet_index >= sheets_.size()) {
    throw DataFormatError(fmt::format("Workbook has no sheet {}", sheet_index), ErrorContext{path});
  }
  const Sheet& sheet = sheets_[sheet_index];

  tinyxml2::XMLDocument document;
  ParseXml(archive_.Read(sheet.part), sheet.part, path, &document);
  const auto* root = document.RootElement();
  const auto* sheet_data = root != nullptr ? FirstChild(root, "sheetData") : nullptr;
  if (sheet_data == nullptr) {
    throw DataFormatError(fmt::format("Sheet '{}' has no sheetData", sheet.name), ErrorContext{path});
  }

  TextTable table;
  std::size_t next_row_number = 1;
  for (const auto* row = FirstChild(sheet_data, "row"); row != nullptr; row = NextSibling(row, "row")) {
    const std::size_t row_number = row->UnsignedAttribute("r", static_cast<unsigned>(next_row_number));
    next_row_number = row_number + 1;

    std::vector<std::string> cells;
    std::size_t next_column = 0;
    bool has_content = false;
    for (const auto* cell = FirstChild(row, "c"); cell != nullptr; cell = NextSibling(cell, "c")) {
      std::size_t column = ColumnFromReference(cell->Attribute("r"));
      if (column == std::string::npos) {
        column = next_column;
      }
      if (column >= kMaxColumns) {
        throw DataFormatError(fmt::format("Cell '{}' lies beyond the last sheet column",
                                          cell->Attribute("r") != nullptr ? cell->Attribute("r") : "?"),
                              ErrorContext{path, row_number});
      }
      next_column = column + 1;

      const char* type = cell->Attribute("t");
      const std::string_view cell_type = type != nullptr ? type : "n";
      std::string value;
      if (cell_type == "inlineStr") {
        if (const auto* inline_string = FirstChild(cell, "is")) {
          value = CollectText(inline_string);
        }
      } else if (const auto* raw = FirstChild(cell, "v"); raw != nullptr && raw->GetText() != nullptr) {
        value = raw->GetText();
        if (cell_type == "s") {
          const ErrorContext context{path, row_number};
          std::size_t index = 0;
          try {
            index = std::stoul(value);
          } catch (const std::exception& ex) {
            throw DataFormatError(fmt::format("Bad shared string index '{}': {}", value, ex.what()), context);
          }
          if (index >= shared_strings_.size()) {
            throw DataFormatError(fmt::format("Shared string index {} out of range", index), context);
          }
          value = shared_strings_[index];
        }
      }

      if (cells.size() <= column) {
        cells.resize(column + 1);
      }
      cells[column] = Trim(value);
      has_content = has_content || !cells[column].empty();
    }

    if (!has_content) {
      continue;
    }
    if (table.header.empty()) {
      table.header_row = row_number;
      table.header = std::move(cells);
      continue;
    }
    table.rows.push_back(TextRow{row_number, std::move(cells)});
  }

  if (table.header.empty()) {
    throw DataFormatError(fmt::format("Sheet '{}' is empty", sheet.name), ErrorContext{path});
  }
  return table;
}

TextTable ReadXlsxTable(const std::filesystem::path& path) {
  const XlsxWorkbook workbook = XlsxWorkbook::Open(path);
  return workbook.ReadSheet(0);
}

Dataset ReadDataset(const XlsxSource& source) {
  return BuildQuaternionColumnDataset(ReadXlsxTable(source.path), source.path, DataFormat::kXlsx);
}

}  // namespace nodevis::io
