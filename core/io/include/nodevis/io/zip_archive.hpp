#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace nodevis::io {

// Read-only access to the entries of a ZIP container (stored or deflated, no ZIP64, no encryption).
class ZipArchive {
 public:
  struct Entry {
    std::string name;
    std::uint16_t method = 0;
    std::uint16_t flags = 0;
    std::uint32_t compressed_size = 0;
    std::uint32_t uncompressed_size = 0;
    std::uint32_t local_header_offset = 0;
  };

  static ZipArchive Open(const std::filesystem::path& path);

  bool Contains(const std::string& name) const;
  std::string Read(const std::string& name) const;

  const std::vector<Entry>& entries() const;
  const std::filesystem::path& path() const;

 private:
  ZipArchive() = default;

  const Entry* Find(const std::string& name) const;

  std::filesystem::path path_;
  std::string bytes_;
  std::vector<Entry> entries_;
};

}  // namespace nodevis::io
