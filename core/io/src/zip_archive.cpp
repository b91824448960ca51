#include "nodevis/io/zip_archive.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include <fmt/format.h>
#include <zlib.h>

#include "nodevis/common/errors.hpp"

namespace nodevis::io {
namespace {

constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50;
constexpr std::uint32_t kCentralDirectorySignature = 0x02014b50;
constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::size_t kEndOfCentralDirectorySize = 22;
constexpr std::size_t kCentralDirectoryHeaderSize = 46;
constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kMaxCommentSize = 0xFFFF;
constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflated = 8;
constexpr std::uint16_t kFlagEncrypted = 0x0001;
// Deflate cannot expand data by more than about 1032:1.
constexpr std::uint64_t kMaxDeflateRatio = 1032;
constexpr std::uint64_t kMaxEntrySize = 256ULL * 1024 * 1024;

std::uint16_t ReadU16(const std::string& bytes, std::size_t offset) {
  return static_cast<std::uint16_t>(static_cast<unsigned char>(bytes[offset]) |
                                    (static_cast<unsigned char>(bytes[offset + 1]) << 8));
}

std::uint32_t ReadU32(const std::string& bytes, std::size_t offset) {
  return static_cast<std::uint32_t>(ReadU16(bytes, offset)) |
         (static_cast<std::uint32_t>(ReadU16(bytes, offset + 2)) << 16);
}

std::string Inflate(const std::string& compressed, std::uint32_t expected_size, const std::filesystem::path& path,
                    const std::string& entry_name) {
  if (expected_size == 0) {
    return {};
  }
  std::string output(expected_size, '\0');

  z_stream stream{};
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
  stream.avail_in = static_cast<uInt>(compressed.size());
  stream.next_out = reinterpret_cast<Bytef*>(output.data());
  stream.avail_out = static_cast<uInt>(output.size());

  if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
    throw DataFormatError(fmt::format("Could not initialise inflate for '{}'", entry_name), ErrorContext{path});
  }
  const int status = inflate(&stream, Z_FINISH);
  const auto produced = stream.total_out;
  inflateEnd(&stream);

  if (status != Z_STREAM_END || produced != expected_size) {
    throw DataFormatError(fmt::format("Corrupt deflate stream in '{}' (zlib status {})", entry_name, status),
                          ErrorContext{path});
  }
  return output;
}

}  // namespace

ZipArchive ZipArchive::Open(const std::filesystem::path& path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream.is_open()) {
    throw DataFormatError("Could not open workbook", ErrorContext{path});
  }

  ZipArchive archive;
  archive.path_ = path;
  archive.bytes_.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
  const std::string& bytes = archive.bytes_;

  if (bytes.size() < kEndOfCentralDirectorySize) {
    throw DataFormatError("File is too small to be a ZIP archive", ErrorContext{path});
  }

  const std::size_t search_floor =
      bytes.size() > kEndOfCentralDirectorySize + kMaxCommentSize ? bytes.size() - kEndOfCentralDirectorySize - kMaxCommentSize : 0;
  std::size_t eocd = std::string::npos;
  for (std::size_t offset = bytes.size() - kEndOfCentralDirectorySize + 1; offset-- > search_floor;) {
    if (ReadU32(bytes, offset) == kEndOfCentralDirectorySignature) {
      eocd = offset;
      break;
    }
  }
  if (eocd == std::string::npos) {
    throw DataFormatError("Missing ZIP end-of-central-directory record", ErrorContext{path});
  }

  const std::uint16_t entry_count = ReadU16(bytes, eocd + 10);
  const std::uint32_t directory_size = ReadU32(bytes, eocd + 12);
  const std::uint32_t directory_offset = ReadU32(bytes, eocd + 16);
  if (entry_count == 0xFFFF || directory_offset == 0xFFFFFFFF) {
    throw DataFormatError("ZIP64 archives are not supported", ErrorContext{path});
  }
  if (static_cast<std::size_t>(directory_offset) + directory_size > bytes.size()) {
    throw DataFormatError("ZIP central directory lies outside the file", ErrorContext{path});
  }

  std::size_t cursor = directory_offset;
  archive.entries_.reserve(entry_count);
  for (std::uint16_t index = 0; index < entry_count; ++index) {
    if (cursor + kCentralDirectoryHeaderSize > bytes.size() || ReadU32(bytes, cursor) != kCentralDirectorySignature) {
      throw DataFormatError(fmt::format("Corrupt ZIP central directory entry {}", index), ErrorContext{path});
    }

    Entry entry;
    entry.flags = ReadU16(bytes, cursor + 8);
    entry.method = ReadU16(bytes, cursor + 10);
    entry.compressed_size = ReadU32(bytes, cursor + 20);
    entry.uncompressed_size = ReadU32(bytes, cursor + 24);
    const std::uint16_t name_length = ReadU16(bytes, cursor + 28);
    const std::uint16_t extra_length = ReadU16(bytes, cursor + 30);
    const std::uint16_t comment_length = ReadU16(bytes, cursor + 32);
    entry.local_header_offset = ReadU32(bytes, cursor + 42);

    if (cursor + kCentralDirectoryHeaderSize + name_length > bytes.size()) {
      throw DataFormatError(fmt::format("Corrupt ZIP central directory entry {}", index), ErrorContext{path});
    }
    entry.name = bytes.substr(cursor + kCentralDirectoryHeaderSize, name_length);
    archive.entries_.push_back(std::move(entry));

    cursor += kCentralDirectoryHeaderSize + name_length + extra_length + comment_length;
  }

  return archive;
}

bool ZipArchive::Contains(const std::string& name) const {
  return Find(name) != nullptr;
}

std::string ZipArchive::Read(const std::string& name) const {
  const Entry* entry = Find(name);
  if (entry == nullptr) {
    throw DataFormatError(fmt::format("Workbook has no part '{}'", name), ErrorContext{path_});
  }
  if ((entry->flags & kFlagEncrypted) != 0) {
    throw DataFormatError(fmt::format("Encrypted part '{}' is not supported", name), ErrorContext{path_});
  }

  const std::size_t header = entry->local_header_offset;
  if (header + kLocalHeaderSize > bytes_.size() || ReadU32(bytes_, header) != kLocalHeaderSignature) {
    throw DataFormatError(fmt::format("Corrupt local header for '{}'", name), ErrorContext{path_});
  }
  const std::size_t data_offset = header + kLocalHeaderSize + ReadU16(bytes_, header + 26) + ReadU16(bytes_, header + 28);
  if (data_offset + entry->compressed_size > bytes_.size()) {
    throw DataFormatError(fmt::format("Truncated data for '{}'", name), ErrorContext{path_});
  }

  const std::string compressed = bytes_.substr(data_offset, entry->compressed_size);
  switch (entry->method) {
    case kMethodStored:
      return compressed;
    case kMethodDeflated:
      if (entry->uncompressed_size > kMaxEntrySize ||
          entry->uncompressed_size > static_cast<std::uint64_t>(entry->compressed_size) * kMaxDeflateRatio + 64) {
        throw DataFormatError(fmt::format("Declared size {} of '{}' is implausible for {} compressed bytes",
                                          entry->uncompressed_size, name, entry->compressed_size),
                              ErrorContext{path_});
      }
      return Inflate(compressed, entry->uncompressed_size, path_, name);
    default:
      throw DataFormatError(fmt::format("Unsupported compression method {} for '{}'", entry->method, name),
                            ErrorContext{path_});
  }
}

const std::vector<ZipArchive::Entry>& ZipArchive::entries() const {
  return entries_;
}

const std::filesystem::path& ZipArchive::path() const {
  return path_;
}

const ZipArchive::Entry* ZipArchive::Find(const std::string& name) const {
  const auto it = std::find_if(entries_.begin(), entries_.end(), [&name](const Entry& entry) {
    return entry.name == name;
  });
  return it == entries_.end() ? nullptr : &*it;
}

}  // namespace nodevis::io
