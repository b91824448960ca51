#include "nodevis/shell/desktop_entry.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace nodevis::shell {
namespace {

constexpr const char* kMimeTypes =
    "text/csv;text/plain;application/vnd.openxmlformats-officedocument.spreadsheetml.sheet;";

}  // namespace

std::filesystem::path DefaultDataHome() {
  if (const char* xdg_data_home = std::getenv("XDG_DATA_HOME"); xdg_data_home != nullptr && *xdg_data_home != '\0') {
    return xdg_data_home;
  }
  if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return std::filesystem::path(home) / ".local" / "share";
  }
  throw std::runtime_error("Neither XDG_DATA_HOME nor HOME is set");
}

std::filesystem::path DesktopEntryPath(const std::filesystem::path& data_home) {
  return data_home / "applications" / kDesktopEntryFileName;
}

std::string RenderDesktopEntry(const std::filesystem::path& executable) {
  return fmt::format(
      "[Desktop Entry]\n"
      "Type=Application\n"
      "Name=nodevis\n"
      "Comment=Play back multi-sensor quaternion recordings in 3D\n"
      "Exec=\"{}\" %f\n"
      "Terminal=false\n"
      "NoDisplay=true\n"
      "MimeType={}\n"
      "Categories=Science;Viewer;\n",
      executable.string(), kMimeTypes);
}

std::filesystem::path InstallDesktopEntry(const std::filesystem::path& executable,
                                          const std::filesystem::path& data_home) {
  const std::filesystem::path entry_path = DesktopEntryPath(data_home);
  std::error_code error;
  std::filesystem::create_directories(entry_path.parent_path(), error);
  if (error) {
    throw std::runtime_error(
        fmt::format("Could not create {}: {}", entry_path.parent_path().string(), error.message()));
  }

  std::ofstream stream(entry_path, std::ios::trunc);
  if (!stream.is_open()) {
    throw std::runtime_error(fmt::format("Could not write {}", entry_path.string()));
  }
  stream << RenderDesktopEntry(std::filesystem::absolute(executable));
  stream.close();
  if (!stream) {
    throw std::runtime_error(fmt::format("Failed while writing {}", entry_path.string()));
  }

  spdlog::info("Installed desktop entry {}", entry_path.string());
  return entry_path;
}

bool UninstallDesktopEntry(const std::filesystem::path& data_home) {
  const std::filesystem::path entry_path = DesktopEntryPath(data_home);
  std::error_code error;
  const bool removed = std::filesystem::remove(entry_path, error);
  if (error) {
    throw std::runtime_error(fmt::format("Could not remove {}: {}", entry_path.string(), error.message()));
  }
  if (removed) {
    spdlog::info("Removed desktop entry {}", entry_path.string());
  } else {
    spdlog::info("No desktop entry installed at {}", entry_path.string());
  }
  return removed;
}

}  // namespace nodevis::shell
