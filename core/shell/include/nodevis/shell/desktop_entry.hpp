#pragma once

#include <filesystem>
#include <string>

namespace nodevis::shell {

inline constexpr const char* kDesktopEntryFileName = "nodevis.desktop";

// $XDG_DATA_HOME, else $HOME/.local/share. Throws std::runtime_error when neither is set.
std::filesystem::path DefaultDataHome();

std::filesystem::path DesktopEntryPath(const std::filesystem::path& data_home);
std::string RenderDesktopEntry(const std::filesystem::path& executable);

// Registers the viewer as an "Open With" handler for CSV, XLSX and STO files. Returns the written path.
std::filesystem::path InstallDesktopEntry(const std::filesystem::path& executable,
                                          const std::filesystem::path& data_home);
// Returns false when no entry was installed.
bool UninstallDesktopEntry(const std::filesystem::path& data_home);

}  // namespace nodevis::shell
