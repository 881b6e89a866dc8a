#pragma once

#include <cstdlib>
#include <filesystem>

namespace wledbackup::core {
namespace path {

inline const std::filesystem::path kConfigDir = []() -> std::filesystem::path {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return std::filesystem::path(xdg) / "wled-backup";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / ".config" / "wled-backup";
    }
    return std::filesystem::path(".wled-backup");
}();

inline const std::filesystem::path kDefaultConfigFile = kConfigDir / "config.toml";

} // namespace path
} // namespace wledbackup::core
