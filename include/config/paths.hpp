#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sm::paths {

inline constexpr auto CONFIG_DIR_NAME = "secrets-manager";
inline constexpr auto CONFIG_FILE_NAME = "secrets-manager.yaml";

// $XDG_CONFIG_HOME/secrets-manager/secrets-manager.yaml, falling back to ~/.config.
std::optional<std::filesystem::path> getUserConfigPath();

// First existing of the user config and ./secrets-manager.yaml.
std::optional<std::filesystem::path> findConfigPath();

// Absolute path of the running executable.
std::filesystem::path getExecutablePath();

// Machine identity used when no --profile is given.
std::string getHostname();

}
