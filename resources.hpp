#pragma once
#include <string>
#include <optional>
#include <filesystem>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* APP_CONFIG_FILE = "intervox_config.json";
inline constexpr const char* ERRORS_FILE     = "errors.json";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------

// Directory holding errors.json (repo/resources, build/resources, or cwd)
std::string getResourcePath();

// Read a whole text file (credentials, catalogues).
// Returns std::nullopt when the file cannot be opened.
std::optional<std::string> loadTextFile(const std::filesystem::path& path);
