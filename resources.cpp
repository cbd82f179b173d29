#include "resources.hpp"
#include "logger.hpp"

#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

// -------------------------------------------------------------
// Locate resource root (prefer repo/resources over build/resources)
// -------------------------------------------------------------
std::string getResourcePath() {
    fs::path buildPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    if (fs::exists(projectPath)) {
        LOG_DEBUG("Resources", "Using resource path: " + projectPath.string());
        return projectPath.string();
    }
    if (fs::exists(buildPath)) {
        LOG_DEBUG("Resources", "Using fallback resource path: " + buildPath.string());
        return buildPath.string();
    }

    LOG_DEBUG("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
}

// -------------------------------------------------------------
// Load a text file
// -------------------------------------------------------------
std::optional<std::string> loadTextFile(const fs::path& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        LOG_ERROR("Resources", "File not found: " + path.string());
        return std::nullopt;
    }

    LOG_DEBUG("Resources", "Loaded text file: " + path.string());
    return std::string{ std::istreambuf_iterator<char>(file),
                        std::istreambuf_iterator<char>() };
}
