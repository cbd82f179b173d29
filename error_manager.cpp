#include "error_manager.hpp"
#include "logger.hpp"

#include <mutex>

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
namespace ErrorManager {

static std::mutex g_errorsMutex;
static nlohmann::json g_root = nlohmann::json::object();

void load(const nlohmann::json& catalogue) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);

    if (catalogue.contains("errors") && catalogue["errors"].is_object()) {
        g_root = catalogue["errors"];
    } else if (catalogue.is_object()) {
        g_root = catalogue;
    } else {
        LOG_WARN("ErrorManager", "Error catalogue is not an object, keeping previous");
        return;
    }

    std::string codes;
    for (auto& [key, val] : g_root.items()) {
        codes += key + " ";
    }
    LOG_DEBUG("ErrorManager", "Available error codes: " + codes);
}

std::string getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (g_root.contains(code) && g_root[code].contains("user") && g_root[code]["user"].is_string()) {
        return g_root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (g_root.contains(code) && g_root[code].contains("debug") && g_root[code]["debug"].is_string()) {
        return g_root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

std::string report(const std::string& code, const std::string& detail) {
    std::string userMsg  = getUserMessage(code);
    std::string debugMsg = getDebugMessage(code);

    if (detail.empty()) {
        LOG_ERROR("ErrorManager", code + " -> " + debugMsg);
    } else {
        LOG_ERROR("ErrorManager", code + " -> " + debugMsg + ": " + detail);
    }
    return userMsg;
}

} // namespace ErrorManager
