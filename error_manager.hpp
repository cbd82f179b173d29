#pragma once

#include <string>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

// ------------------------------------------------------------
// Error codes raised across the pipeline
// ------------------------------------------------------------
inline constexpr const char* ERR_DEVICE_UNAVAILABLE     = "ERR_DEVICE_UNAVAILABLE";
inline constexpr const char* ERR_RECOGNIZER_STREAM      = "ERR_RECOGNIZER_STREAM";
inline constexpr const char* ERR_RELAY_HTTP             = "ERR_RELAY_HTTP";
inline constexpr const char* ERR_CONFIG_INVALID         = "ERR_CONFIG_INVALID";
inline constexpr const char* ERR_CREDENTIALS_UNREADABLE = "ERR_CREDENTIALS_UNREADABLE";

// ------------------------------------------------------------
// PipelineError: a failure that ends the current session attempt
// ------------------------------------------------------------
class PipelineError : public std::runtime_error {
public:
    PipelineError(std::string code, const std::string& detail)
        : std::runtime_error(detail), code_(std::move(code)) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Install the error catalogue ({"CODE": {"user": ..., "debug": ...}}).
    // Accepts either the bare map or {"errors": {...}}.
    void load(const nlohmann::json& catalogue);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Log an error and return the user-facing message
    std::string report(const std::string& code, const std::string& detail = "");
}
