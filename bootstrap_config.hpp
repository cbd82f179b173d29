#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>
#include "audio/capture_session.hpp"
#include "speech/recognizer.hpp"
#include "relay/backend_relay.hpp"
#include "session/session_driver.hpp"

struct LogSettings {
    std::string file = "intervox.log";
    std::string level = "phase";
    bool console = true;
};

struct AppSettings {
    audio::CaptureSettings audio;
    speech::RecognitionSettings recognizer;
    relay::RelaySettings relay;
    session::SupervisionPolicy supervision;
    LogSettings log;
};

// Centralized config bootstrap for intervox
namespace bootstrap_config {

    // Load (or create) the app config and the error catalogue, install the
    // catalogue into ErrorManager and return the typed settings.
    AppSettings initAll(const std::filesystem::path& configPath);

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Canonical defaults
    nlohmann::json defaultApp();
    nlohmann::json defaultErrors();

    AppSettings settingsFromJson(const nlohmann::json& cfg);
}
