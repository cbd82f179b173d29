#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <fstream>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
static bool mergeDefaults(nlohmann::json& cfg,
                          const nlohmann::json& defs,
                          const std::string& prefix = "",
                          int* patchedCount = nullptr) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        std::string path = prefix.empty() ? key : prefix + "." + key;

        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, path, patchedCount))
                patched = true;
        } else if (defVal.is_number() && cfg[key].is_number()) {
            // 2 vs 2.0 is not a type mismatch
            continue;
        } else if (cfg[key].type() != defVal.type()) {
            LOG_WARN("Config", path + " has the wrong type, reset to default");
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

static void saveJson(const fs::path& path, const nlohmann::json& j) {
    std::ofstream out(path);
    if (!out) {
        LOG_WARN("Config", "Could not write " + path.string());
        return;
    }
    out << j.dump(2);
}

// Logs and returns true when a typed value must fall back to its default
static bool outOfRange(bool invalid, const std::string& path) {
    if (invalid) {
        LOG_WARN("Config", path + " is out of range, reset to default");
    }
    return invalid;
}

// ----------------- defaults -----------------
namespace bootstrap_config {

nlohmann::json defaultApp() {
    return {
        {"audio", {
            {"sample_rate", 16000},
            {"chunk_ms", 100},
            {"input_device_index", -1},
            {"session_limit_s", 300}
        }},

        {"recognizer", {
            {"endpoint", "speech.googleapis.com:443"},
            {"use_tls", true},
            {"credentials_file", ""},
            {"language_code", "en-US"},
            {"interim_results", true},
            {"model", ""},
            {"automatic_punctuation", false}
        }},

        {"relay", {
            {"base_url", "http://localhost:8000"},
            {"interview_id", 1},
            {"timeout_ms", 60000}
        }},

        {"supervision", {
            {"max_retries", 5},
            {"initial_backoff_ms", 500},
            {"max_backoff_ms", 30000},
            {"backoff_multiplier", 2.0}
        }},

        {"log", {
            {"file", "intervox.log"},
            {"level", "phase"},
            {"console", true}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {ERR_DEVICE_UNAVAILABLE, {
            {"user", "[Audio] Microphone unavailable, retrying."},
            {"debug", "Input device could not be opened or started."}
        }},
        {ERR_RECOGNIZER_STREAM, {
            {"user", "[Speech] Recognition stream failed, restarting session."},
            {"debug", "StreamingRecognize call ended with a non-OK status."}
        }},
        {ERR_RELAY_HTTP, {
            {"user", "Error sending request to backend."},
            {"debug", "Backend relay POST failed (transport or HTTP status)."}
        }},
        {ERR_CONFIG_INVALID, {
            {"user", "[Config] Config file invalid → reset to defaults."},
            {"debug", "Config file failed parsing or validation."}
        }},
        {ERR_CREDENTIALS_UNREADABLE, {
            {"user", "[Speech] Could not load recognizer credentials."},
            {"debug", "Credentials file missing, unreadable or not a service account key."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        saveJson(path, outConfig);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;
        if (!outConfig.is_object()) {
            throw std::runtime_error("top level is not an object");
        }

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, "", &patchedCount)) {
            saveJson(path, outConfig);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + e.what() + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode, path.string());

        outConfig = defaults;
        saveJson(path, outConfig);
        return false;
    }
}

// ----------------- typed view -----------------
AppSettings settingsFromJson(const nlohmann::json& cfg) {
    AppSettings s;
    const nlohmann::json empty = nlohmann::json::object();

    const auto& audioCfg = cfg.contains("audio") ? cfg["audio"] : empty;
    s.audio.sampleRate       = audioCfg.value("sample_rate", s.audio.sampleRate);
    s.audio.chunkMs          = audioCfg.value("chunk_ms", s.audio.chunkMs);
    s.audio.inputDeviceIndex = audioCfg.value("input_device_index", s.audio.inputDeviceIndex);
    s.audio.sessionLimit     = std::chrono::seconds(audioCfg.value("session_limit_s", 300));

    const auto& recCfg = cfg.contains("recognizer") ? cfg["recognizer"] : empty;
    s.recognizer.endpoint             = recCfg.value("endpoint", s.recognizer.endpoint);
    s.recognizer.useTls               = recCfg.value("use_tls", s.recognizer.useTls);
    s.recognizer.credentialsFile      = recCfg.value("credentials_file", s.recognizer.credentialsFile);
    s.recognizer.languageCode         = recCfg.value("language_code", s.recognizer.languageCode);
    s.recognizer.interimResults       = recCfg.value("interim_results", s.recognizer.interimResults);
    s.recognizer.model                = recCfg.value("model", s.recognizer.model);
    s.recognizer.automaticPunctuation = recCfg.value("automatic_punctuation", s.recognizer.automaticPunctuation);

    const auto& relayCfg = cfg.contains("relay") ? cfg["relay"] : empty;
    s.relay.baseUrl     = relayCfg.value("base_url", s.relay.baseUrl);
    s.relay.interviewId = relayCfg.value("interview_id", s.relay.interviewId);
    s.relay.timeoutMs   = relayCfg.value("timeout_ms", s.relay.timeoutMs);

    const auto& supCfg = cfg.contains("supervision") ? cfg["supervision"] : empty;
    s.supervision.maxRetries        = supCfg.value("max_retries", s.supervision.maxRetries);
    s.supervision.initialBackoff    = std::chrono::milliseconds(supCfg.value("initial_backoff_ms", 500));
    s.supervision.maxBackoff        = std::chrono::milliseconds(supCfg.value("max_backoff_ms", 30000));
    s.supervision.backoffMultiplier = supCfg.value("backoff_multiplier", s.supervision.backoffMultiplier);

    const auto& logCfg = cfg.contains("log") ? cfg["log"] : empty;
    s.log.file    = logCfg.value("file", s.log.file);
    s.log.level   = logCfg.value("level", s.log.level);
    s.log.console = logCfg.value("console", s.log.console);

    // Types are already fixed by mergeDefaults, ranges are checked here
    const AppSettings defaults;
    if (outOfRange(s.audio.sampleRate <= 0, "audio.sample_rate"))
        s.audio.sampleRate = defaults.audio.sampleRate;
    if (outOfRange(s.audio.chunkMs <= 0, "audio.chunk_ms"))
        s.audio.chunkMs = defaults.audio.chunkMs;
    if (outOfRange(s.audio.sessionLimit.count() <= 0, "audio.session_limit_s"))
        s.audio.sessionLimit = defaults.audio.sessionLimit;
    if (outOfRange(s.relay.timeoutMs < 0, "relay.timeout_ms"))
        s.relay.timeoutMs = defaults.relay.timeoutMs;
    if (outOfRange(s.supervision.initialBackoff.count() < 0, "supervision.initial_backoff_ms"))
        s.supervision.initialBackoff = defaults.supervision.initialBackoff;
    if (outOfRange(s.supervision.maxBackoff.count() < 0, "supervision.max_backoff_ms"))
        s.supervision.maxBackoff = defaults.supervision.maxBackoff;
    if (outOfRange(!(s.supervision.backoffMultiplier >= 1.0), "supervision.backoff_multiplier"))
        s.supervision.backoffMultiplier = defaults.supervision.backoffMultiplier;

    s.recognizer.sampleRateHertz = s.audio.sampleRate;
    return s;
}

// ----------------- entry -----------------
AppSettings initAll(const fs::path& configPath) {
    // Catalogue defaults first so config errors can be reported
    ErrorManager::load(defaultErrors());

    fs::path errPath = fs::path(getResourcePath()) / ERRORS_FILE;
    nlohmann::json errorsCfg;
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config");
    ErrorManager::load(errorsCfg);

    nlohmann::json appCfg;
    loadConfig(configPath, defaultApp(), appCfg, "App config", ERR_CONFIG_INVALID);

    return settingsFromJson(appCfg);
}

} // namespace bootstrap_config
