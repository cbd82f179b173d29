#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "session/session_driver.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

class BootstrapConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / ("intervox_cfg_" + std::string(info->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        path_ = dir_ / "intervox_config.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }

    json readBack() {
        std::ifstream in(path_);
        return json::parse(in);
    }

    fs::path dir_;
    fs::path path_;
};

} // namespace

TEST_F(BootstrapConfigTest, MissingFileIsCreatedFromDefaults) {
    json cfg;
    EXPECT_TRUE(bootstrap_config::loadConfig(path_, bootstrap_config::defaultApp(), cfg, "App config"));

    EXPECT_EQ(cfg, bootstrap_config::defaultApp());
    ASSERT_TRUE(fs::exists(path_));
    EXPECT_EQ(readBack(), bootstrap_config::defaultApp());
}

TEST_F(BootstrapConfigTest, PartialFileIsPatchedAndSaved) {
    write(R"({"relay": {"interview_id": 7}, "audio": {"session_limit_s": 60}})");

    json cfg;
    EXPECT_TRUE(bootstrap_config::loadConfig(path_, bootstrap_config::defaultApp(), cfg, "App config"));

    EXPECT_EQ(cfg["relay"]["interview_id"], 7);
    EXPECT_EQ(cfg["relay"]["base_url"], "http://localhost:8000");
    EXPECT_EQ(cfg["audio"]["session_limit_s"], 60);
    EXPECT_EQ(cfg["audio"]["sample_rate"], 16000);
    EXPECT_TRUE(cfg.contains("supervision"));

    json saved = readBack();
    EXPECT_EQ(saved["relay"]["interview_id"], 7);
    EXPECT_TRUE(saved["recognizer"].contains("language_code"));
}

TEST_F(BootstrapConfigTest, WrongTypeIsResetToDefault) {
    write(R"({"audio": {"sample_rate": "fast"}, "supervision": {"backoff_multiplier": 3}})");

    json cfg;
    EXPECT_TRUE(bootstrap_config::loadConfig(path_, bootstrap_config::defaultApp(), cfg, "App config"));

    EXPECT_EQ(cfg["audio"]["sample_rate"], 16000);
    // Integer where a float is expected is kept
    EXPECT_EQ(cfg["supervision"]["backoff_multiplier"], 3);
}

TEST_F(BootstrapConfigTest, InvalidJsonFallsBackToDefaults) {
    write("{ this is not json");

    json cfg;
    EXPECT_FALSE(bootstrap_config::loadConfig(path_, bootstrap_config::defaultApp(), cfg,
                                              "App config", ERR_CONFIG_INVALID));
    EXPECT_EQ(cfg, bootstrap_config::defaultApp());
    EXPECT_EQ(readBack(), bootstrap_config::defaultApp());
}

TEST_F(BootstrapConfigTest, NonObjectTopLevelFallsBackToDefaults) {
    write("[1, 2, 3]");

    json cfg;
    EXPECT_FALSE(bootstrap_config::loadConfig(path_, bootstrap_config::defaultApp(), cfg, "App config"));
    EXPECT_EQ(cfg, bootstrap_config::defaultApp());
}

TEST(SettingsFromJson, DefaultsMatchTypedDefaults) {
    AppSettings s = bootstrap_config::settingsFromJson(bootstrap_config::defaultApp());

    EXPECT_EQ(s.audio.sampleRate, 16000);
    EXPECT_EQ(s.audio.chunkMs, 100);
    EXPECT_EQ(s.audio.framesPerChunk(), 1600u);
    EXPECT_EQ(s.audio.sessionLimit, std::chrono::seconds(300));
    EXPECT_EQ(s.recognizer.languageCode, "en-US");
    EXPECT_TRUE(s.recognizer.interimResults);
    EXPECT_TRUE(s.recognizer.useTls);
    EXPECT_EQ(s.relay.endpointUrl(), "http://localhost:8000/api/v1/interviews/1/start");
    EXPECT_EQ(s.supervision.maxRetries, 5);
    EXPECT_EQ(s.supervision.initialBackoff, std::chrono::milliseconds(500));
    EXPECT_EQ(s.log.level, "phase");
}

TEST(SettingsFromJson, MapsOverriddenValues) {
    json cfg = bootstrap_config::defaultApp();
    cfg["audio"]["sample_rate"] = 8000;
    cfg["audio"]["session_limit_s"] = 30;
    cfg["recognizer"]["language_code"] = "fr-FR";
    cfg["recognizer"]["use_tls"] = false;
    cfg["relay"]["interview_id"] = 12;
    cfg["supervision"]["max_retries"] = -1;
    cfg["supervision"]["max_backoff_ms"] = 2000;

    AppSettings s = bootstrap_config::settingsFromJson(cfg);

    EXPECT_EQ(s.audio.sampleRate, 8000);
    EXPECT_EQ(s.recognizer.sampleRateHertz, 8000);
    EXPECT_EQ(s.audio.framesPerChunk(), 800u);
    EXPECT_EQ(s.audio.sessionLimit, std::chrono::seconds(30));
    EXPECT_EQ(s.recognizer.languageCode, "fr-FR");
    EXPECT_FALSE(s.recognizer.useTls);
    EXPECT_EQ(s.relay.interviewId, 12);
    EXPECT_EQ(s.supervision.maxRetries, -1);
    EXPECT_EQ(s.supervision.maxBackoff, std::chrono::milliseconds(2000));
}

TEST(SettingsFromJson, MissingSectionsKeepDefaults) {
    AppSettings s = bootstrap_config::settingsFromJson(json::object());
    EXPECT_EQ(s.audio.sampleRate, 16000);
    EXPECT_EQ(s.relay.timeoutMs, 60000);
}

TEST(SettingsFromJson, OutOfRangeValuesFallBackToDefaults) {
    json cfg = bootstrap_config::defaultApp();
    cfg["audio"]["sample_rate"] = 0;
    cfg["audio"]["chunk_ms"] = -100;
    cfg["audio"]["session_limit_s"] = -5;
    cfg["relay"]["timeout_ms"] = -1;
    cfg["supervision"]["initial_backoff_ms"] = -500;
    cfg["supervision"]["max_backoff_ms"] = -1;
    cfg["supervision"]["backoff_multiplier"] = 0.5;

    AppSettings s = bootstrap_config::settingsFromJson(cfg);

    EXPECT_EQ(s.audio.sampleRate, 16000);
    EXPECT_EQ(s.recognizer.sampleRateHertz, 16000);
    EXPECT_EQ(s.audio.chunkMs, 100);
    EXPECT_EQ(s.audio.framesPerChunk(), 1600u);
    EXPECT_EQ(s.audio.sessionLimit, std::chrono::seconds(300));
    EXPECT_EQ(s.relay.timeoutMs, 60000);
    EXPECT_EQ(s.supervision.initialBackoff, std::chrono::milliseconds(500));
    EXPECT_EQ(s.supervision.maxBackoff, std::chrono::milliseconds(30000));
    EXPECT_DOUBLE_EQ(s.supervision.backoffMultiplier, 2.0);

    // Repaired policy never yields a negative sleep
    EXPECT_GE(session::backoffDelay(s.supervision, 3).count(), 0);
}

TEST(SettingsFromJson, ZeroSessionLimitIsRejected) {
    json cfg = bootstrap_config::defaultApp();
    cfg["audio"]["session_limit_s"] = 0;

    AppSettings s = bootstrap_config::settingsFromJson(cfg);
    EXPECT_EQ(s.audio.sessionLimit, std::chrono::seconds(300));
}

TEST(SettingsFromJson, BoundaryValuesAreKept) {
    json cfg = bootstrap_config::defaultApp();
    cfg["supervision"]["backoff_multiplier"] = 1.0;
    cfg["supervision"]["initial_backoff_ms"] = 0;
    cfg["relay"]["timeout_ms"] = 0;
    cfg["audio"]["session_limit_s"] = 1;

    AppSettings s = bootstrap_config::settingsFromJson(cfg);
    EXPECT_DOUBLE_EQ(s.supervision.backoffMultiplier, 1.0);
    EXPECT_EQ(s.supervision.initialBackoff, std::chrono::milliseconds(0));
    EXPECT_EQ(s.relay.timeoutMs, 0);
    EXPECT_EQ(s.audio.sessionLimit, std::chrono::seconds(1));
}

TEST(ErrorCatalogue, ReportReturnsUserMessage) {
    ErrorManager::load(bootstrap_config::defaultErrors());
    EXPECT_EQ(ErrorManager::report(ERR_RELAY_HTTP, "refused"), "Error sending request to backend.");
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_NOPE"), "[Error] Unknown error code: ERR_NOPE");
}

TEST(ErrorCatalogue, AcceptsWrappedCatalogue) {
    ErrorManager::load(json{{"errors", {{"ERR_X", {{"user", "x happened"}, {"debug", "dx"}}}}}});
    EXPECT_EQ(ErrorManager::getUserMessage("ERR_X"), "x happened");
    EXPECT_EQ(ErrorManager::getDebugMessage("ERR_X"), "dx");
    ErrorManager::load(bootstrap_config::defaultErrors());
}

TEST(LogLevel, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("Warn"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("phase"), LogLevel::Phase);
    EXPECT_EQ(parseLogLevel("nonsense"), LogLevel::Phase);
}
