#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"
#include "audio/portaudio_device.hpp"
#include "speech/recognizer.hpp"
#include "relay/backend_relay.hpp"
#include "session/session_driver.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

struct CommandLine {
    std::string configPath = APP_CONFIG_FILE;
    std::optional<std::string> credentials;
    std::optional<std::string> language;
    bool listDevices = false;
    bool help = false;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --config <path>       config file (default " << APP_CONFIG_FILE << ")\n"
              << "  --credentials <path>  service account key for the recognizer\n"
              << "  --language <tag>      recognition language, e.g. en-US\n"
              << "  --list-devices        list audio input devices and exit\n"
              << "  --help                show this help\n";
}

// Returns std::nullopt on a malformed command line
std::optional<CommandLine> parseArgs(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto takeValue = [&](std::string& dst) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            dst = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--list-devices") {
            cmd.listDevices = true;
        } else if (arg == "--config") {
            if (!takeValue(cmd.configPath)) return std::nullopt;
        } else if (arg == "--credentials") {
            std::string v;
            if (!takeValue(v)) return std::nullopt;
            cmd.credentials = v;
        } else if (arg == "--language") {
            std::string v;
            if (!takeValue(v)) return std::nullopt;
            cmd.language = v;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }
    return cmd;
}

} // namespace

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    auto cmd = parseArgs(argc, argv);
    if (!cmd) {
        printUsage(argv[0]);
        return 1;
    }
    if (cmd->help) {
        printUsage(argv[0]);
        return 0;
    }
    if (cmd->listDevices) {
        return audio::listInputDevices(std::cout) ? 0 : 1;
    }

    // Bootstrap configuration (phases buffered until the logger is set up)
    beginPhaseGroup();
    AppSettings settings = bootstrap_config::initAll(cmd->configPath);

    if (cmd->credentials) settings.recognizer.credentialsFile = *cmd->credentials;
    if (cmd->language)    settings.recognizer.languageCode = *cmd->language;

    initLogger(settings.log.file, parseLogLevel(settings.log.level), settings.log.console);
    endPhaseGroup();
    LOG_PHASE("Startup begin", true);

    std::unique_ptr<speech::CloudSpeechRecognizer> recognizer;
    try {
        recognizer = std::make_unique<speech::CloudSpeechRecognizer>(settings.recognizer);
    } catch (const PipelineError& e) {
        std::cerr << ErrorManager::report(e.code(), e.what()) << std::endl;
        LOG_PHASE("Recognizer setup", false);
        shutdownLogger();
        return 1;
    }

    relay::BackendRelay backend(settings.relay, std::cout);

    session::SessionDriver driver(
        settings.audio,
        settings.supervision,
        [] { return std::make_unique<audio::PortAudioDevice>(); },
        *recognizer,
        backend,
        std::cout);

    LOG_PHASE("Startup complete, entering session loop", true);
    std::cout << "Listening (" << settings.recognizer.languageCode
              << "). Say \"exit\" or \"quit\" to stop.\n";

    session::DriverStop stop = driver.run();

    int exitCode = 0;
    if (stop == session::DriverStop::RetriesExhausted) {
        PhaseInfo last = lastPhase();
        std::cerr << "Stopping after repeated failures (last phase: "
                  << last.phaseName << " in " << last.fileName << ")" << std::endl;
        exitCode = 1;
    }

    LOG_PHASE("Shutdown complete", true);
    shutdownLogger();
    return exitCode;
}
