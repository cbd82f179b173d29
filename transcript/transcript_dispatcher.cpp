#include "transcript/transcript_dispatcher.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <regex>

namespace transcript {

size_t overwritePadding(size_t printed, size_t length) {
    return printed > length ? printed - length : 0;
}

bool isExitPhrase(const std::string& text) {
    static const std::regex exitPattern(R"(\b(exit|quit)\b)", std::regex::icase);
    return std::regex_search(text, exitPattern);
}

TranscriptDispatcher::TranscriptDispatcher(std::ostream& out, relay::TranscriptRelay& relay)
    : out_(out), relay_(relay) {
}

// ------------------------------------------------------------
// Response loop
// ------------------------------------------------------------
DispatchResult TranscriptDispatcher::run(speech::ResponseStream& responses) {
    DispatchResult result;
    numCharsPrinted_ = 0;

    speech::pb::StreamingRecognizeResponse response;
    while (responses.next(response)) {
        if (handle(response, result)) break;
        response.Clear();
    }
    return result;
}

bool TranscriptDispatcher::handle(const speech::pb::StreamingRecognizeResponse& response,
                                  DispatchResult& result) {
    if (response.results_size() == 0) return false;

    const auto& first = response.results(0);
    if (first.alternatives_size() == 0) return false;

    const std::string& text = first.alternatives(0).transcript();
    std::string padding(overwritePadding(numCharsPrinted_, text.size()), ' ');

    if (!first.is_final()) {
        out_ << text << padding << '\r' << std::flush;
        numCharsPrinted_ = text.size();
        return false;
    }

    out_ << text << padding << '\n' << std::flush;
    result.lastTranscript = text;
    LOG_TRACE("Dispatcher", "Final transcript: " + text);

    forward(text);

    if (isExitPhrase(text)) {
        out_ << "Exiting.." << std::endl;
        LOG_PHASE("Exit phrase detected", true);
        result.exitRequested = true;
        return true;
    }

    numCharsPrinted_ = 0;
    return false;
}

// Relay failures never leave the dispatcher
void TranscriptDispatcher::forward(const std::string& text) {
    if (text.empty()) return;

    try {
        if (!relay_.send(text)) {
            LOG_DEBUG("Dispatcher", "Relay did not deliver transcript");
        }
    } catch (const std::exception& e) {
        std::string userMsg = ErrorManager::report(ERR_RELAY_HTTP, e.what());
        out_ << userMsg << std::endl;
    }
}

} // namespace transcript
