#pragma once
#include <string>
#include <ostream>
#include <cstddef>
#include "speech/recognizer.hpp"
#include "relay/backend_relay.hpp"

namespace transcript {

struct DispatchResult {
    std::string lastTranscript;   // last final transcript, empty if none
    bool exitRequested = false;   // an exit/quit phrase was heard
};

/// TranscriptDispatcher
/// Renders interim results in place (trailing '\r') and final results on
/// their own line, forwards finals to the relay and stops on "exit"/"quit".
class TranscriptDispatcher {
public:
    TranscriptDispatcher(std::ostream& out, relay::TranscriptRelay& relay);

    DispatchResult run(speech::ResponseStream& responses);

    // Returns true when the loop should stop
    bool handle(const speech::pb::StreamingRecognizeResponse& response, DispatchResult& result);

    size_t charsPrinted() const { return numCharsPrinted_; }

private:
    void forward(const std::string& text);

    std::ostream& out_;
    relay::TranscriptRelay& relay_;
    size_t numCharsPrinted_ = 0;
};

// Spaces needed to blank out the rest of a longer previous line
size_t overwritePadding(size_t printed, size_t length);

// Whole-word, case-insensitive "exit" or "quit"
bool isExitPhrase(const std::string& text);

} // namespace transcript
