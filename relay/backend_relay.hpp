#pragma once
#include <string>
#include <string_view>
#include <ostream>

namespace relay {

struct RelaySettings {
    std::string baseUrl = "http://localhost:8000";
    int interviewId = 1;
    int timeoutMs = 60000;

    std::string endpointUrl() const {
        return baseUrl + "/api/v1/interviews/" + std::to_string(interviewId) + "/start";
    }
};

/// Receives every final transcript.
class TranscriptRelay {
public:
    virtual ~TranscriptRelay() = default;

    // True if the transcript was delivered
    virtual bool send(const std::string& transcript) = 0;
};

/// BackendRelay
/// POSTs {"Question": transcript} and streams the reply onto one
/// console line, rewriting the whole accumulated text on every chunk.
/// Transport and HTTP errors are logged and reported, never thrown.
class BackendRelay : public TranscriptRelay {
public:
    BackendRelay(RelaySettings settings, std::ostream& out);

    bool send(const std::string& transcript) override;

private:
    RelaySettings settings_;
    std::ostream& out_;
};

// {"Question": "<transcript>"}
std::string buildPayload(const std::string& transcript);

// Status code from an "HTTP/1.1 200 OK" header line, 0 if it is not one
long parseStatusLine(std::string_view line);

} // namespace relay
