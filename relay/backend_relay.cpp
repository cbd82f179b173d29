#include "relay/backend_relay.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <utility>

namespace relay {

std::string buildPayload(const std::string& transcript) {
    return nlohmann::json{{"Question", transcript}}.dump();
}

long parseStatusLine(std::string_view line) {
    if (line.rfind("HTTP/", 0) != 0) return 0;

    size_t space = line.find(' ');
    if (space == std::string_view::npos) return 0;

    long code = 0;
    int digits = 0;
    for (size_t i = space + 1; i < line.size() && digits < 3; ++i, ++digits) {
        char c = line[i];
        if (c < '0' || c > '9') return 0;
        code = code * 10 + (c - '0');
    }
    return digits == 3 ? code : 0;
}

BackendRelay::BackendRelay(RelaySettings settings, std::ostream& out)
    : settings_(std::move(settings)), out_(out) {
}

// =========================================================
// Streaming POST
// =========================================================
bool BackendRelay::send(const std::string& transcript) {
    if (transcript.empty()) return false;

    out_ << "Sending text to backend: " << transcript << std::endl;
    LOG_DEBUG("Relay", "POST " + settings_.endpointUrl());

    long status = 0;
    std::string reply;
    std::string errorBody;

    auto resp = cpr::Post(
        cpr::Url{ settings_.endpointUrl() },
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{ buildPayload(transcript) },
        cpr::Timeout{ settings_.timeoutMs },
        cpr::HeaderCallback{ [&](std::string_view header, intptr_t) {
            // Redirects and 100-continue bring more than one status line
            long code = parseStatusLine(header);
            if (code != 0) status = code;
            return true;
        } },
        cpr::WriteCallback{ [&](std::string_view data, intptr_t) {
            if (status >= 200 && status < 300) {
                reply.append(data.data(), data.size());
                out_ << '\r' << reply << std::flush;
            } else {
                errorBody.append(data.data(), data.size());
            }
            return true;
        } }
    );

    if (!reply.empty()) {
        out_ << std::endl;
    }

    if (resp.error.code != cpr::ErrorCode::OK) {
        out_ << ErrorManager::report(ERR_RELAY_HTTP, resp.error.message) << std::endl;
        LOG_PHASE("Relay request", false);
        return false;
    }

    long finalStatus = resp.status_code != 0 ? resp.status_code : status;
    if (finalStatus < 200 || finalStatus >= 300) {
        out_ << ErrorManager::report(ERR_RELAY_HTTP,
                                     "HTTP " + std::to_string(finalStatus) + " " + errorBody)
             << std::endl;
        LOG_PHASE("Relay request", false);
        return false;
    }

    LOG_DEBUG("Relay", "Backend replied with " + std::to_string(reply.size()) + " bytes");
    LOG_PHASE("Relay request", true);
    return true;
}

} // namespace relay
