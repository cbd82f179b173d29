#include "session/session_driver.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cmath>
#include <thread>
#include <utility>

namespace session {

std::chrono::milliseconds backoffDelay(const SupervisionPolicy& policy, int failures) {
    if (failures < 1) return std::chrono::milliseconds(0);

    double delay = static_cast<double>(policy.initialBackoff.count()) *
                   std::pow(policy.backoffMultiplier, failures - 1);
    double cap = static_cast<double>(policy.maxBackoff.count());
    return std::chrono::milliseconds(static_cast<long long>(std::min(delay, cap)));
}

SessionDriver::SessionDriver(const audio::CaptureSettings& capture,
                             const SupervisionPolicy& policy,
                             DeviceFactory deviceFactory,
                             speech::Recognizer& recognizer,
                             relay::TranscriptRelay& relay,
                             std::ostream& out)
    : capture_(capture),
      policy_(policy),
      deviceFactory_(std::move(deviceFactory)),
      recognizer_(recognizer),
      dispatcher_(out, relay),
      out_(out),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
}

// ============================================================
// Outer loop
// ============================================================
DriverStop SessionDriver::run() {
    int failures = 0;

    while (true) {
        SessionOutcome outcome = runOnce();

        if (outcome == SessionOutcome::ExitRequested) {
            LOG_PHASE("Driver stopped by exit phrase", true);
            return DriverStop::ExitRequested;
        }

        if (outcome == SessionOutcome::Completed) {
            failures = 0;
            LOG_DEBUG("Driver", "Session ended, restarting");
            continue;
        }

        ++failures;
        if (policy_.maxRetries >= 0 && failures > policy_.maxRetries) {
            LOG_ERROR("Driver", "Giving up after " + std::to_string(failures) +
                                " consecutive failed sessions");
            LOG_PHASE("Driver stopped, retries exhausted", false);
            return DriverStop::RetriesExhausted;
        }

        auto delay = backoffDelay(policy_, failures);
        LOG_WARN("Driver", "Session failed (" + std::to_string(failures) + "), retrying in " +
                           std::to_string(delay.count()) + " ms");
        sleeper_(delay);
    }
}

// ============================================================
// One session
// ============================================================
SessionOutcome SessionDriver::runOnce() {
    ++sessionsStarted_;
    LOG_DEBUG("Driver", "Starting session #" + std::to_string(sessionsStarted_));

    try {
        audio::CaptureSession capture(deviceFactory_(), capture_, clock_);
        capture.open();

        auto responses = recognizer_.streamingRecognize(
            [&capture](audio::AudioChunk& chunk) { return capture.next(chunk); });

        transcript::DispatchResult result;
        try {
            result = dispatcher_.run(*responses);
        } catch (const std::exception&) {
            // Unblock the request writer before the stream is torn down
            capture.close();
            throw;
        }

        if (result.exitRequested) {
            responses->cancel();
        }
        capture.close();
        responses->finish();

        lastResult_ = result;
        LOG_DEBUG("Driver", "Session #" + std::to_string(sessionsStarted_) + " lasted " +
                            std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                                capture.elapsed()).count()) + " s");

        return result.exitRequested ? SessionOutcome::ExitRequested
                                    : SessionOutcome::Completed;
    } catch (const PipelineError& e) {
        out_ << ErrorManager::report(e.code(), e.what()) << std::endl;
        LOG_PHASE("Session", false);
        return SessionOutcome::Failed;
    }
}

} // namespace session
