#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <ostream>
#include <utility>
#include "audio/capture_session.hpp"
#include "speech/recognizer.hpp"
#include "relay/backend_relay.hpp"
#include "transcript/transcript_dispatcher.hpp"

namespace session {

/// Restart policy for failed sessions. max_retries < 0 retries forever.
struct SupervisionPolicy {
    int maxRetries = 5;
    std::chrono::milliseconds initialBackoff{500};
    std::chrono::milliseconds maxBackoff{30000};
    double backoffMultiplier = 2.0;
};

// Delay before retrying after the n-th consecutive failure (n >= 1)
std::chrono::milliseconds backoffDelay(const SupervisionPolicy& policy, int failures);

enum class DriverStop {
    ExitRequested,     // exit/quit heard
    RetriesExhausted   // too many consecutive failed sessions
};

enum class SessionOutcome {
    Completed,         // chunk stream ended (timeout) or recognizer closed cleanly
    ExitRequested,
    Failed
};

/// SessionDriver
/// Runs capture -> recognize -> dispatch cycles back to back, each with a
/// fresh device, session and streaming call.
class SessionDriver {
public:
    using DeviceFactory = std::function<std::unique_ptr<audio::CaptureDevice>()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    SessionDriver(const audio::CaptureSettings& capture,
                  const SupervisionPolicy& policy,
                  DeviceFactory deviceFactory,
                  speech::Recognizer& recognizer,
                  relay::TranscriptRelay& relay,
                  std::ostream& out);

    // Test hooks
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void setClock(audio::CaptureSession::Clock clock) { clock_ = std::move(clock); }

    DriverStop run();

    // One full session; PipelineErrors are reported and turned into Failed
    SessionOutcome runOnce();

    int sessionsStarted() const { return sessionsStarted_; }
    const transcript::DispatchResult& lastResult() const { return lastResult_; }

private:
    audio::CaptureSettings capture_;
    SupervisionPolicy policy_;
    DeviceFactory deviceFactory_;
    speech::Recognizer& recognizer_;
    transcript::TranscriptDispatcher dispatcher_;
    std::ostream& out_;

    Sleeper sleeper_;
    audio::CaptureSession::Clock clock_;

    int sessionsStarted_ = 0;
    transcript::DispatchResult lastResult_;
};

} // namespace session
