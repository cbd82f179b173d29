#include "audio/capture_session.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <utility>

namespace audio {

CaptureSession::CaptureSession(std::unique_ptr<CaptureDevice> device,
                               const CaptureSettings& settings,
                               Clock clock)
    : device_(std::move(device)),
      settings_(settings),
      clock_(clock ? std::move(clock)
                   : Clock([] { return std::chrono::steady_clock::now(); })) {
}

CaptureSession::~CaptureSession() {
    close();
}

// ---------------- Open ----------------
void CaptureSession::open() {
    if (opened_) {
        LOG_WARN("Capture", "Session already opened");
        return;
    }
    if (!device_) {
        throw PipelineError(ERR_DEVICE_UNAVAILABLE, "No capture device attached to session");
    }

    DeviceParams params;
    params.sampleRate       = settings_.sampleRate;
    params.framesPerBuffer  = settings_.framesPerChunk();
    params.inputDeviceIndex = settings_.inputDeviceIndex;

    device_->open(params, [this](const char* data, std::size_t bytes) {
        queue_.push(AudioChunk(data, bytes));
    });

    opened_      = true;
    startedOnce_ = true;
    startTime_   = clock_();
    closed_      = false;

    LOG_PHASE("Capture session opened", true);
}

// ---------------- Generator ----------------
bool CaptureSession::next(AudioChunk& out) {
    if (exhausted_ || !startedOnce_) {
        return false;
    }

    // Duration limit is checked only at the top of each pull
    if (clock_() - startTime_ > settings_.sessionLimit) {
        LOG_DEBUG("Capture", "Session limit reached, ending chunk stream");
        exhausted_ = true;
        return false;
    }

    std::optional<AudioChunk> first = queue_.pop();
    if (!first) {
        exhausted_ = true;
        return false;
    }
    out = std::move(*first);

    // Merge whatever is already buffered behind it
    std::optional<AudioChunk> more;
    while (queue_.tryPop(more)) {
        if (!more) {
            // Hand out what we have; the following pull ends the stream
            exhausted_ = true;
            break;
        }
        out += *more;
    }
    return true;
}

// ---------------- Close ----------------
void CaptureSession::close() {
    if (!opened_) return;
    opened_ = false;

    if (device_) {
        device_->close();
    }
    closed_ = true;
    queue_.pushSentinel();

    LOG_PHASE("Capture session closed", true);
}

std::chrono::steady_clock::duration CaptureSession::elapsed() const {
    if (startTime_ == std::chrono::steady_clock::time_point{}) {
        return std::chrono::steady_clock::duration::zero();
    }
    return clock_() - startTime_;
}

} // namespace audio
