#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include "audio/capture_device.hpp"
#include "audio/frame_queue.hpp"

namespace audio {

struct CaptureSettings {
    int sampleRate = 16000;
    int chunkMs = 100;
    int inputDeviceIndex = -1;
    std::chrono::seconds sessionLimit{300};

    unsigned long framesPerChunk() const {
        return static_cast<unsigned long>(sampleRate) * static_cast<unsigned long>(chunkMs) / 1000;
    }
};

/// CaptureSession
/// One bounded-duration microphone session. Owns the device and the frame
/// queue; next() exposes the captured audio as a lazy, finite sequence that
/// ends at the sentinel pushed by close(), or once the session limit has
/// elapsed. Audio captured before close() is still handed out.
/// The destructor closes the device on every exit path.
class CaptureSession {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    CaptureSession(std::unique_ptr<CaptureDevice> device,
                   const CaptureSettings& settings,
                   Clock clock = nullptr);   // nullptr = steady_clock
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    /// Acquire the device and start the session timer.
    /// Throws PipelineError (ERR_DEVICE_UNAVAILABLE).
    void open();

    /// Pull the next chunk: blocks for one item, then merges everything
    /// already buffered behind it. Returns false once the sequence is over;
    /// after that it keeps returning false.
    bool next(AudioChunk& out);

    /// Stop the device, mark closed and wake any blocked consumer.
    void close();

    bool isClosed() const { return closed_.load(); }
    std::chrono::steady_clock::duration elapsed() const;

private:
    std::unique_ptr<CaptureDevice> device_;
    CaptureSettings settings_;
    Clock clock_;
    FrameQueue queue_;

    std::chrono::steady_clock::time_point startTime_{};
    std::atomic<bool> closed_{true};
    bool opened_ = false;
    bool startedOnce_ = false;
    bool exhausted_ = false;     // consumer side only
};

} // namespace audio
