#pragma once
#include <cstddef>
#include <functional>

namespace audio {

// Called on the audio subsystem's thread with one buffer of raw PCM bytes.
// Must not block.
using FrameCallback = std::function<void(const char* data, std::size_t bytes)>;

struct DeviceParams {
    int sampleRate = 16000;
    unsigned long framesPerBuffer = 1600;  // 100ms at 16kHz
    int inputDeviceIndex = -1;             // -1 = system default input
};

/// CaptureDevice
/// A mono 16-bit microphone. open() throws PipelineError
/// (ERR_DEVICE_UNAVAILABLE) when the device cannot be acquired; close() is
/// idempotent and never throws.
class CaptureDevice {
public:
    virtual ~CaptureDevice() = default;

    virtual void open(const DeviceParams& params, FrameCallback onFrames) = 0;
    virtual void close() = 0;
};

} // namespace audio
