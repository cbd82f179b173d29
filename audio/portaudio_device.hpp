#pragma once
#include <ostream>
#include <portaudio.h>
#include "audio/capture_device.hpp"

namespace audio {

/// PortAudio microphone: paInt16, mono, callback-driven.
/// Pa_Initialize/Pa_Terminate bracket each open/close so a new session
/// always starts from a fresh PortAudio state.
class PortAudioDevice : public CaptureDevice {
public:
    PortAudioDevice() = default;
    ~PortAudioDevice() override;

    PortAudioDevice(const PortAudioDevice&) = delete;
    PortAudioDevice& operator=(const PortAudioDevice&) = delete;

    void open(const DeviceParams& params, FrameCallback onFrames) override;
    void close() override;

private:
    static int onAudio(const void* input, void* output,
                       unsigned long frameCount,
                       const PaStreamCallbackTimeInfo* timeInfo,
                       PaStreamCallbackFlags statusFlags,
                       void* userData);

    PaStream* stream_ = nullptr;
    bool initialized_ = false;
    FrameCallback onFrames_;
};

// Print every PortAudio device with its input/output capabilities.
// Returns false if PortAudio could not be initialised.
bool listInputDevices(std::ostream& out);

} // namespace audio
