#include "audio/portaudio_device.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace audio {

PortAudioDevice::~PortAudioDevice() {
    close();
}

// ---------------- Callback (PortAudio thread) ----------------
int PortAudioDevice::onAudio(const void* input, void*,
                             unsigned long frameCount,
                             const PaStreamCallbackTimeInfo*,
                             PaStreamCallbackFlags,
                             void* userData) {
    auto* self = static_cast<PortAudioDevice*>(userData);
    if (input && self->onFrames_) {
        self->onFrames_(static_cast<const char*>(input), frameCount * sizeof(int16_t));
    }
    return paContinue;
}

// ---------------- Open ----------------
void PortAudioDevice::open(const DeviceParams& params, FrameCallback onFrames) {
    if (stream_) {
        LOG_WARN("Audio", "open() called on an already open device");
        return;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw PipelineError(ERR_DEVICE_UNAVAILABLE,
                            std::string("PortAudio initialization failed: ") + Pa_GetErrorText(err));
    }
    initialized_ = true;

    int deviceIndex = params.inputDeviceIndex;
    if (deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        if (deviceIndex >= 0) {
            LOG_WARN("Audio", "Invalid device index " + std::to_string(deviceIndex) +
                              ", falling back to default input device");
        }
        deviceIndex = Pa_GetDefaultInputDevice();
    }

    if (deviceIndex == paNoDevice) {
        close();
        throw PipelineError(ERR_DEVICE_UNAVAILABLE, "No valid input device found");
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
    if (!devInfo || devInfo->maxInputChannels < 1) {
        close();
        throw PipelineError(ERR_DEVICE_UNAVAILABLE,
                            "Device " + std::to_string(deviceIndex) + " has no input channels");
    }

    PaStreamParameters inputParams;
    inputParams.device = deviceIndex;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paInt16;
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    onFrames_ = std::move(onFrames);

    err = Pa_OpenStream(&stream_,
                        &inputParams,
                        nullptr,
                        params.sampleRate,
                        params.framesPerBuffer,
                        paClipOff,
                        &PortAudioDevice::onAudio,
                        this);
    if (err != paNoError || !stream_) {
        stream_ = nullptr;
        close();
        throw PipelineError(ERR_DEVICE_UNAVAILABLE,
                            std::string("Could not open mic stream: ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        close();
        throw PipelineError(ERR_DEVICE_UNAVAILABLE,
                            std::string("Could not start mic stream: ") + Pa_GetErrorText(err));
    }

    LOG_DEBUG("Audio", std::string("Using device: ") + devInfo->name +
                       " @ " + std::to_string(params.sampleRate) + " Hz, " +
                       std::to_string(params.framesPerBuffer) + " frames/buffer");
    LOG_PHASE("Microphone opened", true);
}

// ---------------- Close ----------------
void PortAudioDevice::close() {
    if (stream_) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            LOG_WARN("Audio", std::string("Pa_StopStream: ") + Pa_GetErrorText(err));
        }
        err = Pa_CloseStream(stream_);
        if (err != paNoError) {
            LOG_WARN("Audio", std::string("Pa_CloseStream: ") + Pa_GetErrorText(err));
        }
        stream_ = nullptr;
        LOG_PHASE("Microphone closed", true);
    }

    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
    onFrames_ = nullptr;
}

// ---------------- Device listing ----------------
bool listInputDevices(std::ostream& out) {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("Audio", std::string("PortAudio error: ") + Pa_GetErrorText(err));
        return false;
    }

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        LOG_ERROR("Audio", "Pa_GetDeviceCount returned " + std::to_string(numDevices));
        Pa_Terminate();
        return false;
    }

    out << "=== PortAudio Device List ===\n";
    out << "Found " << numDevices << " devices total\n\n";

    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (!deviceInfo) continue;

        const PaHostApiInfo* hostApiInfo = Pa_GetHostApiInfo(deviceInfo->hostApi);

        out << "Device #" << i << ": " << deviceInfo->name
            << "  (Host API: " << (hostApiInfo ? hostApiInfo->name : "?") << ")\n";
        out << "  Max input channels : " << deviceInfo->maxInputChannels << "\n";
        out << "  Default sample rate: " << deviceInfo->defaultSampleRate << "\n";
        out << "  Input latency      : " << deviceInfo->defaultLowInputLatency << " sec\n";

        if (i == Pa_GetDefaultInputDevice())
            out << "  *** Default INPUT device ***\n";

        out << "-------------------------------------------\n";
    }

    Pa_Terminate();
    return true;
}

} // namespace audio
