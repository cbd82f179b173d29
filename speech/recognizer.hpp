#pragma once
#include <string>
#include <memory>
#include <functional>
#include <grpcpp/grpcpp.h>
#include "cloud_speech.grpc.pb.h"
#include "audio/frame_queue.hpp"

namespace speech {

namespace pb = google::cloud::speech::v1;

struct RecognitionSettings {
    std::string endpoint = "speech.googleapis.com:443";
    bool useTls = true;
    std::string credentialsFile;          // service account key; empty = default credentials
    std::string languageCode = "en-US";
    int sampleRateHertz = 16000;
    bool interimResults = true;
    std::string model;                    // empty = service default
    bool automaticPunctuation = false;
};

// Pulls the next audio chunk; false ends the request stream
using ChunkSource = std::function<bool(audio::AudioChunk&)>;

/// ResponseStream
/// Lazy sequence of recognizer responses for one streaming call.
class ResponseStream {
public:
    virtual ~ResponseStream() = default;

    // Blocks for the next response; false at end of stream
    virtual bool next(pb::StreamingRecognizeResponse& response) = 0;

    // Abort the call (e.g. after an exit phrase)
    virtual void cancel() = 0;

    // Wait for the request side to finish and check the call status.
    // Throws PipelineError (ERR_RECOGNIZER_STREAM) on a failed call.
    virtual void finish() = 0;
};

/// Recognizer
/// Opens one bidirectional streaming call per chunk sequence.
class Recognizer {
public:
    virtual ~Recognizer() = default;

    virtual std::unique_ptr<ResponseStream> streamingRecognize(ChunkSource source) = 0;
};

/// Google Cloud Speech v1 over gRPC.
class CloudSpeechRecognizer : public Recognizer {
public:
    explicit CloudSpeechRecognizer(const RecognitionSettings& settings);
    CloudSpeechRecognizer(const RecognitionSettings& settings,
                          std::shared_ptr<grpc::Channel> channel);

    std::unique_ptr<ResponseStream> streamingRecognize(ChunkSource source) override;

private:
    RecognitionSettings settings_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<pb::Speech::Stub> stub_;
};

// First request of every call
pb::StreamingRecognitionConfig buildStreamingConfig(const RecognitionSettings& settings);

// Pass-through for a non-null credential, ERR_CREDENTIALS_UNREADABLE otherwise.
// gRPC hands back nullptr instead of failing when no credentials can be found.
std::shared_ptr<grpc::ChannelCredentials> requireCredentials(std::shared_ptr<grpc::ChannelCredentials> creds,
                                                             const std::string& whenMissing);

// TLS + service-account JWT, TLS + Google default credentials, or insecure.
// Throws PipelineError (ERR_CREDENTIALS_UNREADABLE) if the key file is unreadable
// or no default credentials exist.
std::shared_ptr<grpc::ChannelCredentials> makeChannelCredentials(const RecognitionSettings& settings);

} // namespace speech
