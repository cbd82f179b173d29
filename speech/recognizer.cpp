#include "speech/recognizer.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <utility>

namespace speech {

// ------------------------------------------------------------
// Streaming call: writer thread feeds audio, caller reads
// ------------------------------------------------------------
namespace {

class GrpcResponseStream : public ResponseStream {
public:
    GrpcResponseStream(pb::Speech::Stub& stub,
                       const pb::StreamingRecognitionConfig& config,
                       ChunkSource source)
        : source_(std::move(source)) {
        stream_ = stub.StreamingRecognize(&context_);
        writer_ = std::thread([this, config] { writeLoop(config); });
    }

    ~GrpcResponseStream() override {
        if (finished_) return;

        context_.TryCancel();
        if (writer_.joinable()) writer_.join();

        // Status of an abandoned call is always CANCELLED
        pb::StreamingRecognizeResponse drained;
        while (!readsDone_ && stream_->Read(&drained)) {}
        grpc::Status status = stream_->Finish();
        LOG_TRACE("Speech", "Abandoned call closed with status " +
                            std::to_string(status.error_code()));
    }

    bool next(pb::StreamingRecognizeResponse& response) override {
        if (readsDone_) return false;
        if (!stream_->Read(&response)) {
            readsDone_ = true;
            return false;
        }
        return true;
    }

    void cancel() override {
        cancelled_ = true;
        context_.TryCancel();
        LOG_DEBUG("Speech", "Streaming call cancelled");
    }

    void finish() override {
        if (finished_) return;

        if (writer_.joinable()) writer_.join();

        // Finish() requires every response to be consumed
        pb::StreamingRecognizeResponse drained;
        while (!readsDone_ && stream_->Read(&drained)) {}
        readsDone_ = true;

        grpc::Status status = stream_->Finish();
        finished_ = true;

        LOG_DEBUG("Speech", "Streaming call finished after " +
                            std::to_string(chunksSent_.load()) + " audio requests");

        if (status.ok()) {
            LOG_PHASE("Recognizer stream finished", true);
            return;
        }
        if (cancelled_ && status.error_code() == grpc::StatusCode::CANCELLED) {
            LOG_PHASE("Recognizer stream cancelled", true);
            return;
        }

        LOG_PHASE("Recognizer stream finished", false);
        throw PipelineError(ERR_RECOGNIZER_STREAM,
                            "gRPC status " + std::to_string(status.error_code()) +
                            ": " + status.error_message());
    }

private:
    void writeLoop(const pb::StreamingRecognitionConfig& config) {
        pb::StreamingRecognizeRequest request;
        *request.mutable_streaming_config() = config;
        if (!stream_->Write(request)) {
            LOG_WARN("Speech", "Stream closed before config was sent");
            return;
        }

        audio::AudioChunk chunk;
        while (source_(chunk)) {
            pb::StreamingRecognizeRequest audioRequest;
            audioRequest.set_audio_content(std::move(chunk));
            chunk.clear();

            if (!stream_->Write(audioRequest)) {
                LOG_DEBUG("Speech", "Write failed, stream is closing");
                return;
            }
            ++chunksSent_;
        }

        stream_->WritesDone();
        LOG_TRACE("Speech", "Audio source exhausted, WritesDone sent");
    }

    grpc::ClientContext context_;
    std::unique_ptr<grpc::ClientReaderWriter<pb::StreamingRecognizeRequest,
                                             pb::StreamingRecognizeResponse>> stream_;
    ChunkSource source_;
    std::thread writer_;

    std::atomic<bool> cancelled_{false};
    std::atomic<size_t> chunksSent_{0};
    bool readsDone_ = false;
    bool finished_ = false;
};

} // namespace

// ------------------------------------------------------------
// Config + credentials
// ------------------------------------------------------------
pb::StreamingRecognitionConfig buildStreamingConfig(const RecognitionSettings& settings) {
    pb::StreamingRecognitionConfig streaming;
    streaming.set_interim_results(settings.interimResults);

    pb::RecognitionConfig* config = streaming.mutable_config();
    config->set_encoding(pb::RecognitionConfig::LINEAR16);
    config->set_sample_rate_hertz(settings.sampleRateHertz);
    config->set_language_code(settings.languageCode);
    config->set_audio_channel_count(1);
    config->set_enable_automatic_punctuation(settings.automaticPunctuation);
    if (!settings.model.empty()) {
        config->set_model(settings.model);
    }
    return streaming;
}

std::shared_ptr<grpc::ChannelCredentials> requireCredentials(std::shared_ptr<grpc::ChannelCredentials> creds,
                                                             const std::string& whenMissing) {
    if (!creds) {
        throw PipelineError(ERR_CREDENTIALS_UNREADABLE, whenMissing);
    }
    return creds;
}

std::shared_ptr<grpc::ChannelCredentials> makeChannelCredentials(const RecognitionSettings& settings) {
    if (!settings.useTls) {
        LOG_DEBUG("Speech", "Using insecure channel to " + settings.endpoint);
        return grpc::InsecureChannelCredentials();
    }

    if (settings.credentialsFile.empty()) {
        LOG_DEBUG("Speech", "Using Google default credentials");
        return requireCredentials(grpc::GoogleDefaultCredentials(),
                                  "No Google application default credentials found");
    }

    std::optional<std::string> key = loadTextFile(settings.credentialsFile);
    if (!key || key->empty()) {
        throw PipelineError(ERR_CREDENTIALS_UNREADABLE,
                            "Cannot read credentials file " + settings.credentialsFile);
    }

    // One hour token lifetime
    auto callCreds = grpc::ServiceAccountJWTAccessCredentials(*key, 3600);
    if (!callCreds) {
        throw PipelineError(ERR_CREDENTIALS_UNREADABLE,
                            "Credentials file is not a service account key: " + settings.credentialsFile);
    }

    LOG_DEBUG("Speech", "Using service account key " + settings.credentialsFile);
    return grpc::CompositeChannelCredentials(grpc::SslCredentials(grpc::SslCredentialsOptions()),
                                             callCreds);
}

// ------------------------------------------------------------
// CloudSpeechRecognizer
// ------------------------------------------------------------
CloudSpeechRecognizer::CloudSpeechRecognizer(const RecognitionSettings& settings)
    : CloudSpeechRecognizer(settings,
                            grpc::CreateChannel(settings.endpoint, makeChannelCredentials(settings))) {
}

CloudSpeechRecognizer::CloudSpeechRecognizer(const RecognitionSettings& settings,
                                             std::shared_ptr<grpc::Channel> channel)
    : settings_(settings),
      channel_(std::move(channel)),
      stub_(pb::Speech::NewStub(channel_)) {
    LOG_PHASE("Recognizer channel created", true);
}

std::unique_ptr<ResponseStream> CloudSpeechRecognizer::streamingRecognize(ChunkSource source) {
    LOG_DEBUG("Speech", "Opening StreamingRecognize (" + settings_.languageCode + ", " +
                        std::to_string(settings_.sampleRateHertz) + " Hz)");
    return std::make_unique<GrpcResponseStream>(*stub_, buildStreamingConfig(settings_),
                                                std::move(source));
}

} // namespace speech
