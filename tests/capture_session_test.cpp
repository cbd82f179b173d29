#include "audio/capture_session.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>

using namespace std::chrono_literals;
using audio::AudioChunk;
using audio::CaptureSession;
using audio::CaptureSettings;
using testutil::DeviceLog;
using testutil::FakeCaptureDevice;
using testutil::ManualClock;

namespace {

struct SessionFixture {
    std::shared_ptr<DeviceLog> log = std::make_shared<DeviceLog>();
    FakeCaptureDevice* device = nullptr;
    ManualClock clock;

    std::unique_ptr<CaptureSession> make(const CaptureSettings& settings = CaptureSettings{}) {
        auto dev = std::make_unique<FakeCaptureDevice>(log);
        device = dev.get();
        return std::make_unique<CaptureSession>(std::move(dev), settings, clock.fn());
    }
};

} // namespace

TEST(CaptureSession, OpensDeviceWithMonoChunkGeometry) {
    SessionFixture fx;
    auto session = fx.make();
    session->open();

    EXPECT_EQ(fx.log->opens.load(), 1);
    EXPECT_EQ(fx.log->lastParams.sampleRate, 16000);
    EXPECT_EQ(fx.log->lastParams.framesPerBuffer, 1600u);
    EXPECT_FALSE(session->isClosed());
}

TEST(CaptureSession, MergesBufferedFramesInCaptureOrder) {
    SessionFixture fx;
    auto session = fx.make();
    session->open();

    fx.device->emit("aa");
    fx.device->emit("bb");
    fx.device->emit("cc");

    AudioChunk chunk;
    ASSERT_TRUE(session->next(chunk));
    EXPECT_EQ(chunk, "aabbcc");

    fx.device->emit("dd");
    ASSERT_TRUE(session->next(chunk));
    EXPECT_EQ(chunk, "dd");
}

TEST(CaptureSession, CloseDeliversRemainingAudioThenEnds) {
    SessionFixture fx;
    auto session = fx.make();
    session->open();

    std::string expected;
    for (int i = 0; i < 10; ++i) {
        std::string frame(4, static_cast<char>('a' + i));
        fx.device->emit(frame);
        expected += frame;
    }
    session->close();

    std::string received;
    int pulls = 0;
    AudioChunk chunk;
    while (session->next(chunk)) {
        received += chunk;
        ++pulls;
    }

    EXPECT_EQ(received, expected);
    EXPECT_LE(pulls, 10);
    EXPECT_GE(pulls, 1);
    EXPECT_TRUE(session->isClosed());
    EXPECT_EQ(fx.log->closes.load(), 1);

    // Non-restartable
    EXPECT_FALSE(session->next(chunk));
}

TEST(CaptureSession, EndsImmediatelyOnceLimitHasElapsed) {
    SessionFixture fx;
    CaptureSettings settings;
    settings.sessionLimit = 300s;
    auto session = fx.make(settings);
    session->open();

    fx.device->emit("queued");
    fx.clock.now += 301s;

    AudioChunk chunk;
    EXPECT_FALSE(session->next(chunk));
    EXPECT_TRUE(chunk.empty());

    // Still over, still ended
    fx.device->emit("more");
    EXPECT_FALSE(session->next(chunk));
}

TEST(CaptureSession, LimitIsExclusiveAtTheBoundary) {
    SessionFixture fx;
    auto session = fx.make();
    session->open();

    fx.device->emit("pcm");
    fx.clock.now += 300s;

    AudioChunk chunk;
    ASSERT_TRUE(session->next(chunk));
    EXPECT_EQ(chunk, "pcm");
}

TEST(CaptureSession, CloseWakesABlockedConsumer) {
    SessionFixture fx;
    auto session = fx.make();
    session->open();

    bool result = true;
    std::thread consumer([&] {
        AudioChunk chunk;
        result = session->next(chunk);
    });

    std::this_thread::sleep_for(20ms);
    session->close();
    consumer.join();

    EXPECT_FALSE(result);
}

TEST(CaptureSession, NextBeforeOpenReturnsFalse) {
    SessionFixture fx;
    auto session = fx.make();

    AudioChunk chunk;
    EXPECT_FALSE(session->next(chunk));
}

TEST(CaptureSession, OpenFailurePropagatesDeviceError) {
    auto log = std::make_shared<DeviceLog>();
    CaptureSession session(std::make_unique<FakeCaptureDevice>(log, true), CaptureSettings{});

    try {
        session.open();
        FAIL() << "open() should throw";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ERR_DEVICE_UNAVAILABLE);
    }
    EXPECT_EQ(log->opens.load(), 0);
}

TEST(CaptureSession, DestructorReleasesTheDevice) {
    SessionFixture fx;
    {
        auto session = fx.make();
        session->open();
        fx.device->emit("pcm");
    }
    EXPECT_EQ(fx.log->closes.load(), 1);
}

TEST(CaptureSession, CloseIsIdempotent) {
    SessionFixture fx;
    auto session = fx.make();
    session->open();

    session->close();
    session->close();
    EXPECT_EQ(fx.log->closes.load(), 1);
}
