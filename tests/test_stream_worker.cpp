// StreamWorker: connection state machine, frame publishing, reconnect and
// audio handoff across reconnects

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <vector>

#include "StreamWorker.h"
#include "fixtures/FakeAudioSink.h"
#include "fixtures/FakeFrameSource.h"
#include "fixtures/TestUtils.h"

using namespace std::chrono_literals;

namespace {

ReconnectPolicy fastPolicy() {
  ReconnectPolicy p;
  p.baseDelayMs = 5;
  p.maxDelayMs = 20;
  return p;
}

struct Harness {
  std::shared_ptr<FakeSourceScript> source = std::make_shared<FakeSourceScript>();
  std::shared_ptr<FakeAudioScript> audio = std::make_shared<FakeAudioScript>();
  std::unique_ptr<StreamWorker> worker;

  explicit Harness(bool withAudio = true,
                   ReconnectPolicy policy = fastPolicy()) {
    std::unique_ptr<AudioChannel> channel;
    if (withAudio)
      channel = std::make_unique<AudioChannel>(
          "Cam 1", "fake://cam1", std::make_unique<FakeAudioSink>(audio));
    worker = std::make_unique<StreamWorker>(
        "Cam 1", "fake://cam1", std::make_unique<FakeFrameSource>(source),
        std::move(channel), policy);
  }

  bool waitForState(ConnectionState s) {
    return testutil::waitUntil([&] { return worker->state() == s; });
  }
};

TEST(ReconnectPolicyTest, DoublesUpToCeiling) {
  ReconnectPolicy p;
  EXPECT_EQ(p.delayFor(1), 1000);
  EXPECT_EQ(p.delayFor(2), 2000);
  EXPECT_EQ(p.delayFor(3), 4000);
  EXPECT_EQ(p.delayFor(5), 16000);
  EXPECT_EQ(p.delayFor(50), 16000);
}

TEST(ReconnectPolicyTest, FixedDelayWhenCeilingEqualsBase) {
  ReconnectPolicy p;
  p.baseDelayMs = 1000;
  p.maxDelayMs = 1000;
  for (int k = 1; k < 10; ++k)
    EXPECT_EQ(p.delayFor(k), 1000);
}

TEST(StreamWorkerTest, StartsDisconnectedWithNoFrame) {
  Harness h;
  EXPECT_EQ(h.worker->state(), ConnectionState::Disconnected);
  EXPECT_FALSE(h.worker->getFrame().has_value());
  EXPECT_FALSE(h.worker->running());
}

TEST(StreamWorkerTest, PublishesFramesOnceStreaming) {
  Harness h;
  h.worker->start();
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));
  ASSERT_TRUE(testutil::waitUntil([&] { return h.worker->getFrame().has_value(); }));

  auto f = h.worker->getFrame();
  ASSERT_TRUE(f.has_value());
  cv::Mat expected = h.source->with([](FakeSourceScript &s) { return s.frame.clone(); });
  EXPECT_TRUE(testutil::identical(*f, expected));
  EXPECT_GE(h.worker->status().framesRead, 1u);
  h.worker->stop();
}

TEST(StreamWorkerTest, ConnectFailuresKeepRetrying) {
  Harness h;
  h.source->with([](FakeSourceScript &s) { s.openSucceeds = false; return 0; });
  h.worker->start();

  ASSERT_TRUE(testutil::waitUntil([&] {
    return h.source->with([](FakeSourceScript &s) { return s.openAttempts; }) >= 3;
  }));
  EXPECT_NE(h.worker->state(), ConnectionState::Streaming);
  EXPECT_FALSE(h.worker->getFrame().has_value());
  EXPECT_TRUE(h.worker->running());
  h.worker->stop();
}

TEST(StreamWorkerTest, RecoversWhenSourceComesBack) {
  Harness h;
  h.source->with([](FakeSourceScript &s) { s.openSucceeds = false; return 0; });
  h.worker->start();
  ASSERT_TRUE(testutil::waitUntil([&] {
    return h.source->with([](FakeSourceScript &s) { return s.openAttempts; }) >= 2;
  }));

  h.source->with([](FakeSourceScript &s) { s.openSucceeds = true; return 0; });
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));
  EXPECT_TRUE(testutil::waitUntil([&] { return h.worker->getFrame().has_value(); }));
  h.worker->stop();
}

TEST(StreamWorkerTest, ReadFailureReleasesAndReconnects) {
  Harness h;
  h.worker->start();
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));

  h.source->with([](FakeSourceScript &s) { s.failNextReads = 1; return 0; });
  ASSERT_TRUE(testutil::waitUntil([&] {
    return h.source->with([](FakeSourceScript &s) { return s.opens; }) >= 2;
  }));
  EXPECT_GE(h.source->with([](FakeSourceScript &s) { return s.releases; }), 1);
  EXPECT_TRUE(h.waitForState(ConnectionState::Streaming));
  h.worker->stop();
}

TEST(StreamWorkerTest, LastFrameKeptWhileDisconnected) {
  Harness h;
  h.worker->start();
  ASSERT_TRUE(testutil::waitUntil([&] { return h.worker->getFrame().has_value(); }));

  h.source->with([](FakeSourceScript &s) {
    s.readsSucceed = false;
    s.openSucceeds = false;
    return 0;
  });
  ASSERT_TRUE(h.waitForState(ConnectionState::Disconnected) ||
              h.waitForState(ConnectionState::Connecting));
  EXPECT_TRUE(h.worker->getFrame().has_value());
  h.worker->stop();
  EXPECT_TRUE(h.worker->getFrame().has_value());
}

TEST(StreamWorkerTest, TwoReadsWithoutNewFrameAreIdentical) {
  Harness h;
  h.worker->start();
  ASSERT_TRUE(testutil::waitUntil([&] { return h.worker->getFrame().has_value(); }));
  h.worker->stop();

  auto a = h.worker->getFrame();
  auto b = h.worker->getFrame();
  ASSERT_TRUE(a && b);
  EXPECT_TRUE(testutil::identical(*a, *b));
}

TEST(StreamWorkerTest, AudioToggleWhileStreamingStartsAndStopsPlayback) {
  Harness h;
  h.worker->start();
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));

  EXPECT_TRUE(h.worker->toggleAudio());
  EXPECT_TRUE(h.worker->audioOn());
  EXPECT_TRUE(h.worker->audioActive());
  EXPECT_EQ(h.audio->with([](FakeAudioScript &a) { return a.lastUri; }), "fake://cam1");

  EXPECT_FALSE(h.worker->toggleAudio());
  EXPECT_FALSE(h.worker->audioOn());
  EXPECT_FALSE(h.worker->audioActive());
  h.worker->stop();
}

TEST(StreamWorkerTest, AudioResumesAfterReconnectWhenOn) {
  Harness h;
  h.worker->start();
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));
  ASSERT_TRUE(h.worker->toggleAudio());
  ASSERT_EQ(h.audio->with([](FakeAudioScript &a) { return a.starts; }), 1);

  h.source->with([](FakeSourceScript &s) { s.failNextReads = 1; return 0; });

  ASSERT_TRUE(testutil::waitUntil([&] {
    return h.audio->with([](FakeAudioScript &a) { return a.stops >= 1 && a.starts >= 2; });
  }));
  EXPECT_TRUE(h.waitForState(ConnectionState::Streaming));
  EXPECT_TRUE(h.worker->audioOn());
  EXPECT_TRUE(h.worker->audioActive());
  h.worker->stop();
}

TEST(StreamWorkerTest, AudioStaysOffAcrossReconnectWhenOff) {
  Harness h;
  h.worker->start();
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));

  h.source->with([](FakeSourceScript &s) { s.failNextReads = 1; return 0; });
  ASSERT_TRUE(testutil::waitUntil([&] {
    return h.source->with([](FakeSourceScript &s) { return s.opens; }) >= 2;
  }));
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));

  EXPECT_FALSE(h.worker->audioOn());
  EXPECT_EQ(h.audio->with([](FakeAudioScript &a) { return a.starts; }), 0);
  h.worker->stop();
}

TEST(StreamWorkerTest, AudioRequestedWhileDisconnectedStartsOnConnect) {
  Harness h;
  h.source->with([](FakeSourceScript &s) { s.openSucceeds = false; return 0; });
  h.worker->start();
  ASSERT_TRUE(testutil::waitUntil([&] {
    return h.source->with([](FakeSourceScript &s) { return s.openAttempts; }) >= 1;
  }));

  EXPECT_TRUE(h.worker->toggleAudio());
  EXPECT_FALSE(h.worker->audioActive());
  EXPECT_EQ(h.audio->with([](FakeAudioScript &a) { return a.starts; }), 0);

  h.source->with([](FakeSourceScript &s) { s.openSucceeds = true; return 0; });
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));
  EXPECT_TRUE(testutil::waitUntil([&] { return h.worker->audioActive(); }));
  h.worker->stop();
}

TEST(StreamWorkerTest, AudioStartFailureDoesNotTouchVideo) {
  Harness h;
  h.audio->with([](FakeAudioScript &a) { a.startSucceeds = false; return 0; });
  h.worker->start();
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));
  const int opens = h.source->with([](FakeSourceScript &s) { return s.opens; });

  EXPECT_TRUE(h.worker->toggleAudio());
  EXPECT_FALSE(h.worker->audioActive());

  const uint64_t before = h.worker->status().framesRead;
  EXPECT_TRUE(testutil::waitUntil(
      [&] { return h.worker->status().framesRead > before + 3; }));
  EXPECT_EQ(h.worker->state(), ConnectionState::Streaming);
  EXPECT_EQ(h.source->with([](FakeSourceScript &s) { return s.opens; }), opens);
  h.worker->stop();
}

TEST(StreamWorkerTest, AudioThatDiesWhileStreamingIsRestarted) {
  Harness h;
  h.worker->start();
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));
  ASSERT_TRUE(h.worker->toggleAudio());
  ASSERT_EQ(h.audio->with([](FakeAudioScript &a) { return a.starts; }), 1);

  // Playback fails on its own, e.g. the sink saw an error on its bus.
  h.audio->with([](FakeAudioScript &a) { a.playing = false; return 0; });

  ASSERT_TRUE(testutil::waitUntil(
      [&] { return h.audio->with([](FakeAudioScript &a) { return a.starts; }) >= 2; }));
  EXPECT_TRUE(testutil::waitUntil([&] { return h.worker->audioActive(); }));
  EXPECT_TRUE(h.worker->audioOn());
  EXPECT_EQ(h.worker->state(), ConnectionState::Streaming);
  EXPECT_EQ(h.source->with([](FakeSourceScript &s) { return s.opens; }), 1);
  h.worker->stop();
}

TEST(StreamWorkerTest, VideoOnlyStreamIgnoresAudioToggle) {
  Harness h(false);
  EXPECT_FALSE(h.worker->audioCapable());
  h.worker->start();
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));
  EXPECT_FALSE(h.worker->toggleAudio());
  EXPECT_FALSE(h.worker->audioOn());
  EXPECT_EQ(h.worker->state(), ConnectionState::Streaming);
  h.worker->stop();
}

TEST(AudioChannelTest, ReportsPlaybackThatFailedOnItsOwn) {
  auto script = std::make_shared<FakeAudioScript>();
  AudioChannel channel("Cam 1", "fake://cam1",
                       std::make_unique<FakeAudioSink>(script));

  ASSERT_TRUE(channel.enable());
  EXPECT_TRUE(channel.active());

  script->with([](FakeAudioScript &a) { a.playing = false; return 0; });
  EXPECT_FALSE(channel.active());

  // A dead handle is still released.
  channel.disable();
  EXPECT_EQ(script->with([](FakeAudioScript &a) { return a.stops; }), 1);

  ASSERT_TRUE(channel.enable());
  EXPECT_EQ(script->with([](FakeAudioScript &a) { return a.starts; }), 2);
}

TEST(StreamWorkerTest, StopInterruptsLongBackoff) {
  ReconnectPolicy slow;
  slow.baseDelayMs = 60000;
  slow.maxDelayMs = 60000;
  Harness h(true, slow);
  h.source->with([](FakeSourceScript &s) { s.openSucceeds = false; return 0; });
  h.worker->start();
  ASSERT_TRUE(h.waitForState(ConnectionState::Disconnected) &&
              testutil::waitUntil([&] {
                return h.source->with([](FakeSourceScript &s) { return s.openAttempts; }) >= 1;
              }));

  const auto t0 = std::chrono::steady_clock::now();
  h.worker->stop();
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
  EXPECT_FALSE(h.worker->running());
}

TEST(StreamWorkerTest, StartTwiceIsHarmless) {
  Harness h;
  h.worker->start();
  h.worker->start();
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));
  h.worker->stop();
  EXPECT_FALSE(h.worker->running());
}

TEST(StreamWorkerTest, StopReleasesSourceAndAudio) {
  Harness h;
  h.worker->start();
  ASSERT_TRUE(h.waitForState(ConnectionState::Streaming));
  h.worker->toggleAudio();
  ASSERT_TRUE(h.worker->audioActive());

  h.worker->stop();
  EXPECT_FALSE(h.worker->running());
  EXPECT_EQ(h.worker->state(), ConnectionState::Disconnected);
  EXPECT_FALSE(h.source->with([](FakeSourceScript &s) { return s.opened; }));
  EXPECT_FALSE(h.audio->with([](FakeAudioScript &a) { return a.playing; }));
}

TEST(StreamWorkerTest, StopWithoutStartIsHarmless) {
  Harness h;
  h.worker->stop();
  EXPECT_FALSE(h.worker->running());
  EXPECT_EQ(h.source->with([](FakeSourceScript &s) { return s.openAttempts; }), 0);
}

TEST(StreamWorkerTest, ManyWorkersStopInBoundedTime) {
  for (int k = 1; k <= 8; ++k) {
    std::vector<std::unique_ptr<Harness>> hs;
    for (int i = 0; i < k; ++i) {
      hs.push_back(std::make_unique<Harness>(i % 2 == 0));
      if (i % 3 == 2)
        hs.back()->source->with([](FakeSourceScript &s) { s.openSucceeds = false; return 0; });
      hs.back()->worker->start();
    }
    std::this_thread::sleep_for(20ms);

    const auto t0 = std::chrono::steady_clock::now();
    for (auto &h : hs)
      h->worker->requestStop();
    for (auto &h : hs)
      h->worker->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s) << "k=" << k;
    for (auto &h : hs)
      EXPECT_FALSE(h->worker->running());
  }
}

} // namespace
