#pragma once
#include "AudioChannel.h"
#include "FrameCache.h"
#include "FrameSource.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class ConnectionState { Disconnected, Connecting, Streaming };

const char *toString(ConnectionState state);

// Delay before the next connect attempt after `failures` consecutive
// failures: base * 2^(failures-1), capped at maxDelayMs.
struct ReconnectPolicy {
  int baseDelayMs = 1000;
  int maxDelayMs = 16000;

  int delayFor(int failures) const;
};

struct StreamStatus {
  ConnectionState state = ConnectionState::Disconnected;
  bool audioCapable = false;
  bool audioOn = false;
  bool audioActive = false;
  uint64_t framesRead = 0;
};

// Owns one stream: a thread that keeps the source connected, publishes every
// decoded frame to the FrameCache and reconnects on failure. Audio (if the
// stream has an AudioChannel) follows the connection: released when the
// stream drops, restarted on reconnect if the user had it on, and restarted
// with backoff if playback dies while the video keeps streaming.
class StreamWorker {
public:
  // `audio` may be null for video-only streams.
  StreamWorker(const std::string &label, const std::string &uri,
               std::unique_ptr<FrameSource> source,
               std::unique_ptr<AudioChannel> audio,
               ReconnectPolicy policy = ReconnectPolicy());
  ~StreamWorker();

  StreamWorker(const StreamWorker &) = delete;
  StreamWorker &operator=(const StreamWorker &) = delete;

  void start();
  // Raises the stop flag without waiting; stop() then joins.
  void requestStop();
  void stop();

  // Copy of the latest frame; nullopt until the first successful read.
  std::optional<cv::Mat> getFrame() const { return cache_.load(); }

  // Flips the audio state and returns the new one. Video-only streams stay
  // off. Audio failures are logged and do not touch the connection.
  bool toggleAudio();

  const std::string &label() const { return label_; }
  const std::string &uri() const { return uri_; }
  bool audioCapable() const { return audio_ != nullptr; }
  bool audioOn() const;
  bool audioActive() const;
  ConnectionState state() const { return state_.load(); }
  bool running() const { return running_.load(); }
  StreamStatus status() const;

private:
  void run();
  bool connect();
  bool readFrame(cv::Mat &frame);
  void setState(ConnectionState next);
  bool waitFor(int ms); // false when stop was requested
  void superviseAudio();

  std::string label_;
  std::string uri_;
  std::unique_ptr<FrameSource> source_;
  std::unique_ptr<AudioChannel> audio_;
  ReconnectPolicy policy_;

  FrameCache cache_;

  std::thread thread_;
  bool started_ = false;
  std::atomic<bool> stopRequested_{false};
  std::atomic<bool> running_{false};
  std::mutex waitMtx_;
  std::condition_variable waitCv_;

  // Serialises every enable/disable of audio_ and every write of audioOn_,
  // so a user toggle and a reconnect never interleave. Observers read
  // audioOn_ without it: an audio teardown may hold it for seconds.
  std::mutex audioMtx_;
  std::atomic<bool> audioOn_{false};

  // audioFailures_ is guarded by audioMtx_; nextAudioCheck_ belongs to the
  // worker thread.
  int audioFailures_ = 0;
  std::chrono::steady_clock::time_point nextAudioCheck_;

  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
};
