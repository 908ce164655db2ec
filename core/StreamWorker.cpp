#include "StreamWorker.h"
#include <chrono>
#include <exception>
#include <iostream>
#include <opencv2/imgproc.hpp>

const char *toString(ConnectionState state) {
  switch (state) {
  case ConnectionState::Disconnected:
    return "Disconnected";
  case ConnectionState::Connecting:
    return "Connecting";
  case ConnectionState::Streaming:
    return "Streaming";
  }
  return "Unknown";
}

int ReconnectPolicy::delayFor(int failures) const {
  int delay = baseDelayMs;
  for (int i = 1; i < failures && delay < maxDelayMs; ++i)
    delay = delay > maxDelayMs / 2 ? maxDelayMs : delay * 2;
  return delay < maxDelayMs ? delay : maxDelayMs;
}

StreamWorker::StreamWorker(const std::string &label, const std::string &uri,
                           std::unique_ptr<FrameSource> source,
                           std::unique_ptr<AudioChannel> audio,
                           ReconnectPolicy policy)
    : label_(label), uri_(uri), source_(std::move(source)),
      audio_(std::move(audio)), policy_(policy) {}

StreamWorker::~StreamWorker() { stop(); }

void StreamWorker::start() {
  if (started_)
    return;
  started_ = true;
  running_ = true;
  thread_ = std::thread([this] { run(); });
  std::cout << "[StreamWorker] " << label_ << " started ("
            << (audio_ ? "audio" : "video-only") << ")" << std::endl;
}

void StreamWorker::requestStop() {
  stopRequested_ = true;
  {
    std::lock_guard<std::mutex> lk(waitMtx_);
  }
  waitCv_.notify_all();
}

void StreamWorker::stop() {
  requestStop();

  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[StreamWorker] " << label_ << " stopped" << std::endl;
  }

  // Never started, or the thread already cleaned up: make sure nothing is
  // left open either way.
  if (source_)
    source_->release();
  if (audio_)
    audio_->disable();
}

bool StreamWorker::toggleAudio() {
  if (!audio_) {
    std::cout << "[StreamWorker] " << label_
              << " is video-only, ignoring audio toggle" << std::endl;
    return false;
  }

  std::lock_guard<std::mutex> lock(audioMtx_);
  const bool on = !audioOn_.load();
  audioOn_ = on;
  audioFailures_ = 0;
  if (on) {
    if (state_.load() == ConnectionState::Streaming)
      audio_->enable();
    else
      std::cout << "[StreamWorker] " << label_
                << " audio will start once connected" << std::endl;
  } else {
    audio_->disable();
  }
  return on;
}

bool StreamWorker::audioOn() const { return audioOn_.load(); }

bool StreamWorker::audioActive() const { return audio_ && audio_->active(); }

StreamStatus StreamWorker::status() const {
  StreamStatus s;
  s.state = state_.load();
  s.audioCapable = audio_ != nullptr;
  s.audioOn = audioOn();
  s.audioActive = audioActive();
  s.framesRead = cache_.generation();
  return s;
}

void StreamWorker::run() {
  int failures = 0;

  while (!stopRequested_) {
    if (!source_->isOpened()) {
      setState(ConnectionState::Connecting);
      if (connect()) {
        setState(ConnectionState::Streaming);
        continue;
      }
      if (stopRequested_)
        break;

      setState(ConnectionState::Disconnected);
      const int delay = policy_.delayFor(++failures);
      std::cerr << "[StreamWorker] " << label_ << " connect failed, retry in "
                << delay << " ms" << std::endl;
      waitFor(delay);
      continue;
    }

    cv::Mat frame;
    if (readFrame(frame)) {
      cache_.store(frame);
      failures = 0;
      superviseAudio();
      continue;
    }
    if (stopRequested_)
      break;

    // Drop the handle before waiting so the server sees us leave.
    source_->release();
    setState(ConnectionState::Disconnected);
    const int delay = policy_.delayFor(++failures);
    std::cout << "[StreamWorker] " << label_ << " Reconnecting in " << delay
              << " ms..." << std::endl;
    waitFor(delay);
  }

  source_->release();
  setState(ConnectionState::Disconnected);
  running_ = false;
}

bool StreamWorker::connect() {
  try {
    return source_->open(uri_);
  } catch (const std::exception &e) {
    std::cerr << "[StreamWorker] " << label_ << " open threw: " << e.what()
              << std::endl;
    source_->release();
    return false;
  }
}

bool StreamWorker::readFrame(cv::Mat &frame) {
  try {
    if (!source_->read(frame) || frame.empty())
      return false;

    // The cache only ever holds 8-bit, 3-channel frames.
    if (frame.depth() != CV_8U) {
      cv::Mat converted;
      frame.convertTo(converted, CV_8U);
      frame = converted;
    }
    if (frame.channels() == 1)
      cv::cvtColor(frame, frame, cv::COLOR_GRAY2BGR);
    else if (frame.channels() == 4)
      cv::cvtColor(frame, frame, cv::COLOR_BGRA2BGR);
    return frame.channels() == 3;
  } catch (const std::exception &e) {
    std::cerr << "[StreamWorker] " << label_ << " read threw: " << e.what()
              << std::endl;
    return false;
  }
}

void StreamWorker::setState(ConnectionState next) {
  std::lock_guard<std::mutex> lock(audioMtx_);
  const ConnectionState prev = state_.exchange(next);
  if (prev == next)
    return;

  std::cout << "[StreamWorker] " << label_ << " " << toString(prev) << " -> "
            << toString(next) << std::endl;

  if (!audio_)
    return;
  if (prev == ConnectionState::Streaming)
    audio_->disable();
  if (next == ConnectionState::Streaming && audioOn_) {
    audioFailures_ = audio_->enable() ? 0 : 1;
    nextAudioCheck_ = std::chrono::steady_clock::now() +
                      std::chrono::milliseconds(policy_.delayFor(1));
  }
}

// Called between frames while Streaming. Playback that died (sink error,
// audio session dropped) is restarted, backing off like the video path.
void StreamWorker::superviseAudio() {
  if (!audio_ || !audioOn_)
    return;
  const auto now = std::chrono::steady_clock::now();
  if (now < nextAudioCheck_)
    return;

  std::lock_guard<std::mutex> lock(audioMtx_);
  if (!audioOn_ || state_.load() != ConnectionState::Streaming)
    return;
  if (audio_->active()) {
    audioFailures_ = 0;
    nextAudioCheck_ = now + std::chrono::milliseconds(policy_.baseDelayMs);
    return;
  }

  std::cerr << "[StreamWorker] " << label_
            << " audio is not playing, restarting" << std::endl;
  if (audio_->enable()) {
    audioFailures_ = 0;
    nextAudioCheck_ = now + std::chrono::milliseconds(policy_.baseDelayMs);
  } else {
    nextAudioCheck_ =
        now + std::chrono::milliseconds(policy_.delayFor(++audioFailures_));
  }
}

bool StreamWorker::waitFor(int ms) {
  std::unique_lock<std::mutex> lk(waitMtx_);
  waitCv_.wait_for(lk, std::chrono::milliseconds(ms),
                   [this] { return stopRequested_.load(); });
  return !stopRequested_;
}
