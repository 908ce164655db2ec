#include "AudioChannel.h"
#include <exception>
#include <iostream>

AudioChannel::AudioChannel(const std::string &label, const std::string &uri,
                           std::unique_ptr<AudioSink> sink)
    : label_(label), uri_(uri), sink_(std::move(sink)) {}

AudioChannel::~AudioChannel() { disable(); }

bool AudioChannel::enable() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!sink_) {
    std::cerr << "[AudioChannel] " << label_ << " has no audio sink"
              << std::endl;
    return false;
  }
  if (sink_->isPlaying()) {
    active_ = true;
    return true;
  }

  bool ok = false;
  try {
    ok = sink_->start(uri_);
  } catch (const std::exception &e) {
    std::cerr << "[AudioChannel] " << label_ << " start threw: " << e.what()
              << std::endl;
  }
  if (!ok)
    std::cerr << "[AudioChannel] " << label_ << " failed to start audio"
              << std::endl;
  else
    std::cout << "[AudioChannel] " << label_ << " audio on" << std::endl;
  active_ = ok;
  return ok;
}

void AudioChannel::disable() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!sink_)
    return;
  const bool wasPlaying = active_.exchange(false) || sink_->isPlaying();
  try {
    sink_->stop();
  } catch (const std::exception &e) {
    std::cerr << "[AudioChannel] " << label_ << " stop threw: " << e.what()
              << std::endl;
  }
  if (wasPlaying)
    std::cout << "[AudioChannel] " << label_ << " audio off" << std::endl;
}

bool AudioChannel::active() const {
  std::unique_lock<std::mutex> lock(mtx_, std::try_to_lock);
  if (lock.owns_lock())
    active_ = sink_ && sink_->isPlaying();
  return active_.load();
}
