#pragma once
#include <functional>
#include <memory>
#include <string>

// Playback handle for the audio track of one stream.
class AudioSink {
public:
  virtual ~AudioSink() = default;

  virtual bool start(const std::string &uri) = 0;
  virtual void stop() = 0;
  virtual bool isPlaying() const = 0;
};

using AudioSinkFactory =
    std::function<std::unique_ptr<AudioSink>(const std::string &label)>;
