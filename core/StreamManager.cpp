#include "StreamManager.h"
#include "GstAudioSink.h"
#include "GstFrameSource.h"
#include <algorithm>
#include <exception>
#include <future>
#include <iostream>

namespace {

ReconnectPolicy policyFrom(const Settings &settings) {
  ReconnectPolicy p;
  p.baseDelayMs = std::max(1, settings.reconnect_delay_ms());
  p.maxDelayMs = std::max(p.baseDelayMs, settings.reconnect_max_delay_ms());
  return p;
}

} // namespace

StreamManager::StreamManager(const Settings &settings)
    : StreamManager(
          settings,
          [opts = GstSourceOptions{settings.open_timeout_ms(),
                                   settings.read_timeout_ms(),
                                   settings.rtsp_latency_ms()}](
              const std::string &label) -> std::unique_ptr<FrameSource> {
            return std::make_unique<GstFrameSource>(label, opts);
          },
          [latency = settings.rtsp_latency_ms(),
           timeout = settings.open_timeout_ms()](
              const std::string &label) -> std::unique_ptr<AudioSink> {
            return std::make_unique<GstAudioSink>(label, latency, timeout);
          },
          [](const std::string &uri) { return probeAudio(uri); }) {}

StreamManager::StreamManager(const Settings &settings,
                             FrameSourceFactory sourceFactory,
                             AudioSinkFactory audioFactory, AudioProber prober)
    : audioControls_(settings.audio_controls()),
      probeAudio_(settings.probe_audio()), policy_(policyFrom(settings)),
      sourceFactory_(std::move(sourceFactory)),
      audioFactory_(std::move(audioFactory)), prober_(std::move(prober)) {}

StreamManager::~StreamManager() {
  stopAll();
  std::cout << "[StreamManager] exit after destructor" << std::endl;
}

std::optional<bool>
StreamManager::knownAudioCapability(const StreamIdentity &id) const {
  if (!audioControls_)
    return false;
  if (id.audio)
    return *id.audio;
  if (!probeAudio_ || !prober_)
    return false;
  return std::nullopt;
}

bool StreamManager::probedAudioCapability(const StreamIdentity &id,
                                          const AudioProbeResult &r) const {
  if (!r.probed)
    std::cerr << "[StreamManager] " << id.label
              << " audio probe timed out, treating as video-only" << std::endl;
  return r.probed && r.has_audio;
}

void StreamManager::addWorker(const StreamIdentity &id, bool audioCapable) {
  std::unique_ptr<AudioChannel> audio;
  if (audioCapable && audioFactory_)
    audio = std::make_unique<AudioChannel>(id.label, id.uri,
                                           audioFactory_(id.label));

  streams_.push_back(std::make_unique<StreamWorker>(
      id.label, id.uri, sourceFactory_(id.label), std::move(audio), policy_));

  std::cout << "[StreamManager] Added " << id.label << " (" << id.uri << ")"
            << (audioCapable ? " with audio" : "") << std::endl;
}

void StreamManager::addStream(const StreamIdentity &id) {
  std::optional<bool> known = knownAudioCapability(id);
  addWorker(id, known ? *known : probedAudioCapability(id, prober_(id.uri)));
}

void StreamManager::addStreams(const std::vector<StreamIdentity> &ids) {
  // Each probe may wait out its full timeout on an unreachable host; run
  // them side by side so startup costs one timeout, not one per stream.
  std::vector<std::optional<bool>> known;
  std::vector<std::future<AudioProbeResult>> probes(ids.size());
  known.reserve(ids.size());
  for (size_t i = 0; i < ids.size(); ++i) {
    known.push_back(knownAudioCapability(ids[i]));
    if (!known[i])
      probes[i] = std::async(std::launch::async, prober_, ids[i].uri);
  }

  for (size_t i = 0; i < ids.size(); ++i) {
    bool audioCapable = known[i] ? *known[i] : false;
    if (!known[i]) {
      try {
        audioCapable = probedAudioCapability(ids[i], probes[i].get());
      } catch (const std::exception &e) {
        std::cerr << "[StreamManager] " << ids[i].label
                  << " audio probe failed: " << e.what() << std::endl;
      }
    }
    addWorker(ids[i], audioCapable);
  }
}

void StreamManager::startAll() {
  for (auto &s : streams_)
    s->start();
}

void StreamManager::stopAll() {
  for (auto &s : streams_)
    s->requestStop();
  for (auto &s : streams_)
    s->stop();
}

StreamWorker *StreamManager::getStream(size_t index) {
  return index < streams_.size() ? streams_[index].get() : nullptr;
}

std::vector<std::string> StreamManager::getStreamNames() const {
  std::vector<std::string> names;
  names.reserve(streams_.size());
  for (const auto &s : streams_)
    names.push_back(s->label());
  return names;
}

std::vector<TileInput> StreamManager::collectTiles() const {
  std::vector<TileInput> tiles;
  tiles.reserve(streams_.size());
  for (const auto &s : streams_) {
    TileInput t;
    t.frame = s->getFrame();
    t.label = s->label();
    t.audioCapable = s->audioCapable();
    t.audioOn = s->audioOn();
    tiles.push_back(std::move(t));
  }
  return tiles;
}

bool StreamManager::toggleAudio(size_t index) {
  StreamWorker *s = getStream(index);
  if (!s || !s->audioCapable())
    return false;
  s->toggleAudio();
  return true;
}
