#pragma once

#include "AudioProbe.h"
#include "AudioSink.h"
#include "FrameSource.h"
#include "GridCompositor.h"
#include "Settings.h"
#include "StreamList.h"
#include "StreamWorker.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using AudioProber = std::function<AudioProbeResult(const std::string &uri)>;

// Owns the stream workers in list order. Index i here is index i in the
// compositor's tiles and geometry.
class StreamManager {
public:
  // GStreamer-backed sources, audio sinks and probe.
  explicit StreamManager(const Settings &settings);
  StreamManager(const Settings &settings, FrameSourceFactory sourceFactory,
                AudioSinkFactory audioFactory, AudioProber prober);
  ~StreamManager();

  StreamManager(const StreamManager &) = delete;
  StreamManager &operator=(const StreamManager &) = delete;

  void addStream(const StreamIdentity &id);
  // Same as addStream for each id, but the audio probes run concurrently.
  void addStreams(const std::vector<StreamIdentity> &ids);

  void startAll();
  // Signals every worker first, then joins them all.
  void stopAll();

  size_t size() const { return streams_.size(); }
  bool empty() const { return streams_.empty(); }
  StreamWorker *getStream(size_t index);
  std::vector<std::string> getStreamNames() const;

  // Latest frame plus overlay state of every stream, in order.
  std::vector<TileInput> collectTiles() const;

  // Flips audio of stream `index`; false if out of range or video-only.
  bool toggleAudio(size_t index);

  ReconnectPolicy reconnectPolicy() const { return policy_; }

private:
  // Capability known without probing, or nullopt when a probe must decide.
  std::optional<bool> knownAudioCapability(const StreamIdentity &id) const;
  bool probedAudioCapability(const StreamIdentity &id,
                             const AudioProbeResult &r) const;
  void addWorker(const StreamIdentity &id, bool audioCapable);

  bool audioControls_;
  bool probeAudio_;
  ReconnectPolicy policy_;
  FrameSourceFactory sourceFactory_;
  AudioSinkFactory audioFactory_;
  AudioProber prober_;

  std::vector<std::unique_ptr<StreamWorker>> streams_;
};
