#include "AudioProbe.h"
#include "GstUtils.h"
#include <chrono>
#include <condition_variable>
#include <gst/pbutils/pbutils.h>
#include <iostream>
#include <mutex>

namespace {

// Fills `out` from the caps of an rtspsrc pad. False for non-audio pads.
bool readAudioPad(GstPad *pad, AudioProbeResult &out) {
  GstCaps *caps = gst_pad_get_current_caps(pad);
  if (!caps)
    caps = gst_pad_query_caps(pad, nullptr);
  if (!caps)
    return false;

  bool isAudio = false;
  const GstStructure *st = gst_caps_get_structure(caps, 0);
  const char *media = st ? gst_structure_get_string(st, "media") : nullptr;
  if (media && g_str_equal(media, "audio")) {
    isAudio = true;
    out.has_audio = true;
    if (const char *enc = gst_structure_get_string(st, "encoding-name"))
      out.encoding = enc;
    gst_structure_get_int(st, "clock-rate", &out.rate);
    gst_structure_get_int(st, "channels", &out.channels);
  }
  gst_caps_unref(caps);
  return isAudio;
}

// DESCRIBE-only session: rtspsrc is taken to PAUSED so it announces its
// pads; they are inspected and never linked. Finishes on the first audio
// pad or when rtspsrc reports no more pads.
class RtspAudioProbe {
public:
  explicit RtspAudioProbe(int timeoutMs) : timeoutMs_(timeoutMs) {}

  AudioProbeResult run(const std::string &uri) {
    GstElement *pipeline = gst_pipeline_new(nullptr);
    GstElement *src = gst_element_factory_make("rtspsrc", nullptr);
    if (!pipeline || !src) {
      std::cerr << "[AudioProbe] rtspsrc not available" << std::endl;
      if (src)
        gst_object_unref(src);
      if (pipeline)
        gst_object_unref(pipeline);
      return result_;
    }

    g_object_set(src, "location", uri.c_str(), nullptr);
    core::configureRtspSource(src, 0, timeoutMs_);
    gst_bin_add(GST_BIN(pipeline), src);

    const gulong padHandler =
        g_signal_connect(src, "pad-added", G_CALLBACK(&RtspAudioProbe::onPad),
                         this);
    const gulong doneHandler = g_signal_connect(
        src, "no-more-pads", G_CALLBACK(&RtspAudioProbe::onNoMorePads), this);

    gst_element_set_state(pipeline, GST_STATE_PAUSED);
    const bool finished = waitFinished();

    g_signal_handler_disconnect(src, padHandler);
    g_signal_handler_disconnect(src, doneHandler);
    gst_element_set_state(pipeline, GST_STATE_NULL);
    gst_object_unref(pipeline);

    std::lock_guard<std::mutex> lk(mtx_);
    result_.probed = finished;
    return result_;
  }

private:
  static void onPad(GstElement *, GstPad *pad, gpointer self) {
    auto *probe = static_cast<RtspAudioProbe *>(self);
    std::lock_guard<std::mutex> lk(probe->mtx_);
    if (readAudioPad(pad, probe->result_))
      probe->finishLocked();
  }

  static void onNoMorePads(GstElement *, gpointer self) {
    auto *probe = static_cast<RtspAudioProbe *>(self);
    std::lock_guard<std::mutex> lk(probe->mtx_);
    probe->finishLocked();
  }

  void finishLocked() {
    finished_ = true;
    cv_.notify_all();
  }

  bool waitFinished() {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, std::chrono::milliseconds(timeoutMs_),
                        [this] { return finished_; });
  }

  int timeoutMs_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool finished_ = false;
  AudioProbeResult result_;
};

AudioProbeResult probeDiscoverer(const std::string &uri, int timeout_ms) {
  AudioProbeResult out;

  GError *err = nullptr;
  GstDiscoverer *disc =
      gst_discoverer_new((GstClockTime)timeout_ms * GST_MSECOND, &err);
  if (!disc) {
    std::cerr << "[AudioProbe] discoverer new failed: "
              << (err ? err->message : "unknown") << std::endl;
    if (err)
      g_error_free(err);
    return out;
  }

  GstDiscovererInfo *info =
      gst_discoverer_discover_uri(disc, uri.c_str(), &err);
  if (!info) {
    std::cerr << "[AudioProbe] discover_uri failed: "
              << (err ? err->message : "unknown") << std::endl;
    if (err)
      g_error_free(err);
    g_object_unref(disc);
    return out;
  }
  if (err)
    g_error_free(err);

  if (gst_discoverer_info_get_result(info) == GST_DISCOVERER_OK) {
    out.probed = true;
    GList *streams = gst_discoverer_info_get_audio_streams(info);
    if (streams) {
      const auto *a = static_cast<GstDiscovererAudioInfo *>(streams->data);
      out.has_audio = true;
      out.channels = (int)gst_discoverer_audio_info_get_channels(a);
      out.rate = (int)gst_discoverer_audio_info_get_sample_rate(a);
      gst_discoverer_stream_info_list_free(streams);
    }
  }

  gst_discoverer_info_unref(info);
  g_object_unref(disc);
  return out;
}

} // namespace

AudioProbeResult probeAudio(const std::string &uri, int timeout_ms) {
  core::ensureGstInitialized();

  const std::string gstUri = core::toGstUri(uri);
  AudioProbeResult r = core::isRtspUri(gstUri)
                           ? RtspAudioProbe(timeout_ms).run(gstUri)
                           : probeDiscoverer(gstUri, timeout_ms);

  std::cout << "[AudioProbe] " << gstUri
            << " probed: " << (r.probed ? "yes" : "no")
            << ", has audio: " << (r.has_audio ? "yes" : "no") << std::endl;
  return r;
}
