#include "GstAudioSink.h"
#include "GstUtils.h"
#include <iostream>

namespace {

// GstPlayFlags: video = 1 << 0, audio = 1 << 1, text = 1 << 2
constexpr guint kPlayFlagAudio = 1u << 1;

struct RtspTuning {
  int latencyMs;
  int timeoutMs;
};

void onSourceSetup(GstElement * /*playbin*/, GstElement *src, gpointer data) {
  auto *t = static_cast<RtspTuning *>(data);
  core::configureRtspSource(src, t->latencyMs, t->timeoutMs);
}

void freeTuning(gpointer data, GClosure *) {
  delete static_cast<RtspTuning *>(data);
}

} // namespace

GstAudioSink::GstAudioSink(const std::string &label, int rtspLatencyMs,
                           int timeoutMs)
    : label_(label), rtspLatencyMs_(rtspLatencyMs), timeoutMs_(timeoutMs) {
  core::ensureGstInitialized();
}

GstAudioSink::~GstAudioSink() { stop(); }

bool GstAudioSink::start(const std::string &uri) {
  stop();

  playbin_ = gst_element_factory_make("playbin", nullptr);
  if (!playbin_) {
    std::cerr << "[GstAudioSink] " << label_ << " playbin not available"
              << std::endl;
    return false;
  }

  const std::string gstUri = core::toGstUri(uri);
  g_object_set(playbin_, "uri", gstUri.c_str(), "flags", kPlayFlagAudio,
               nullptr);
  g_signal_connect_data(playbin_, "source-setup", G_CALLBACK(onSourceSetup),
                        new RtspTuning{rtspLatencyMs_, timeoutMs_}, freeTuning,
                        static_cast<GConnectFlags>(0));

  bus_ = gst_element_get_bus(playbin_);
  failed_ = false;

  if (gst_element_set_state(playbin_, GST_STATE_PLAYING) ==
      GST_STATE_CHANGE_FAILURE) {
    drainBus();
    std::cerr << "[GstAudioSink] " << label_ << " failed to play audio of "
              << gstUri << std::endl;
    stop();
    return false;
  }

  // Most sources go PLAYING asynchronously; later failures show up on the
  // bus and are handled by isPlaying().
  std::cout << "[GstAudioSink] " << label_ << " playing audio" << std::endl;
  return true;
}

bool GstAudioSink::isPlaying() const {
  if (!playbin_)
    return false;
  drainBus();
  return !failed_;
}

void GstAudioSink::drainBus() const {
  if (!bus_)
    return;
  GstMessage *msg = nullptr;
  while ((msg = gst_bus_pop_filtered(
              bus_, static_cast<GstMessageType>(GST_MESSAGE_ERROR |
                                                GST_MESSAGE_WARNING |
                                                GST_MESSAGE_EOS))) != nullptr) {
    switch (GST_MESSAGE_TYPE(msg)) {
    case GST_MESSAGE_ERROR:
      core::logBusMessage(msg, "GstAudioSink", label_);
      failed_ = true;
      break;
    case GST_MESSAGE_WARNING:
      core::logBusMessage(msg, "GstAudioSink", label_);
      break;
    case GST_MESSAGE_EOS:
      std::cout << "[GstAudioSink] " << label_ << " audio reached end of stream"
                << std::endl;
      failed_ = true;
      break;
    default:
      break;
    }
    gst_message_unref(msg);
  }
}

void GstAudioSink::stop() {
  if (!playbin_)
    return;
  gst_element_set_state(playbin_, GST_STATE_NULL);
  if (bus_) {
    gst_object_unref(bus_);
    bus_ = nullptr;
  }
  gst_object_unref(playbin_);
  playbin_ = nullptr;
  failed_ = false;
  std::cout << "[GstAudioSink] " << label_ << " audio stopped" << std::endl;
}
