#include "GstFrameSource.h"
#include "GstUtils.h"
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>
#include <iostream>

namespace {

struct SourceSetupCtx {
  int latencyMs;
  int timeoutMs;
};

void onSourceSetup(GstElement * /*decodebin*/, GstElement *src,
                   gpointer user_data) {
  auto *ctx = static_cast<SourceSetupCtx *>(user_data);
  core::configureRtspSource(src, ctx->latencyMs, ctx->timeoutMs);
}

void freeSetupCtx(gpointer data, GClosure *) {
  delete static_cast<SourceSetupCtx *>(data);
}

} // namespace

GstFrameSource::GstFrameSource(const std::string &label,
                               const GstSourceOptions &opts)
    : label_(label), opts_(opts) {
  core::ensureGstInitialized();
}

GstFrameSource::~GstFrameSource() { release(); }

bool GstFrameSource::open(const std::string &uri) {
  release();

  // Only raw video pads are exposed; audio is handled by the audio sink.
  const std::string desc =
      "uridecodebin name=dec caps=video/x-raw expose-all-streams=false "
      "! queue max-size-buffers=1 leaky=downstream "
      "! videoconvert ! video/x-raw,format=BGR "
      "! appsink name=frame_sink emit-signals=false max-buffers=1 "
      "drop=true sync=false";

  GError *error = nullptr;
  pipeline_ = gst_parse_launch(desc.c_str(), &error);
  if (!pipeline_) {
    std::cerr << "[GstFrameSource] " << label_ << " failed to create pipeline: "
              << (error ? error->message : "Unknown error") << std::endl;
    if (error)
      g_error_free(error);
    return false;
  }
  if (error) {
    // Recoverable parse warning; the pipeline was still built.
    std::cout << "[GstFrameSource] " << label_ << " " << error->message
              << std::endl;
    g_error_free(error);
  }

  GstElement *dec = gst_bin_get_by_name(GST_BIN(pipeline_), "dec");
  appsink_ = gst_bin_get_by_name(GST_BIN(pipeline_), "frame_sink");
  if (!dec || !appsink_) {
    std::cerr << "[GstFrameSource] " << label_
              << " decoder or appsink missing from pipeline" << std::endl;
    if (dec)
      gst_object_unref(dec);
    release();
    return false;
  }

  const std::string gstUri = core::toGstUri(uri);
  g_object_set(dec, "uri", gstUri.c_str(), nullptr);
  g_signal_connect_data(
      dec, "source-setup", G_CALLBACK(onSourceSetup),
      new SourceSetupCtx{opts_.rtspLatencyMs, opts_.openTimeoutMs},
      freeSetupCtx, static_cast<GConnectFlags>(0));
  gst_object_unref(dec);

  bus_ = gst_element_get_bus(pipeline_);

  if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) ==
      GST_STATE_CHANGE_FAILURE) {
    std::cerr << "[GstFrameSource] " << label_
              << " failed to start pipeline for " << gstUri << std::endl;
    drainBus();
    release();
    return false;
  }

  if (!waitUntilPlaying()) {
    release();
    return false;
  }

  std::cout << "[GstFrameSource] " << label_ << " opened " << gstUri
            << std::endl;
  return true;
}

bool GstFrameSource::waitUntilPlaying() {
  const GstClockTime deadline = (GstClockTime)opts_.openTimeoutMs * GST_MSECOND;
  const GstClockTime slice = 50 * GST_MSECOND;
  GstClockTime waited = 0;

  while (waited < deadline) {
    GstMessage *msg = gst_bus_timed_pop_filtered(
        bus_, slice,
        (GstMessageType)(GST_MESSAGE_ERROR | GST_MESSAGE_EOS |
                         GST_MESSAGE_ASYNC_DONE | GST_MESSAGE_STATE_CHANGED));
    if (!msg) {
      waited += slice;
      continue;
    }

    bool done = false;
    bool ok = false;
    switch (GST_MESSAGE_TYPE(msg)) {
    case GST_MESSAGE_ERROR:
      core::logBusMessage(msg, "GstFrameSource", label_);
      done = true;
      break;
    case GST_MESSAGE_EOS:
      std::cerr << "[GstFrameSource] " << label_ << " EOS while opening"
                << std::endl;
      done = true;
      break;
    case GST_MESSAGE_ASYNC_DONE:
      done = ok = true;
      break;
    case GST_MESSAGE_STATE_CHANGED:
      if (GST_MESSAGE_SRC(msg) == GST_OBJECT(pipeline_)) {
        GstState o, n, p;
        gst_message_parse_state_changed(msg, &o, &n, &p);
        if (n == GST_STATE_PLAYING)
          done = ok = true;
      }
      break;
    default:
      break;
    }
    gst_message_unref(msg);
    if (done)
      return ok;
  }

  std::cerr << "[GstFrameSource] " << label_ << " timed out after "
            << opts_.openTimeoutMs << " ms while opening" << std::endl;
  return false;
}

bool GstFrameSource::drainBus() {
  if (!bus_)
    return true;
  bool healthy = true;
  GstMessage *msg = nullptr;
  while ((msg = gst_bus_pop_filtered(
              bus_, (GstMessageType)(GST_MESSAGE_ERROR | GST_MESSAGE_EOS |
                                     GST_MESSAGE_WARNING))) != nullptr) {
    switch (GST_MESSAGE_TYPE(msg)) {
    case GST_MESSAGE_ERROR:
      core::logBusMessage(msg, "GstFrameSource", label_);
      healthy = false;
      break;
    case GST_MESSAGE_EOS:
      std::cout << "[GstFrameSource] " << label_ << " end of stream"
                << std::endl;
      healthy = false;
      break;
    default:
      core::logBusMessage(msg, "GstFrameSource", label_);
      break;
    }
    gst_message_unref(msg);
  }
  return healthy;
}

bool GstFrameSource::read(cv::Mat &frame) {
  if (!pipeline_ || !appsink_)
    return false;
  if (!drainBus())
    return false;

  GstSample *sample = gst_app_sink_try_pull_sample(
      GST_APP_SINK(appsink_), (GstClockTime)opts_.readTimeoutMs * GST_MSECOND);
  if (!sample) {
    if (gst_app_sink_is_eos(GST_APP_SINK(appsink_)))
      std::cout << "[GstFrameSource] " << label_ << " end of stream"
                << std::endl;
    else if (drainBus())
      std::cerr << "[GstFrameSource] " << label_ << " no frame within "
                << opts_.readTimeoutMs << " ms" << std::endl;
    return false;
  }

  GstBuffer *buffer = gst_sample_get_buffer(sample);
  GstCaps *caps = gst_sample_get_caps(sample);
  GstVideoInfo info;
  if (!buffer || !caps || !gst_video_info_from_caps(&info, caps)) {
    std::cerr << "[GstFrameSource] " << label_ << " sample without video caps"
              << std::endl;
    gst_sample_unref(sample);
    return false;
  }

  GstMapInfo map;
  if (!gst_buffer_map(buffer, &map, GST_MAP_READ)) {
    gst_sample_unref(sample);
    return false;
  }

  cv::Mat view(GST_VIDEO_INFO_HEIGHT(&info), GST_VIDEO_INFO_WIDTH(&info),
               CV_8UC3, map.data,
               (size_t)GST_VIDEO_INFO_PLANE_STRIDE(&info, 0));
  frame = view.clone();

  gst_buffer_unmap(buffer, &map);
  gst_sample_unref(sample);
  return !frame.empty();
}

void GstFrameSource::release() {
  if (pipeline_)
    gst_element_set_state(pipeline_, GST_STATE_NULL);
  if (appsink_) {
    gst_object_unref(appsink_);
    appsink_ = nullptr;
  }
  if (bus_) {
    gst_object_unref(bus_);
    bus_ = nullptr;
  }
  if (pipeline_) {
    gst_object_unref(pipeline_);
    pipeline_ = nullptr;
  }
}
