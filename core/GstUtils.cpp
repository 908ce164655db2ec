#include "GstUtils.h"
#include "PathUtils.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <gst/rtsp/gstrtsptransport.h>

namespace core {

void ensureGstInitialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (!gst_is_initialized())
      gst_init(nullptr, nullptr);
    std::cout << "[GST] gst_init done" << std::endl;

    if (PathUtils::isWSLEnvironment()) {
      for (const char *name : {"nvh264dec", "nvh265dec"}) {
        GstElementFactory *f = gst_element_factory_find(name);
        if (f) {
          gst_plugin_feature_set_rank(GST_PLUGIN_FEATURE(f), GST_RANK_NONE);
          gst_object_unref(f);
          std::cout << "[GST] WSL: Disabled " << name << std::endl;
        }
      }
    }
  });
}

std::string toGstUri(const std::string &source) {
  if (gst_uri_is_valid(source.c_str()))
    return source;

  GError *err = nullptr;
  gchar *uri = gst_filename_to_uri(source.c_str(), &err);
  if (!uri) {
    std::cerr << "[GST] Cannot convert '" << source
              << "' to URI: " << (err ? err->message : "unknown") << std::endl;
    if (err)
      g_error_free(err);
    return source;
  }
  std::string result(uri);
  g_free(uri);
  return result;
}

bool isRtspUri(const std::string &uri) {
  std::string prefix = uri.substr(0, 8);
  std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return prefix.rfind("rtsp://", 0) == 0 || prefix == "rtsps://";
}

void logBusMessage(GstMessage *msg, const char *tag,
                   const std::string &label) {
  GError *err = nullptr;
  gchar *dbg = nullptr;
  const bool isError = GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR;
  if (isError)
    gst_message_parse_error(msg, &err, &dbg);
  else if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_WARNING)
    gst_message_parse_warning(msg, &err, &dbg);
  else
    return;

  (isError ? std::cerr : std::cout)
      << "[" << tag << "] " << label << (isError ? " ERROR: " : " WARN: ")
      << (err ? err->message : "?") << " dbg=" << (dbg ? dbg : "")
      << std::endl;

  if (err)
    g_error_free(err);
  if (dbg)
    g_free(dbg);
}

void configureRtspSource(GstElement *src, int latencyMs, int timeoutMs) {
  if (!g_str_has_prefix(G_OBJECT_TYPE_NAME(src), "GstRTSPSrc"))
    return;
  g_object_set(src, "protocols", (gint)GST_RTSP_LOWER_TRANS_TCP, nullptr);
  g_object_set(src, "latency", (guint)latencyMs, nullptr);
  g_object_set(src, "drop-on-latency", TRUE, nullptr);
  g_object_set(src, "tcp-timeout", (guint64)timeoutMs * 1000, nullptr); // us
}

} // namespace core
