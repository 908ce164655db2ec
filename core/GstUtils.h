#pragma once
#include <gst/gst.h>
#include <string>

namespace core {

// gst_init() once per process. Also demotes the CUDA decoders under WSL,
// where they fail to allocate.
void ensureGstInitialized();

// Turns plain file paths into file:// URIs; URIs pass through untouched.
std::string toGstUri(const std::string &source);

bool isRtspUri(const std::string &uri);

// Logs an ERROR or WARNING bus message as "[tag] label: message".
void logBusMessage(GstMessage *msg, const char *tag, const std::string &label);

// RTSP tuning applied from "source-setup": TCP transport, bounded latency
// and a read timeout so a dead server surfaces as an error.
void configureRtspSource(GstElement *src, int latencyMs, int timeoutMs);

} // namespace core
