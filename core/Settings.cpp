#include "Settings.h"
#include <cctype>
#include <fstream>
#include <iostream>

Settings::Settings() : json_(nlohmann::json::object()) {}

Settings::Settings(const std::string &json_path)
    : json_path_(json_path), defaults_(), json_(nlohmann::json::object()) {
  reload();
}

Settings Settings::fromJson(nlohmann::json json) {
  Settings s;
  if (json.is_object())
    s.json_ = std::move(json);
  return s;
}

void Settings::reload() {
  std::ifstream f(json_path_);
  if (!f) {
    std::cout << "[Settings] " << json_path_
              << " not found, using defaults" << std::endl;
    return;
  }
  try {
    f >> json_;
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "[Settings] Failed to parse " << json_path_ << ": "
              << e.what() << std::endl;
    json_ = nlohmann::json::object();
  }
  if (!json_.is_object()) {
    std::cerr << "[Settings] " << json_path_
              << " is not a JSON object, using defaults" << std::endl;
    json_ = nlohmann::json::object();
  }
}

template <typename T>
T Settings::value(const char *key, const T &fallback) const {
  auto it = json_.find(key);
  if (it == json_.end())
    return fallback;
  try {
    return it->template get<T>();
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "[Settings] Ignoring '" << key << "': " << e.what()
              << std::endl;
    return fallback;
  }
}

// -------- DISPLAY --------
IntSize Settings::window_size() const {
  if (json_.contains("window_size") && json_["window_size"].is_array()) {
    const auto &arr = json_["window_size"];
    if (arr.size() == 2 && arr[0].is_number_integer() &&
        arr[1].is_number_integer()) {
      IntSize sz{arr[0].get<int>(), arr[1].get<int>()};
      if (sz.width > 0 && sz.height > 0)
        return sz;
    }
  }
  if (json_.contains("window_size") && json_["window_size"].is_string()) {
    IntSize sz;
    if (parseSize(json_["window_size"].get<std::string>(), sz))
      return sz;
  }
  return defaults_.window_size_;
}

bool Settings::fullscreen() const {
  return value("fullscreen", defaults_.fullscreen_);
}
bool Settings::overlay() const { return value("overlay", defaults_.overlay_); }
bool Settings::audio_controls() const {
  return value("audio_controls", defaults_.audio_controls_);
}

// -------- STREAMS --------
std::string Settings::stream_file() const {
  return value("stream_file", defaults_.stream_file_);
}
bool Settings::probe_audio() const {
  return value("probe_audio", defaults_.probe_audio_);
}

// -------- CONNECTION --------
int Settings::reconnect_delay_ms() const {
  return value("reconnect_delay_ms", defaults_.reconnect_delay_ms_);
}
int Settings::reconnect_max_delay_ms() const {
  int max = value("reconnect_max_delay_ms", defaults_.reconnect_max_delay_ms_);
  int base = reconnect_delay_ms();
  return max < base ? base : max;
}
int Settings::open_timeout_ms() const {
  return value("open_timeout_ms", defaults_.open_timeout_ms_);
}
int Settings::read_timeout_ms() const {
  return value("read_timeout_ms", defaults_.read_timeout_ms_);
}
int Settings::rtsp_latency_ms() const {
  return value("rtsp_latency_ms", defaults_.rtsp_latency_ms_);
}

// -------- RENDER LOOP --------
int Settings::idle_backoff_ms() const {
  return value("idle_backoff_ms", defaults_.idle_backoff_ms_);
}
int Settings::render_interval_ms() const {
  return value("render_interval_ms", defaults_.render_interval_ms_);
}

bool Settings::parseSize(const std::string &text, IntSize &out) {
  auto pos = text.find_first_of("xX");
  if (pos == std::string::npos || pos == 0 || pos + 1 >= text.size())
    return false;

  auto parsePositive = [](const std::string &s, int &v) {
    if (s.empty() || s.size() > 6)
      return false;
    v = 0;
    for (char c : s) {
      if (!std::isdigit(static_cast<unsigned char>(c)))
        return false;
      v = v * 10 + (c - '0');
    }
    return v > 0;
  };

  IntSize sz;
  if (!parsePositive(text.substr(0, pos), sz.width) ||
      !parsePositive(text.substr(pos + 1), sz.height))
    return false;
  out = sz;
  return true;
}

// -------- Templated Setter ---------
template <typename T>
void Settings::set(const std::string &key, const T &value) {
  json_[key] = value;
}

template void Settings::set<int>(const std::string &, const int &);
template void Settings::set<bool>(const std::string &, const bool &);
template void Settings::set<std::string>(const std::string &,
                                         const std::string &);
