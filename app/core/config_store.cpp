// Copyright 2026 The PortaShot Authors

#include "core/config_store.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include <limits.h>
#include <pwd.h>
#include <unistd.h>

#include "core/app_defs.h"
#include "core/app_log.h"

namespace {

constexpr const char* kKeySaveDirectory = "save_directory";
constexpr const char* kKeyFormat = "format";
constexpr const char* kKeyJpgQuality = "jpg_quality";

std::string HomeDirectory() {
  const char* home = std::getenv("HOME");
  if (home && home[0] == '/') return home;
  struct passwd* pw = getpwuid(getuid());
  if (pw && pw->pw_dir) return pw->pw_dir;
  return "/tmp";
}

// Clamps in the JSON value's own width so large numbers never wrap.
int JpgQualityFromJson(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    uint64_t q = value.get<uint64_t>();
    if (q > static_cast<uint64_t>(kMaxJpgQuality)) return kMaxJpgQuality;
    return ClampJpgQuality(static_cast<int>(q));
  }
  if (value.is_number_integer()) {
    int64_t q = value.get<int64_t>();
    q = std::max<int64_t>(kMinJpgQuality, std::min<int64_t>(kMaxJpgQuality, q));
    return static_cast<int>(q);
  }
  double q = value.get<double>();
  if (std::isnan(q)) return kDefaultJpgQuality;
  q = std::max<double>(kMinJpgQuality, std::min<double>(kMaxJpgQuality, q));
  return static_cast<int>(q);
}

}  // namespace

const char* ImageFormatName(ImageFormat format) {
  return format == ImageFormat::kJpg ? "jpg" : "png";
}

bool ParseImageFormat(const std::string& text, ImageFormat* out_format) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "png") {
    *out_format = ImageFormat::kPng;
  } else if (lower == "jpg" || lower == "jpeg") {
    *out_format = ImageFormat::kJpg;
  } else {
    return false;
  }
  return true;
}

int ClampJpgQuality(int quality) {
  return std::max(kMinJpgQuality, std::min(kMaxJpgQuality, quality));
}

std::string DefaultSaveDirectory() {
  return HomeDirectory() + "/Desktop";
}

Config DefaultConfig() {
  Config config;
  config.save_directory = DefaultSaveDirectory();
  config.format = ImageFormat::kPng;
  config.jpg_quality = kDefaultJpgQuality;
  return config;
}

// ---------------------------------------------------------------------------
// ConfigStore
// ---------------------------------------------------------------------------

ConfigStore::ConfigStore(std::string path)
    : path_(std::move(path)), config_(DefaultConfig()) {}

std::string ConfigStore::DefaultPath() {
  char exe_path[PATH_MAX] = {};
  ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
  if (len <= 0) return kConfigFileName;
  exe_path[len] = '\0';
  std::string dir(exe_path);
  auto slash = dir.rfind('/');
  if (slash == std::string::npos) return kConfigFileName;
  return dir.substr(0, slash + 1) + kConfigFileName;
}

void ConfigStore::Load() {
  std::ifstream in(path_);
  if (!in) {
    config_ = DefaultConfig();
    extra_ = nlohmann::json::object();
    APP_LOG_INFO("No config at {}, using defaults", path_);
    return;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  LoadFromString(buffer.str());
}

void ConfigStore::LoadFromString(const std::string& text) {
  config_ = DefaultConfig();
  extra_ = nlohmann::json::object();

  nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    APP_LOG_WARN("Config {} is not a JSON object, using defaults", path_);
    return;
  }

  for (auto it = root.begin(); it != root.end(); ++it) {
    const std::string& key = it.key();
    const nlohmann::json& value = it.value();

    if (key == kKeySaveDirectory) {
      if (value.is_string() && !value.get<std::string>().empty()) {
        config_.save_directory = value.get<std::string>();
      } else {
        APP_LOG_WARN("Ignoring invalid '{}' in config", key);
      }
    } else if (key == kKeyFormat) {
      ImageFormat format;
      if (value.is_string() &&
          ParseImageFormat(value.get<std::string>(), &format)) {
        config_.format = format;
      } else {
        APP_LOG_WARN("Ignoring invalid '{}' in config", key);
      }
    } else if (key == kKeyJpgQuality) {
      if (value.is_number()) {
        config_.jpg_quality = JpgQualityFromJson(value);
      } else {
        APP_LOG_WARN("Ignoring invalid '{}' in config", key);
      }
    } else {
      extra_[key] = value;
    }
  }

  APP_LOG_DEBUG("Config loaded: dir={} format={} quality={}",
                config_.save_directory, ImageFormatName(config_.format),
                config_.jpg_quality);
}

std::string ConfigStore::ToString() const {
  nlohmann::json root = extra_;
  root[kKeySaveDirectory] = config_.save_directory;
  root[kKeyFormat] = ImageFormatName(config_.format);
  root[kKeyJpgQuality] = config_.jpg_quality;
  return root.dump(2);
}

bool ConfigStore::Save() const {
  std::ofstream out(path_, std::ios::out | std::ios::trunc);
  if (!out) {
    APP_LOG_ERROR("Cannot open {} for writing", path_);
    return false;
  }
  out << ToString() << "\n";
  out.flush();
  if (!out) {
    APP_LOG_ERROR("Failed to write config to {}", path_);
    return false;
  }
  return true;
}

bool ConfigStore::SetFormat(ImageFormat format) {
  config_.format = format;
  return Commit();
}

bool ConfigStore::SetSaveDirectory(const std::string& directory) {
  if (directory.empty()) return false;
  config_.save_directory = directory;
  return Commit();
}

bool ConfigStore::SetJpgQuality(int quality) {
  config_.jpg_quality = ClampJpgQuality(quality);
  return Commit();
}

bool ConfigStore::Commit() {
  bool saved = Save();
  if (observer_) observer_(config_);
  return saved;
}
