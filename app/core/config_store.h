// Copyright 2026 The PortaShot Authors
//
// ConfigStore: persistent user settings kept in a JSON file.
//
//   {
//     "save_directory": "/home/user/Desktop",
//     "format": "png",
//     "jpg_quality": 95
//   }
//
// Loading never fails: a missing file, malformed JSON or a wrong-typed value
// falls back to the default for the affected key.  Keys the store does not
// know are kept and written back unchanged.

#ifndef PORTASHOT_APP_CORE_CONFIG_STORE_H_
#define PORTASHOT_APP_CORE_CONFIG_STORE_H_

#include <functional>
#include <string>

#include "nlohmann/json.hpp"

enum class ImageFormat {
  kPng,
  kJpg,
};

/// Lower-case name and file extension ("png" / "jpg").
const char* ImageFormatName(ImageFormat format);

/// Case-insensitive; accepts "png", "jpg" and "jpeg".
bool ParseImageFormat(const std::string& text, ImageFormat* out_format);

/// Clamp to the valid JPEG quality range [1, 100].
int ClampJpgQuality(int quality);

struct Config {
  std::string save_directory;
  ImageFormat format = ImageFormat::kPng;
  int jpg_quality = 95;
};

/// $HOME/Desktop, absolute.
std::string DefaultSaveDirectory();

Config DefaultConfig();

class ConfigStore {
 public:
  using Observer = std::function<void(const Config&)>;

  explicit ConfigStore(std::string path);

  /// config.json next to the running executable.
  static std::string DefaultPath();

  /// Read the file at path().  Resets to defaults first.
  void Load();

  /// Parse JSON text into the store (used by Load()).
  void LoadFromString(const std::string& text);

  /// Write the current config, pretty-printed.  Returns false on I/O error.
  bool Save() const;

  /// Serialized form written by Save().
  std::string ToString() const;

  /// Mutators persist immediately, then notify the observer.
  bool SetFormat(ImageFormat format);
  bool SetSaveDirectory(const std::string& directory);
  bool SetJpgQuality(int quality);

  /// Called after every successful mutation.
  void SetObserver(Observer observer) { observer_ = std::move(observer); }

  const Config& config() const { return config_; }
  const std::string& path() const { return path_; }

 private:
  bool Commit();

  std::string path_;
  Config config_;
  nlohmann::json extra_ = nlohmann::json::object();
  Observer observer_;
};

#endif  // PORTASHOT_APP_CORE_CONFIG_STORE_H_
