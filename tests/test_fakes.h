// Copyright 2026 The PortaShot Authors
// Test doubles for the capture coordinator seams.

#ifndef PORTASHOT_TESTS_TEST_FAKES_H_
#define PORTASHOT_TESTS_TEST_FAKES_H_

#include <stdlib.h>

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "core/capture_sink.h"
#include "core/capture_sources.h"
#include "core/platform_hotkey.h"

// Solid-colour BGRA image.
inline portashot::Image MakeSolidImage(int width, int height,
                                       uint8_t b = 0x20, uint8_t g = 0x80,
                                       uint8_t r = 0xE0) {
  std::vector<uint8_t> pixels(static_cast<size_t>(width) * height * 4);
  for (size_t i = 0; i < pixels.size(); i += 4) {
    pixels[i + 0] = b;
    pixels[i + 1] = g;
    pixels[i + 2] = r;
    pixels[i + 3] = 0xFF;
  }
  return portashot::Image::FromData(width, height, width * 4,
                                    kPortaShotFormatBgra8, pixels.data());
}

// Virtual screen of a fixed size; grabs return solid images of the
// requested size.
class FakeScreenSource : public IScreenSource {
 public:
  FakeScreenSource(int width, int height) {
    screen_.width = width;
    screen_.height = height;
  }

  bool GetVirtualScreen(SelectionRect* out_rect) override {
    *out_rect = screen_;
    return true;
  }

  bool GetActiveWindowRect(SelectionRect* out_rect) override {
    if (!has_window) return false;
    *out_rect = window;
    return true;
  }

  portashot::Image GrabRegion(const SelectionRect& rect) override {
    grabs.push_back(rect);
    if (fail_grab) return portashot::Image();
    return MakeSolidImage(rect.width, rect.height);
  }

  bool has_window = false;
  SelectionRect window;
  bool fail_grab = false;
  std::vector<SelectionRect> grabs;

 private:
  SelectionRect screen_;
};

// Returns a scripted outcome; can run a hook while "the overlay is open".
class FakeRegionSelector : public IRegionSelector {
 public:
  SelectionOutcome SelectRegion() override {
    ++calls;
    if (while_open) while_open();
    return outcome;
  }

  static SelectionOutcome Committed(int x, int y, int w, int h) {
    SelectionOutcome out;
    out.state = SelectionState::kCommitted;
    out.rect.x = x;
    out.rect.y = y;
    out.rect.width = w;
    out.rect.height = h;
    return out;
  }

  static SelectionOutcome Cancelled() {
    SelectionOutcome out;
    out.state = SelectionState::kCancelled;
    return out;
  }

  SelectionOutcome outcome;
  std::function<void()> while_open;
  int calls = 0;
};

class FakeClipboard : public IImageClipboard {
 public:
  bool SetImage(const portashot::Image& image) override {
    ++calls;
    if (fail) return false;
    width = image.width();
    height = image.height();
    return true;
  }

  bool fail = false;
  int calls = 0;
  int width = 0;
  int height = 0;
};

// Records what it was handed without touching the filesystem.
class RecordingSink : public ICaptureSink {
 public:
  StoreReport Store(CaptureResult result, const Config& /*config*/) override {
    StoreReport report;
    report.width = result.image.width();
    report.height = result.image.height();
    report.saved_path = "/fake/shot.png";
    modes.push_back(result.mode);
    results.push_back(std::move(result));
    return report;
  }

  std::vector<CaptureResult> results;
  std::vector<CaptureMode> modes;
};

class FakePlatformHotkey : public IPlatformHotkey {
 public:
  bool Register(int hotkey_id, uint32_t modifiers, int key_code) override {
    for (int taken : taken_keys) {
      if (taken == key_code) return false;
    }
    registered.push_back({hotkey_id, modifiers, key_code});
    return true;
  }

  void Unregister(int hotkey_id) override {
    for (auto it = registered.begin(); it != registered.end(); ++it) {
      if (it->id == hotkey_id) {
        registered.erase(it);
        return;
      }
    }
  }

  void UnregisterAll() override { registered.clear(); }

  std::vector<int> Poll() override {
    std::vector<int> out;
    out.swap(pending);
    return out;
  }

  // Simulate a key press of the binding registered for `key_code`.
  void Press(int key_code) {
    for (const auto& r : registered) {
      if (r.key_code == key_code) pending.push_back(r.id);
    }
  }

  struct Entry {
    int id;
    uint32_t modifiers;
    int key_code;
  };
  std::vector<Entry> registered;
  std::vector<int> taken_keys;
  std::vector<int> pending;
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::string tmpl =
        (std::filesystem::temp_directory_path() / "portashot_test_XXXXXX")
            .string();
    if (mkdtemp(&tmpl[0])) path_ = tmpl;
  }
  ~TempDir() {
    std::error_code ec;
    if (!path_.empty()) std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }
  bool ok() const { return !path_.empty(); }

  std::vector<std::string> Files() const {
    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& entry :
         std::filesystem::directory_iterator(path_, ec)) {
      names.push_back(entry.path().filename().string());
    }
    return names;
  }

 private:
  std::string path_;
};

#endif  // PORTASHOT_TESTS_TEST_FAKES_H_
