// Copyright 2026 The PortaShot Authors
//
// C++ RAII wrapper for the portashot C API.
// Header-only, just include this file.  Requires C++17 or later.
//
// Usage:
//   #include "portashot/portashot.hpp"
//   portashot::Context ctx;
//   auto img = ctx.CaptureVirtualScreen();
//   img.Export("/tmp/shot.png", kPortaShotImageFormatPng);

#ifndef PORTASHOT_PORTASHOT_HPP_
#define PORTASHOT_PORTASHOT_HPP_

#include "portashot/portashot.h"

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace portashot {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(PortaShotError code, const char* msg)
      : std::runtime_error(msg ? msg : "portashot error"), code_(code) {}
  PortaShotError code() const noexcept { return code_; }

 private:
  PortaShotError code_;
};

// ---------------------------------------------------------------------------
// Image  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Image {
 public:
  Image() noexcept = default;
  explicit Image(PortaShotImage* raw) noexcept : raw_(raw) {}
  ~Image() { portashot_image_destroy(raw_); }

  Image(Image&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Image& operator=(Image&& o) noexcept {
    if (this != &o) {
      portashot_image_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;

  /// Copy caller pixel data into a new image.
  static Image FromData(int width, int height, int stride,
                        PortaShotPixelFormat format, const uint8_t* data) {
    auto* raw = portashot_image_create(width, height, stride, format, data);
    if (!raw) throw Error(kPortaShotErrorInvalidParam, "Invalid image data");
    return Image(raw);
  }

  explicit operator bool() const noexcept { return raw_ != nullptr; }
  PortaShotImage* get() const noexcept { return raw_; }
  PortaShotImage* release() noexcept {
    auto* p = raw_;
    raw_ = nullptr;
    return p;
  }

  int width() const noexcept { return portashot_image_get_width(raw_); }
  int height() const noexcept { return portashot_image_get_height(raw_); }
  int stride() const noexcept { return portashot_image_get_stride(raw_); }
  PortaShotPixelFormat format() const noexcept {
    return portashot_image_get_format(raw_);
  }
  const uint8_t* data() const noexcept {
    return portashot_image_get_data(raw_);
  }
  size_t data_size() const noexcept {
    return portashot_image_get_data_size(raw_);
  }

  void Export(const std::string& path, PortaShotImageFormat format,
              int quality = 0) const {
    auto err = portashot_image_export(raw_, path.c_str(), format, quality);
    if (err != kPortaShotOk) throw Error(err, "Image export failed");
  }

 private:
  PortaShotImage* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Context  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Context {
 public:
  Context() : raw_(portashot_context_create()) {
    if (!raw_) {
      throw Error(kPortaShotErrorNotInitialized, "Context creation failed");
    }
  }
  ~Context() { portashot_context_destroy(raw_); }

  Context(Context&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Context& operator=(Context&& o) noexcept {
    if (this != &o) {
      portashot_context_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  PortaShotContext* get() const noexcept { return raw_; }

  PortaShotError last_error() const {
    return portashot_get_last_error(raw_);
  }
  const char* last_error_message() const {
    return portashot_get_last_error_message(raw_);
  }

  // -- Screen info --

  PortaShotRect virtual_screen() {
    PortaShotRect r = {};
    check(portashot_get_virtual_screen(raw_, &r));
    return r;
  }

  PortaShotRect active_window_rect() {
    PortaShotRect r = {};
    check(portashot_get_active_window_rect(raw_, &r));
    return r;
  }

  // -- Capture --

  Image CaptureVirtualScreen() {
    auto* img = portashot_capture_virtual_screen(raw_);
    if (!img) throw_last("CaptureVirtualScreen failed");
    return Image(img);
  }

  Image CaptureRegion(int x, int y, int w, int h) {
    auto* img = portashot_capture_region(raw_, x, y, w, h);
    if (!img) throw_last("CaptureRegion failed");
    return Image(img);
  }

  // -- Clipboard --

  void SetClipboardImage(const Image& img) {
    check(portashot_clipboard_set_image(raw_, img.get()));
  }

 private:
  void check(PortaShotError err) {
    if (err != kPortaShotOk)
      throw Error(err, portashot_get_last_error_message(raw_));
  }
  [[noreturn]] void throw_last(const char* fallback) {
    auto err = portashot_get_last_error(raw_);
    const char* msg = portashot_get_last_error_message(raw_);
    throw Error(err != kPortaShotOk ? err : kPortaShotErrorUnknown,
                (msg && msg[0]) ? msg : fallback);
  }

  PortaShotContext* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

inline const char* version_string() { return portashot_version_string(); }

inline void log(PortaShotLogLevel level, const std::string& message) {
  portashot_log(level, message.c_str());
}

}  // namespace portashot

#endif  // PORTASHOT_PORTASHOT_HPP_
