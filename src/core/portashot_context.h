// Copyright 2026 The PortaShot Authors

#ifndef PORTASHOT_CORE_PORTASHOT_CONTEXT_H_
#define PORTASHOT_CORE_PORTASHOT_CONTEXT_H_

#include <memory>
#include <mutex>
#include <string>

#include "core/capture_backend.h"
#include "core/clipboard_writer.h"
#include "core/image.h"
#include "portashot/portashot.h"

namespace portashot {
namespace internal {

/// Internal implementation of the opaque PortaShotContext handle.
///
/// Owns the platform backend and provides the bridge between the public C API
/// and the internal C++ implementation.
class PortaShotContextImpl {
 public:
  PortaShotContextImpl();
  ~PortaShotContextImpl();

  // Non-copyable.
  PortaShotContextImpl(const PortaShotContextImpl&) = delete;
  PortaShotContextImpl& operator=(const PortaShotContextImpl&) = delete;

  /// Initialize the context and its backend.
  bool Initialize();

  /// Check if the context has been successfully initialized.
  bool is_initialized() const { return initialized_; }

  // -- Error state --

  PortaShotError last_error() const { return last_error_; }
  const char* last_error_message() const { return last_error_message_.c_str(); }

  void SetError(PortaShotError code, const std::string& message);
  void ClearError();

  // -- Screen information --

  PortaShotError GetVirtualScreen(PortaShotRect* out_rect);
  PortaShotError GetActiveWindowRect(PortaShotRect* out_rect);

  // -- Capture operations --

  /// Capture functions return a new Image owned by the caller, or nullptr.
  Image* CaptureVirtualScreen();
  Image* CaptureRegion(int x, int y, int width, int height);

  // -- Clipboard --

  PortaShotError SetClipboardImage(const Image& image);

 private:
  Image* CaptureRegionLocked(int x, int y, int width, int height);

  std::unique_ptr<CaptureBackend> backend_;
  bool initialized_ = false;

  // Clipboard writer (lazy-initialized).
  std::unique_ptr<ClipboardWriter> clipboard_writer_;

  std::mutex mu_;

  PortaShotError last_error_ = kPortaShotOk;
  std::string last_error_message_ = "No error";
};

}  // namespace internal
}  // namespace portashot

#endif  // PORTASHOT_CORE_PORTASHOT_CONTEXT_H_
