// Copyright 2026 The PortaShot Authors

#ifndef PORTASHOT_CORE_CAPTURE_BACKEND_H_
#define PORTASHOT_CORE_CAPTURE_BACKEND_H_

#include <memory>

#include "core/image.h"
#include "portashot/portashot.h"

namespace portashot {
namespace internal {

/// Abstract interface for platform-specific screen capture backends.
///
/// Each platform provides a concrete implementation. Only the implementation
/// for the current build platform is compiled.
class CaptureBackend {
 public:
  virtual ~CaptureBackend() = default;

  // Non-copyable.
  CaptureBackend(const CaptureBackend&) = delete;
  CaptureBackend& operator=(const CaptureBackend&) = delete;

  /// Initialize the capture backend. Must be called before any capture
  /// operations.
  /// @return true on success.
  virtual bool Initialize() = 0;

  /// Shut down and release platform resources.
  virtual void Shutdown() = 0;

  // -- Screen information --

  /// Bounding rectangle of all screens.
  virtual PortaShotRect GetVirtualScreen() = 0;

  /// Frame rectangle of the focused top-level window, resolved now.
  /// @return false if there is no focused window or it vanished.
  virtual bool GetActiveWindowRect(PortaShotRect* out_rect) = 0;

  // -- Capture operations --

  /// Capture a rectangular region in virtual screen coordinates. The region
  /// is clipped to the virtual screen; an empty intersection yields nullptr.
  virtual std::unique_ptr<Image> CaptureRegion(int x, int y, int width,
                                               int height) = 0;

 protected:
  CaptureBackend() = default;
};

/// Factory function implemented per-platform (one per build target).
/// Defined in platform/<os>/xxx_capture_backend.cpp.
std::unique_ptr<CaptureBackend> CreatePlatformBackend();

}  // namespace internal
}  // namespace portashot

#endif  // PORTASHOT_CORE_CAPTURE_BACKEND_H_
