// Copyright 2026 The PortaShot Authors

#ifndef PORTASHOT_PLATFORM_LINUX_X11_CAPTURE_BACKEND_H_
#define PORTASHOT_PLATFORM_LINUX_X11_CAPTURE_BACKEND_H_

#include <memory>

#include "core/capture_backend.h"
#include "core/image.h"

namespace portashot {
namespace internal {

/// Linux capture backend using X11 (XGetImage on the root window).
///
/// The X11 root window spans every monitor, so it is the virtual screen.
class X11CaptureBackend : public CaptureBackend {
 public:
  X11CaptureBackend();
  ~X11CaptureBackend() override;

  bool Initialize() override;
  void Shutdown() override;

  PortaShotRect GetVirtualScreen() override;
  bool GetActiveWindowRect(PortaShotRect* out_rect) override;
  std::unique_ptr<Image> CaptureRegion(int x, int y, int width,
                                       int height) override;

 private:
  bool initialized_ = false;
  void* display_ = nullptr;  // Display* from X11
};

}  // namespace internal
}  // namespace portashot

#endif  // PORTASHOT_PLATFORM_LINUX_X11_CAPTURE_BACKEND_H_
