// Copyright 2026 The PortaShot Authors

#include "core/portashot_context.h"

#include <utility>

#include "core/logger.h"

namespace portashot {
namespace internal {

PortaShotContextImpl::PortaShotContextImpl() = default;

PortaShotContextImpl::~PortaShotContextImpl() {
  if (backend_) {
    backend_->Shutdown();
  }
}

bool PortaShotContextImpl::Initialize() {
  std::lock_guard<std::mutex> lock(mu_);
  if (initialized_) {
    return true;
  }

  PORTASHOT_LOG_INFO("Initializing portashot context...");

  backend_ = CreatePlatformBackend();
  if (!backend_) {
    SetError(kPortaShotErrorNotSupported,
             "Failed to create platform capture backend");
    return false;
  }

  if (!backend_->Initialize()) {
    SetError(kPortaShotErrorCaptureFailed,
             "Failed to initialize platform capture backend");
    backend_.reset();
    return false;
  }

  initialized_ = true;
  PORTASHOT_LOG_INFO("portashot context initialized successfully");
  ClearError();
  return true;
}

void PortaShotContextImpl::SetError(PortaShotError code,
                                    const std::string& message) {
  last_error_ = code;
  last_error_message_ = message;
  PORTASHOT_LOG_ERROR("Error {}: {}", static_cast<int>(code), message);
}

void PortaShotContextImpl::ClearError() {
  last_error_ = kPortaShotOk;
  last_error_message_ = "No error";
}

PortaShotError PortaShotContextImpl::GetVirtualScreen(PortaShotRect* out_rect) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) {
    SetError(kPortaShotErrorNotInitialized, "Context not initialized");
    return kPortaShotErrorNotInitialized;
  }
  if (!out_rect) {
    SetError(kPortaShotErrorInvalidParam, "out_rect is NULL");
    return kPortaShotErrorInvalidParam;
  }
  *out_rect = backend_->GetVirtualScreen();
  ClearError();
  return kPortaShotOk;
}

PortaShotError PortaShotContextImpl::GetActiveWindowRect(
    PortaShotRect* out_rect) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) {
    SetError(kPortaShotErrorNotInitialized, "Context not initialized");
    return kPortaShotErrorNotInitialized;
  }
  if (!out_rect) {
    SetError(kPortaShotErrorInvalidParam, "out_rect is NULL");
    return kPortaShotErrorInvalidParam;
  }
  if (!backend_->GetActiveWindowRect(out_rect)) {
    SetError(kPortaShotErrorNoActiveWindow,
             "No active window could be resolved");
    return kPortaShotErrorNoActiveWindow;
  }
  ClearError();
  return kPortaShotOk;
}

Image* PortaShotContextImpl::CaptureVirtualScreen() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) {
    SetError(kPortaShotErrorNotInitialized, "Context not initialized");
    return nullptr;
  }
  PortaShotRect vs = backend_->GetVirtualScreen();
  return CaptureRegionLocked(vs.x, vs.y, vs.width, vs.height);
}

Image* PortaShotContextImpl::CaptureRegion(int x, int y, int width,
                                           int height) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) {
    SetError(kPortaShotErrorNotInitialized, "Context not initialized");
    return nullptr;
  }
  if (width <= 0 || height <= 0) {
    SetError(kPortaShotErrorInvalidParam, "Region width and height must be > 0");
    return nullptr;
  }
  return CaptureRegionLocked(x, y, width, height);
}

Image* PortaShotContextImpl::CaptureRegionLocked(int x, int y, int width,
                                                 int height) {
  auto img = backend_->CaptureRegion(x, y, width, height);
  if (!img) {
    SetError(kPortaShotErrorCaptureFailed, "Region capture failed");
    return nullptr;
  }
  PORTASHOT_LOG_DEBUG("Captured region {},{} {}x{}", x, y, img->width(),
                      img->height());
  ClearError();
  return img.release();
}

PortaShotError PortaShotContextImpl::SetClipboardImage(const Image& image) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!clipboard_writer_) {
    clipboard_writer_ = CreatePlatformClipboardWriter();
  }
  if (!clipboard_writer_ || !clipboard_writer_->WriteImage(image)) {
    SetError(kPortaShotErrorClipboardFailed,
             "Failed to place image on the clipboard");
    return kPortaShotErrorClipboardFailed;
  }
  ClearError();
  return kPortaShotOk;
}

}  // namespace internal
}  // namespace portashot
