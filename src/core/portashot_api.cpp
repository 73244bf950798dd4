// Copyright 2026 The PortaShot Authors
//
// This file implements all public C API functions declared in portashot.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "portashot/portashot.h"

#include <cstring>
#include <memory>
#include <new>
#include <utility>
#include <vector>

#include "core/callback_sink.h"
#include "core/image.h"
#include "core/image_export.h"
#include "core/logger.h"
#include "core/portashot_context.h"

using portashot::internal::Image;
using portashot::internal::PortaShotContextImpl;

// ---------------------------------------------------------------------------
// The opaque PortaShotContext struct wraps the C++ implementation.
// ---------------------------------------------------------------------------
struct PortaShotContext {
  PortaShotContextImpl impl;
};

// ---------------------------------------------------------------------------
// The opaque PortaShotImage struct wraps the C++ Image object.
// ---------------------------------------------------------------------------
struct PortaShotImage {
  std::unique_ptr<Image> impl;

  explicit PortaShotImage(Image* raw) : impl(raw) {}
};

// Wrap a raw Image* into a heap-allocated PortaShotImage*.
static PortaShotImage* WrapImage(Image* raw) {
  if (!raw) return nullptr;
  auto* wrapped = new (std::nothrow) PortaShotImage(raw);
  if (!wrapped) delete raw;
  return wrapped;
}

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

PortaShotContext* portashot_context_create(void) {
  auto* ctx = new (std::nothrow) PortaShotContext();
  if (!ctx) return nullptr;

  if (!ctx->impl.Initialize()) {
    delete ctx;
    return nullptr;
  }
  return ctx;
}

void portashot_context_destroy(PortaShotContext* ctx) {
  delete ctx;
}

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

PortaShotError portashot_get_last_error(const PortaShotContext* ctx) {
  if (!ctx) return kPortaShotErrorInvalidParam;
  return ctx->impl.last_error();
}

const char* portashot_get_last_error_message(const PortaShotContext* ctx) {
  if (!ctx) return "Invalid context (NULL)";
  return ctx->impl.last_error_message();
}

// ---------------------------------------------------------------------------
// Screen information
// ---------------------------------------------------------------------------

PortaShotError portashot_get_virtual_screen(PortaShotContext* ctx,
                                            PortaShotRect* out_rect) {
  if (!ctx) return kPortaShotErrorInvalidParam;
  return ctx->impl.GetVirtualScreen(out_rect);
}

PortaShotError portashot_get_active_window_rect(PortaShotContext* ctx,
                                                PortaShotRect* out_rect) {
  if (!ctx) return kPortaShotErrorInvalidParam;
  return ctx->impl.GetActiveWindowRect(out_rect);
}

// ---------------------------------------------------------------------------
// Capture operations
// ---------------------------------------------------------------------------

PortaShotImage* portashot_capture_virtual_screen(PortaShotContext* ctx) {
  if (!ctx) return nullptr;
  return WrapImage(ctx->impl.CaptureVirtualScreen());
}

PortaShotImage* portashot_capture_region(PortaShotContext* ctx, int x, int y,
                                         int width, int height) {
  if (!ctx) return nullptr;
  return WrapImage(ctx->impl.CaptureRegion(x, y, width, height));
}

// ---------------------------------------------------------------------------
// Image objects
// ---------------------------------------------------------------------------

PortaShotImage* portashot_image_create(int width, int height, int stride,
                                       PortaShotPixelFormat format,
                                       const uint8_t* data) {
  if (!data || width <= 0 || height <= 0 || stride < width * 4) return nullptr;
  if (format != kPortaShotFormatBgra8 && format != kPortaShotFormatRgba8)
    return nullptr;
  size_t size = static_cast<size_t>(stride) * static_cast<size_t>(height);
  std::vector<uint8_t> copy(data, data + size);
  auto img = Image::CreateFromData(width, height, stride, format,
                                   std::move(copy));
  return WrapImage(img.release());
}

int portashot_image_get_width(const PortaShotImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->width();
}

int portashot_image_get_height(const PortaShotImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->height();
}

int portashot_image_get_stride(const PortaShotImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->stride();
}

PortaShotPixelFormat portashot_image_get_format(const PortaShotImage* image) {
  if (!image || !image->impl) return kPortaShotFormatBgra8;
  return image->impl->format();
}

const uint8_t* portashot_image_get_data(const PortaShotImage* image) {
  if (!image || !image->impl) return nullptr;
  return image->impl->data();
}

size_t portashot_image_get_data_size(const PortaShotImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->data_size();
}

void portashot_image_destroy(PortaShotImage* image) {
  delete image;
}

PortaShotError portashot_image_export(const PortaShotImage* image,
                                      const char* path,
                                      PortaShotImageFormat format,
                                      int quality) {
  if (!image || !image->impl || !path) return kPortaShotErrorInvalidParam;
  return portashot::internal::ExportImage(*image->impl, path, format, quality);
}

// ---------------------------------------------------------------------------
// Clipboard
// ---------------------------------------------------------------------------

PortaShotError portashot_clipboard_set_image(PortaShotContext* ctx,
                                             const PortaShotImage* image) {
  if (!ctx) return kPortaShotErrorInvalidParam;
  if (!image || !image->impl) {
    ctx->impl.SetError(kPortaShotErrorInvalidParam, "image is NULL");
    return kPortaShotErrorInvalidParam;
  }
  return ctx->impl.SetClipboardImage(*image->impl);
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

const char* portashot_version_string(void) {
  return PORTASHOT_VERSION_STRING;
}

int portashot_version_major(void) { return PORTASHOT_VERSION_MAJOR; }
int portashot_version_minor(void) { return PORTASHOT_VERSION_MINOR; }
int portashot_version_patch(void) { return PORTASHOT_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void portashot_set_log_level(PortaShotLogLevel level) {
  portashot::internal::SetLogLevel(level);
}

void portashot_set_log_verbose(int verbose) {
  portashot::internal::SetVerbose(verbose != 0);
}

void portashot_set_log_callback(portashot_log_callback_t callback,
                                void* userdata) {
  auto sink = portashot::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void portashot_log(PortaShotLogLevel level, const char* message) {
  if (!message) return;
  auto logger = portashot::internal::GetLogger();
  if (logger) {
    logger->log(portashot::internal::ToSpdlogLevel(level), "{}", message);
  }
}
