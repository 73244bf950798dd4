// Copyright 2026 The PortaShot Authors

#include "core/context_sources.h"

#include "core/app_log.h"

namespace {

SelectionRect FromPortaShotRect(const PortaShotRect& r) {
  SelectionRect out;
  out.x = r.x;
  out.y = r.y;
  out.width = r.width;
  out.height = r.height;
  return out;
}

}  // namespace

bool ContextScreenSource::GetVirtualScreen(SelectionRect* out_rect) {
  try {
    *out_rect = FromPortaShotRect(ctx_.virtual_screen());
    return true;
  } catch (const portashot::Error& e) {
    APP_LOG_ERROR("Virtual screen query failed: {}", e.what());
    return false;
  }
}

bool ContextScreenSource::GetActiveWindowRect(SelectionRect* out_rect) {
  try {
    *out_rect = FromPortaShotRect(ctx_.active_window_rect());
    return true;
  } catch (const portashot::Error& e) {
    APP_LOG_DEBUG("Active window lookup failed: {}", e.what());
    return false;
  }
}

portashot::Image ContextScreenSource::GrabRegion(const SelectionRect& rect) {
  try {
    return ctx_.CaptureRegion(rect.x, rect.y, rect.width, rect.height);
  } catch (const portashot::Error& e) {
    APP_LOG_ERROR("Grab {}x{}+{}+{} failed: {}", rect.width, rect.height,
                  rect.x, rect.y, e.what());
    return portashot::Image();
  }
}

bool ContextClipboard::SetImage(const portashot::Image& image) {
  try {
    ctx_.SetClipboardImage(image);
    return true;
  } catch (const portashot::Error& e) {
    APP_LOG_ERROR("Clipboard write failed: {}", e.what());
    return false;
  }
}
