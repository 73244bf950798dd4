// Copyright 2026 The PortaShot Authors

#include "core/capture_types.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

const char* CaptureModeName(CaptureMode mode) {
  switch (mode) {
    case CaptureMode::kRegion:       return "region";
    case CaptureMode::kFullscreen:   return "fullscreen";
    case CaptureMode::kActiveWindow: return "window";
  }
  return "unknown";
}

bool ParseCaptureMode(const std::string& text, CaptureMode* out_mode) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "region") {
    *out_mode = CaptureMode::kRegion;
  } else if (lower == "fullscreen" || lower == "full") {
    *out_mode = CaptureMode::kFullscreen;
  } else if (lower == "window") {
    *out_mode = CaptureMode::kActiveWindow;
  } else {
    return false;
  }
  return true;
}

SelectionRect SelectionRect::FromPoints(int x0, int y0, int x1, int y1) {
  SelectionRect r;
  r.x = std::min(x0, x1);
  r.y = std::min(y0, y1);
  r.width = std::abs(x1 - x0);
  r.height = std::abs(y1 - y0);
  return r;
}

SelectionRect SelectionRect::Intersect(const SelectionRect& other) const {
  int left = std::max(x, other.x);
  int top = std::max(y, other.y);
  int right = std::min(x + width, other.x + other.width);
  int bottom = std::min(y + height, other.y + other.height);
  SelectionRect r;
  r.x = left;
  r.y = top;
  r.width = std::max(0, right - left);
  r.height = std::max(0, bottom - top);
  return r;
}

const char* ErrorKindName(CaptureError error) {
  switch (error) {
    case CaptureError::kNone:             return "None";
    case CaptureError::kCancelled:        return "Cancelled";
    case CaptureError::kInvalidSelection: return "InvalidSelection";
    case CaptureError::kNoActiveWindow:   return "NoActiveWindow";
    case CaptureError::kCaptureFailed:    return "CaptureFailed";
    case CaptureError::kBusy:             return "Busy";
    case CaptureError::kDiskWriteError:   return "DiskWriteError";
    case CaptureError::kClipboardError:   return "ClipboardError";
  }
  return "Unknown";
}

std::string StoreReport::FailureSummary() const {
  std::string out;
  if (disk_error) out += ErrorKindName(CaptureError::kDiskWriteError);
  if (clipboard_error) {
    if (!out.empty()) out += ", ";
    out += ErrorKindName(CaptureError::kClipboardError);
  }
  return out;
}
