// Copyright 2026 The PortaShot Authors
//
// Value types shared by the capture coordinator, the selection session and
// the persistence sink.

#ifndef PORTASHOT_APP_CORE_CAPTURE_TYPES_H_
#define PORTASHOT_APP_CORE_CAPTURE_TYPES_H_

#include <chrono>
#include <string>

#include "portashot/portashot.hpp"

enum class CaptureMode {
  kRegion,
  kFullscreen,
  kActiveWindow,
};

/// Printable mode name ("region", "fullscreen", "window").
const char* CaptureModeName(CaptureMode mode);

/// Parse a mode name as accepted on the command line.  Case-insensitive.
bool ParseCaptureMode(const std::string& text, CaptureMode* out_mode);

/// Axis-aligned rectangle in virtual-screen coordinates.
struct SelectionRect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  /// Build a normalized rectangle (origin top-left) from two drag points.
  static SelectionRect FromPoints(int x0, int y0, int x1, int y1);

  bool IsDegenerate() const { return width < 1 || height < 1; }

  /// Intersection with `other`; width/height are 0 when disjoint.
  SelectionRect Intersect(const SelectionRect& other) const;

  bool operator==(const SelectionRect& o) const {
    return x == o.x && y == o.y && width == o.width && height == o.height;
  }
  bool operator!=(const SelectionRect& o) const { return !(*this == o); }
};

using CaptureClock = std::chrono::system_clock;

/// A captured raster plus where it came from.  Move-only.
struct CaptureResult {
  portashot::Image image;
  CaptureMode mode = CaptureMode::kFullscreen;
  CaptureClock::time_point timestamp;
};

/// Error kinds reported by the coordinator and the sink.
enum class CaptureError {
  kNone,
  kCancelled,
  kInvalidSelection,
  kNoActiveWindow,
  kCaptureFailed,
  kBusy,
  kDiskWriteError,
  kClipboardError,
};

/// Stable printable name, e.g. "DiskWriteError".
const char* ErrorKindName(CaptureError error);

/// Per-step outcome of storing one capture.  Both steps always run.
struct StoreReport {
  std::string saved_path;  // empty when the disk step failed
  bool disk_error = false;
  bool clipboard_error = false;
  int width = 0;
  int height = 0;

  bool ok() const { return !disk_error && !clipboard_error; }

  /// Failed step names joined by ", " (empty when ok()).
  std::string FailureSummary() const;
};

/// What a single Capture() call produced.
struct CaptureOutcome {
  CaptureError error = CaptureError::kNone;
  StoreReport report;  // meaningful only when error == kNone

  bool ok() const { return error == CaptureError::kNone && report.ok(); }
};

#endif  // PORTASHOT_APP_CORE_CAPTURE_TYPES_H_
