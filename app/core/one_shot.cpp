// Copyright 2026 The PortaShot Authors

#include "core/one_shot.h"

int RunOneShot(CaptureCoordinator* coordinator, const Config& config,
               CaptureMode mode, std::ostream& out, std::ostream& err) {
  CaptureOutcome outcome = coordinator->Capture(mode, config);
  if (outcome.error != CaptureError::kNone) {
    err << ErrorKindName(outcome.error) << "\n";
    return kExitCaptureError;
  }

  const StoreReport& report = outcome.report;
  if (!report.saved_path.empty()) out << "Saved: " << report.saved_path << "\n";
  if (report.disk_error)
    err << ErrorKindName(CaptureError::kDiskWriteError) << "\n";
  if (report.clipboard_error)
    err << ErrorKindName(CaptureError::kClipboardError) << "\n";
  return report.ok() ? kExitOk : kExitCaptureError;
}
