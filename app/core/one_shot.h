// Copyright 2026 The PortaShot Authors
//
// One-shot mode: a single capture without the tray, then exit.

#ifndef PORTASHOT_APP_CORE_ONE_SHOT_H_
#define PORTASHOT_APP_CORE_ONE_SHOT_H_

#include <ostream>

#include "core/capture_coordinator.h"

static constexpr int kExitOk = 0;
static constexpr int kExitCaptureError = 1;
static constexpr int kExitStartupError = 3;

/// Runs one capture.  Prints the saved path to `out`; on failure prints each
/// error kind name on its own line to `err`.  Returns the process exit code.
int RunOneShot(CaptureCoordinator* coordinator, const Config& config,
               CaptureMode mode, std::ostream& out, std::ostream& err);

#endif  // PORTASHOT_APP_CORE_ONE_SHOT_H_
