// Copyright 2026 The PortaShot Authors
//
// CaptureCoordinator: turns a capture trigger (hotkey, tray, CLI) into a
// stored screenshot.
//
// Only one capture runs at a time.  A trigger that arrives while a capture
// (or its selection overlay) is active returns CaptureError::kBusy without
// side effects.

#ifndef PORTASHOT_APP_CORE_CAPTURE_COORDINATOR_H_
#define PORTASHOT_APP_CORE_CAPTURE_COORDINATOR_H_

#include <functional>
#include <utility>

#include "core/capture_sink.h"
#include "core/capture_sources.h"
#include "core/capture_types.h"
#include "core/config_store.h"

class CaptureCoordinator {
 public:
  using Clock = std::function<CaptureClock::time_point()>;

  /// All collaborators must outlive the coordinator.  `selector` may be null
  /// when region capture is not available (region then fails with
  /// kCaptureFailed).
  CaptureCoordinator(IScreenSource* screen, IRegionSelector* selector,
                     ICaptureSink* sink);

  CaptureOutcome Capture(CaptureMode mode, const Config& config);

  bool in_progress() const { return in_progress_; }

  /// Override the timestamp source.
  void set_clock(Clock clock) { clock_ = std::move(clock); }

 private:
  // Clears in_progress_ on every exit path.
  class InProgressGuard {
   public:
    explicit InProgressGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~InProgressGuard() { flag_ = false; }

   private:
    bool& flag_;
  };

  CaptureError ResolveRect(CaptureMode mode, SelectionRect* out_rect);

  IScreenSource* screen_;
  IRegionSelector* selector_;
  ICaptureSink* sink_;
  Clock clock_;
  bool in_progress_ = false;
};

#endif  // PORTASHOT_APP_CORE_CAPTURE_COORDINATOR_H_
