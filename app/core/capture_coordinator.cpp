// Copyright 2026 The PortaShot Authors

#include "core/capture_coordinator.h"

#include <utility>

#include "core/app_log.h"

CaptureCoordinator::CaptureCoordinator(IScreenSource* screen,
                                       IRegionSelector* selector,
                                       ICaptureSink* sink)
    : screen_(screen),
      selector_(selector),
      sink_(sink),
      clock_([] { return CaptureClock::now(); }) {}

CaptureOutcome CaptureCoordinator::Capture(CaptureMode mode,
                                           const Config& config) {
  CaptureOutcome outcome;
  if (in_progress_) {
    APP_LOG_DEBUG("Capture ({}) ignored: another capture is active",
                  CaptureModeName(mode));
    outcome.error = CaptureError::kBusy;
    return outcome;
  }
  InProgressGuard guard(in_progress_);

  SelectionRect rect;
  outcome.error = ResolveRect(mode, &rect);
  if (outcome.error != CaptureError::kNone) {
    if (outcome.error == CaptureError::kCancelled) {
      APP_LOG_INFO("Capture cancelled");
    } else {
      APP_LOG_WARN("Capture ({}) failed: {}", CaptureModeName(mode),
                   ErrorKindName(outcome.error));
    }
    return outcome;
  }

  CaptureResult result;
  result.image = screen_->GrabRegion(rect);
  result.mode = mode;
  result.timestamp = clock_();
  if (!result.image) {
    outcome.error = CaptureError::kCaptureFailed;
    APP_LOG_WARN("Capture ({}) failed: {}", CaptureModeName(mode),
                 ErrorKindName(outcome.error));
    return outcome;
  }
  APP_LOG_DEBUG("Captured {}x{} ({})", result.image.width(),
                result.image.height(), CaptureModeName(mode));

  outcome.report = sink_->Store(std::move(result), config);
  return outcome;
}

CaptureError CaptureCoordinator::ResolveRect(CaptureMode mode,
                                             SelectionRect* out_rect) {
  SelectionRect screen;
  if (!screen_->GetVirtualScreen(&screen) || screen.IsDegenerate())
    return CaptureError::kCaptureFailed;

  switch (mode) {
    case CaptureMode::kFullscreen:
      *out_rect = screen;
      return CaptureError::kNone;

    case CaptureMode::kRegion: {
      if (!selector_) return CaptureError::kCaptureFailed;
      SelectionOutcome selection = selector_->SelectRegion();
      if (selection.state != SelectionState::kCommitted)
        return CaptureError::kCancelled;
      if (selection.rect.IsDegenerate()) return CaptureError::kInvalidSelection;
      SelectionRect clipped = selection.rect.Intersect(screen);
      if (clipped.IsDegenerate()) return CaptureError::kInvalidSelection;
      *out_rect = clipped;
      return CaptureError::kNone;
    }

    case CaptureMode::kActiveWindow: {
      SelectionRect window;
      if (!screen_->GetActiveWindowRect(&window))
        return CaptureError::kNoActiveWindow;
      SelectionRect clipped = window.Intersect(screen);
      if (clipped.IsDegenerate()) return CaptureError::kNoActiveWindow;
      *out_rect = clipped;
      return CaptureError::kNone;
    }
  }
  return CaptureError::kCaptureFailed;
}
