// Copyright 2026 The PortaShot Authors
//
// SelectionSession: toolkit-independent state machine behind the region
// selection overlay.
//
//   Idle -> Armed -> Dragging -> Committed
//             \          \----> Cancelled
//              \--------------> Cancelled
//
// The overlay forwards pointer and key events; events that do not apply to
// the current state are ignored.

#ifndef PORTASHOT_APP_CORE_SELECTION_SESSION_H_
#define PORTASHOT_APP_CORE_SELECTION_SESSION_H_

#include <string>

#include "core/capture_types.h"

enum class SelectionState {
  kIdle,
  kArmed,
  kDragging,
  kCommitted,
  kCancelled,
};

/// Result of one interactive selection.
struct SelectionOutcome {
  SelectionState state = SelectionState::kCancelled;
  SelectionRect rect;  // valid when state == kCommitted
};

class SelectionSession {
 public:
  SelectionSession() = default;

  void Arm();
  void Press(int x, int y);
  void Move(int x, int y);
  void Release(int x, int y);
  void Escape();

  SelectionState state() const { return state_; }
  bool IsFinished() const {
    return state_ == SelectionState::kCommitted ||
           state_ == SelectionState::kCancelled;
  }

  /// Normalized rectangle between the press point and the current point.
  SelectionRect rect() const;

  /// Live size label, e.g. "640 x 480".  Empty unless dragging or committed.
  const std::string& label() const { return label_; }

  int cursor_x() const { return cur_x_; }
  int cursor_y() const { return cur_y_; }

  SelectionOutcome outcome() const;

 private:
  void UpdateLabel();

  SelectionState state_ = SelectionState::kIdle;
  int start_x_ = 0;
  int start_y_ = 0;
  int cur_x_ = 0;
  int cur_y_ = 0;
  std::string label_;
};

#endif  // PORTASHOT_APP_CORE_SELECTION_SESSION_H_
