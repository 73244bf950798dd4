// Copyright 2026 The PortaShot Authors

#include "core/selection_session.h"

void SelectionSession::Arm() {
  if (state_ != SelectionState::kIdle) return;
  state_ = SelectionState::kArmed;
  label_.clear();
}

void SelectionSession::Press(int x, int y) {
  if (state_ != SelectionState::kArmed) return;
  state_ = SelectionState::kDragging;
  start_x_ = cur_x_ = x;
  start_y_ = cur_y_ = y;
  UpdateLabel();
}

void SelectionSession::Move(int x, int y) {
  if (state_ == SelectionState::kArmed) {
    // Track the cursor for the crosshair before the drag starts.
    cur_x_ = x;
    cur_y_ = y;
    return;
  }
  if (state_ != SelectionState::kDragging) return;
  cur_x_ = x;
  cur_y_ = y;
  UpdateLabel();
}

void SelectionSession::Release(int x, int y) {
  if (state_ != SelectionState::kDragging) return;
  cur_x_ = x;
  cur_y_ = y;
  UpdateLabel();
  state_ = SelectionState::kCommitted;
}

void SelectionSession::Escape() {
  if (state_ != SelectionState::kArmed && state_ != SelectionState::kDragging)
    return;
  state_ = SelectionState::kCancelled;
  label_.clear();
}

SelectionRect SelectionSession::rect() const {
  return SelectionRect::FromPoints(start_x_, start_y_, cur_x_, cur_y_);
}

SelectionOutcome SelectionSession::outcome() const {
  SelectionOutcome out;
  out.state = state_;
  if (state_ == SelectionState::kCommitted) out.rect = rect();
  return out;
}

void SelectionSession::UpdateLabel() {
  SelectionRect r = rect();
  label_ = std::to_string(r.width) + " x " + std::to_string(r.height);
}
