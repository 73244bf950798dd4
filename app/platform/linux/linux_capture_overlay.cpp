// Copyright 2026 The PortaShot Authors
// Full-virtual-screen region selection overlay (GTK3 + Cairo).

#include "platform/linux/linux_capture_overlay.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <string>

#include "core/app_defs.h"
#include "core/app_log.h"

// Selection border colour (0, 174, 255).
static constexpr double kBorderR = 0.0;
static constexpr double kBorderG = 174.0 / 255.0;
static constexpr double kBorderB = 1.0;

CaptureOverlay::~CaptureOverlay() {
  Teardown();
}

// -----------------------------------------------------------------------
// SelectRegion
// -----------------------------------------------------------------------

SelectionOutcome CaptureOverlay::SelectRegion() {
  SelectionOutcome cancelled;
  if (loop_) return cancelled;  // already running

  if (!screen_->GetVirtualScreen(&bounds_) || bounds_.IsDegenerate()) {
    APP_LOG_ERROR("Overlay: virtual screen unavailable");
    return cancelled;
  }

  // Freeze the desktop.  BGRA on little-endian is Cairo's ARGB32 layout.
  background_ = screen_->GrabRegion(bounds_);
  if (background_) {
    bg_surface_ = cairo_image_surface_create_for_data(
        const_cast<uint8_t*>(background_.data()), CAIRO_FORMAT_ARGB32,
        background_.width(), background_.height(), background_.stride());
  } else {
    APP_LOG_WARN("Overlay: background grab failed, showing plain dim");
  }

  if (!CreateWindow()) {
    Teardown();
    return cancelled;
  }

  session_ = SelectionSession();
  session_.Arm();
  APP_LOG_DEBUG("Overlay active over {}x{}+{}+{}", bounds_.width,
                bounds_.height, bounds_.x, bounds_.y);

  loop_ = g_main_loop_new(nullptr, FALSE);
  g_main_loop_run(loop_);

  SelectionOutcome outcome = session_.outcome();
  if (outcome.state == SelectionState::kCommitted) {
    // Window coordinates -> virtual-screen coordinates.
    outcome.rect.x += bounds_.x;
    outcome.rect.y += bounds_.y;
  }
  Teardown();
  return outcome;
}

bool CaptureOverlay::CreateWindow() {
  window_ = gtk_window_new(GTK_WINDOW_TOPLEVEL);
  if (!window_) return false;

  gtk_window_set_decorated(GTK_WINDOW(window_), FALSE);
  gtk_window_set_skip_taskbar_hint(GTK_WINDOW(window_), TRUE);
  gtk_window_set_skip_pager_hint(GTK_WINDOW(window_), TRUE);
  gtk_window_set_keep_above(GTK_WINDOW(window_), TRUE);
  gtk_window_move(GTK_WINDOW(window_), bounds_.x, bounds_.y);
  gtk_window_set_default_size(GTK_WINDOW(window_), bounds_.width,
                              bounds_.height);
  gtk_widget_set_app_paintable(window_, TRUE);

  gtk_widget_add_events(window_,
                        GDK_KEY_PRESS_MASK | GDK_BUTTON_PRESS_MASK |
                        GDK_BUTTON_RELEASE_MASK | GDK_POINTER_MOTION_MASK);

  g_signal_connect(window_, "draw", G_CALLBACK(OnDraw), this);
  g_signal_connect(window_, "key-press-event", G_CALLBACK(OnKeyPress), this);
  g_signal_connect(window_, "button-press-event",
                   G_CALLBACK(OnButtonPress), this);
  g_signal_connect(window_, "button-release-event",
                   G_CALLBACK(OnButtonRelease), this);
  g_signal_connect(window_, "motion-notify-event",
                   G_CALLBACK(OnMotion), this);
  g_signal_connect(window_, "delete-event", G_CALLBACK(OnDelete), this);
  g_signal_connect(window_, "map", G_CALLBACK(OnMapped), this);

  gtk_widget_show_all(window_);
  gtk_window_present(GTK_WINDOW(window_));

  // Crosshair cursor.
  GdkWindow* gdk_win = gtk_widget_get_window(window_);
  if (gdk_win) {
    GdkCursor* cross = gdk_cursor_new_from_name(
        gdk_window_get_display(gdk_win), "crosshair");
    if (cross) {
      gdk_window_set_cursor(gdk_win, cross);
      g_object_unref(cross);
    }
  }
  return true;
}

void CaptureOverlay::OnMapped(GtkWidget* /*widget*/, gpointer data) {
  static_cast<CaptureOverlay*>(data)->GrabInput();
}

void CaptureOverlay::GrabInput() {
  GdkWindow* gdk_win = gtk_widget_get_window(window_);
  if (!gdk_win) return;
  GdkSeat* seat = gdk_display_get_default_seat(gdk_window_get_display(gdk_win));
  if (!seat) return;
  GdkGrabStatus status = gdk_seat_grab(seat, gdk_win, GDK_SEAT_CAPABILITY_ALL,
                                       TRUE, nullptr, nullptr, nullptr,
                                       nullptr);
  if (status == GDK_GRAB_SUCCESS) {
    grabbed_seat_ = seat;
  } else {
    APP_LOG_WARN("Overlay: input grab failed ({})", static_cast<int>(status));
  }
}

void CaptureOverlay::FinishIfDone() {
  if (session_.IsFinished() && loop_ && g_main_loop_is_running(loop_))
    g_main_loop_quit(loop_);
}

// Destroys the window and waits until the X server has processed the unmap,
// so the overlay cannot show up in the grab that follows.
void CaptureOverlay::Teardown() {
  bool had_window = window_ != nullptr;
  if (grabbed_seat_) {
    gdk_seat_ungrab(grabbed_seat_);
    grabbed_seat_ = nullptr;
  }
  if (window_) {
    gtk_widget_destroy(window_);
    window_ = nullptr;
  }
  if (bg_surface_) {
    cairo_surface_destroy(bg_surface_);
    bg_surface_ = nullptr;
  }
  background_ = portashot::Image();
  if (loop_) {
    g_main_loop_unref(loop_);
    loop_ = nullptr;
  }

  if (had_window) {
    while (gtk_events_pending()) gtk_main_iteration_do(FALSE);
    GdkDisplay* display = gdk_display_get_default();
    if (display) {
      gdk_display_flush(display);
      gdk_display_sync(display);
    }
    g_usleep(kOverlaySettleMs * 1000);
  }
}

// -----------------------------------------------------------------------
// Drawing
// -----------------------------------------------------------------------

gboolean CaptureOverlay::OnDraw(GtkWidget* /*widget*/, cairo_t* cr,
                                gpointer data) {
  static_cast<CaptureOverlay*>(data)->DrawOverlay(cr);
  return FALSE;
}

void CaptureOverlay::DrawOverlay(cairo_t* cr) {
  if (bg_surface_) {
    cairo_set_source_surface(cr, bg_surface_, 0, 0);
    cairo_paint(cr);
  } else {
    cairo_set_source_rgb(cr, 0, 0, 0);
    cairo_paint(cr);
  }

  // Dim everything except the selection.
  cairo_set_source_rgba(cr, 0, 0, 0, kOverlayDimAlpha);
  cairo_rectangle(cr, 0, 0, bounds_.width, bounds_.height);

  bool dragging = session_.state() == SelectionState::kDragging;
  SelectionRect sel = session_.rect();
  if (dragging && !sel.IsDegenerate()) {
    cairo_rectangle(cr, sel.x, sel.y, sel.width, sel.height);
    cairo_set_fill_rule(cr, CAIRO_FILL_RULE_EVEN_ODD);
    cairo_fill(cr);
    cairo_set_fill_rule(cr, CAIRO_FILL_RULE_WINDING);

    cairo_set_source_rgb(cr, kBorderR, kBorderG, kBorderB);
    cairo_set_line_width(cr, 2.0);
    cairo_rectangle(cr, sel.x + 0.5, sel.y + 0.5, sel.width - 1,
                    sel.height - 1);
    cairo_stroke(cr);
  } else {
    cairo_fill(cr);
  }

  if (dragging) DrawSizeLabel(cr);
}

void CaptureOverlay::DrawSizeLabel(cairo_t* cr) {
  const std::string& label = session_.label();
  if (label.empty()) return;

  cairo_select_font_face(cr, "Sans", CAIRO_FONT_SLANT_NORMAL,
                         CAIRO_FONT_WEIGHT_BOLD);
  cairo_set_font_size(cr, kSizeLabelFontSize);

  std::string text = " " + label + " ";
  cairo_text_extents_t ext;
  cairo_text_extents(cr, text.c_str(), &ext);

  double lx = session_.cursor_x() + kSizeLabelOffset;
  double ly = session_.cursor_y() + kSizeLabelOffset;
  double pad = 3.0;
  if (lx + ext.x_advance + pad > bounds_.width)
    lx = session_.cursor_x() - kSizeLabelOffset - ext.x_advance;
  if (ly + ext.height + pad * 2 > bounds_.height)
    ly = session_.cursor_y() - kSizeLabelOffset - ext.height - pad * 2;

  cairo_set_source_rgba(cr, 0, 0, 0, 0.7);
  cairo_rectangle(cr, lx, ly, ext.x_advance, ext.height + pad * 2);
  cairo_fill(cr);

  cairo_set_source_rgb(cr, 1.0, 1.0, 1.0);
  cairo_move_to(cr, lx, ly + pad - ext.y_bearing);
  cairo_show_text(cr, text.c_str());
}

// -----------------------------------------------------------------------
// Input events
// -----------------------------------------------------------------------

gboolean CaptureOverlay::OnKeyPress(GtkWidget* /*widget*/, GdkEventKey* ev,
                                    gpointer data) {
  auto* self = static_cast<CaptureOverlay*>(data);
  if (ev->keyval == GDK_KEY_Escape) {
    self->session_.Escape();
    self->FinishIfDone();
    return TRUE;
  }
  return FALSE;
}

gboolean CaptureOverlay::OnButtonPress(GtkWidget* /*widget*/,
                                       GdkEventButton* ev, gpointer data) {
  auto* self = static_cast<CaptureOverlay*>(data);
  if (ev->button == 3) {
    self->session_.Escape();
    self->FinishIfDone();
    return TRUE;
  }
  if (ev->button != 1) return FALSE;

  self->session_.Press(static_cast<int>(ev->x), static_cast<int>(ev->y));
  gtk_widget_queue_draw(self->window_);
  return TRUE;
}

gboolean CaptureOverlay::OnButtonRelease(GtkWidget* /*widget*/,
                                         GdkEventButton* ev, gpointer data) {
  auto* self = static_cast<CaptureOverlay*>(data);
  if (ev->button != 1) return FALSE;

  self->session_.Release(static_cast<int>(ev->x), static_cast<int>(ev->y));
  if (self->session_.state() == SelectionState::kCommitted) {
    SelectionRect r = self->session_.rect();
    APP_LOG_DEBUG("Selected region: {},{} {}x{}", r.x, r.y, r.width,
                  r.height);
  }
  self->FinishIfDone();
  return TRUE;
}

gboolean CaptureOverlay::OnMotion(GtkWidget* /*widget*/, GdkEventMotion* ev,
                                  gpointer data) {
  auto* self = static_cast<CaptureOverlay*>(data);
  self->session_.Move(static_cast<int>(ev->x), static_cast<int>(ev->y));
  if (self->session_.state() == SelectionState::kDragging)
    gtk_widget_queue_draw(self->window_);
  return TRUE;
}

gboolean CaptureOverlay::OnDelete(GtkWidget* /*widget*/, GdkEvent* /*ev*/,
                                  gpointer data) {
  auto* self = static_cast<CaptureOverlay*>(data);
  self->session_.Escape();
  self->FinishIfDone();
  return TRUE;  // Teardown() destroys the window
}

#endif  // __linux__
