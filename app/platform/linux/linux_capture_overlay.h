// Copyright 2026 The PortaShot Authors
// Full-virtual-screen region selection overlay (GTK3 + Cairo).

#ifndef PORTASHOT_APP_PLATFORM_LINUX_LINUX_CAPTURE_OVERLAY_H_
#define PORTASHOT_APP_PLATFORM_LINUX_LINUX_CAPTURE_OVERLAY_H_

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <gtk/gtk.h>

#include "core/capture_sources.h"
#include "core/selection_session.h"

/// Shows a frozen, dimmed screenshot of the virtual screen and lets the user
/// drag out a rectangle.  SelectRegion() blocks in a nested main loop; other
/// main-loop sources (hotkey polling) keep running meanwhile.
class CaptureOverlay : public IRegionSelector {
 public:
  /// `screen` provides the frozen background and must outlive the overlay.
  explicit CaptureOverlay(IScreenSource* screen) : screen_(screen) {}
  ~CaptureOverlay() override;

  SelectionOutcome SelectRegion() override;

  bool IsActive() const { return loop_ != nullptr; }

 private:
  // GTK callbacks
  static gboolean OnDraw(GtkWidget* widget, cairo_t* cr, gpointer data);
  static gboolean OnKeyPress(GtkWidget* widget, GdkEventKey* ev,
                             gpointer data);
  static gboolean OnButtonPress(GtkWidget* widget, GdkEventButton* ev,
                                gpointer data);
  static gboolean OnButtonRelease(GtkWidget* widget, GdkEventButton* ev,
                                  gpointer data);
  static gboolean OnMotion(GtkWidget* widget, GdkEventMotion* ev,
                           gpointer data);
  static gboolean OnDelete(GtkWidget* widget, GdkEvent* ev, gpointer data);
  static void OnMapped(GtkWidget* widget, gpointer data);

  bool CreateWindow();
  void DrawOverlay(cairo_t* cr);
  void DrawSizeLabel(cairo_t* cr);
  void GrabInput();
  void FinishIfDone();
  void Teardown();

  IScreenSource* screen_;
  SelectionSession session_;
  SelectionRect bounds_;

  portashot::Image background_;
  cairo_surface_t* bg_surface_ = nullptr;
  GtkWidget* window_ = nullptr;
  GdkSeat* grabbed_seat_ = nullptr;
  GMainLoop* loop_ = nullptr;
};

#endif  // __linux__
#endif  // PORTASHOT_APP_PLATFORM_LINUX_LINUX_CAPTURE_OVERLAY_H_
