// Copyright 2026 The PortaShot Authors
// Linux application: GTK3 tray icon + hotkey dispatch + capture.

#ifndef PORTASHOT_APP_PLATFORM_LINUX_LINUX_APPLICATION_H_
#define PORTASHOT_APP_PLATFORM_LINUX_LINUX_APPLICATION_H_

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <gtk/gtk.h>

#include <string>

#include "core/app_state.h"

class LinuxApplication {
 public:
  /// `state` must have its capture stack built and outlive the application.
  explicit LinuxApplication(AppState* state) : state_(state) {}
  ~LinuxApplication();

  LinuxApplication(const LinuxApplication&) = delete;
  LinuxApplication& operator=(const LinuxApplication&) = delete;

  bool Init();
  int  Run();

  /// Queue a capture on the main loop.  Safe to call from any GTK callback.
  void ScheduleCapture(CaptureMode mode);

 private:
  struct CaptureRequest {
    LinuxApplication* app;
    CaptureMode mode;
  };

  static gboolean OnHotkeyPoll(gpointer data);
  static gboolean OnIdleCapture(gpointer data);

  // Tray menu callbacks
  static void OnMenuRegion(GtkMenuItem* item, gpointer data);
  static void OnMenuFullscreen(GtkMenuItem* item, gpointer data);
  static void OnMenuWindow(GtkMenuItem* item, gpointer data);
  static void OnFormatToggled(GtkCheckMenuItem* item, gpointer data);
  static void OnMenuSaveLocation(GtkMenuItem* item, gpointer data);
  static void OnMenuQuit(GtkMenuItem* item, gpointer data);
  static void OnStatusIconActivate(GtkStatusIcon* icon, gpointer data);
  static void OnStatusIconPopup(GtkStatusIcon* icon, guint button,
                                guint activate_time, gpointer data);

  void RegisterHotkeys();
  void BuildMenu();
  void RefreshMenu(const Config& config);
  void RunCapture(CaptureMode mode);
  void ChooseSaveLocation();
  void Notify(const std::string& message, bool is_error);
  void Quit();

  AppState* state_;

  GtkWidget* menu_ = nullptr;
  GtkWidget* png_item_ = nullptr;
  GtkWidget* jpg_item_ = nullptr;
  GtkWidget* location_item_ = nullptr;
  GtkStatusIcon* icon_ = nullptr;
  guint poll_source_ = 0;
  bool updating_menu_ = false;
};

#endif  // __linux__
#endif  // PORTASHOT_APP_PLATFORM_LINUX_LINUX_APPLICATION_H_
