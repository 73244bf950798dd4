// Copyright 2026 The PortaShot Authors
// Linux application implementation: GTK3 tray + hotkey dispatch + capture.

#include "platform/linux/linux_application.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <cstdio>

#include "core/app_defs.h"
#include "core/app_log.h"
#include "platform/linux/linux_notification.h"

namespace {

HotkeyCombo ComboFor(int key_code) {
  HotkeyCombo combo;
  combo.modifiers = kCaptureModifiers;
  combo.key_code = key_code;
  return combo;
}

std::string BaseName(const std::string& path) {
  auto slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string UpperCase(const char* text) {
  std::string out(text);
  for (auto& c : out) c = static_cast<char>(g_ascii_toupper(c));
  return out;
}

}  // namespace

LinuxApplication::~LinuxApplication() {
  if (poll_source_) g_source_remove(poll_source_);
  if (state_->hotkeys) state_->hotkeys->UnregisterAll();
  state_->config.SetObserver(nullptr);
  if (icon_) g_object_unref(icon_);
  if (menu_) gtk_widget_destroy(menu_);
}

// ========================================================================
// Init / Run
// ========================================================================

bool LinuxApplication::Init() {
  if (!state_->coordinator) {
    APP_LOG_ERROR("Application started without a capture stack");
    return false;
  }

  RegisterHotkeys();
  BuildMenu();

  G_GNUC_BEGIN_IGNORE_DEPRECATIONS
  icon_ = gtk_status_icon_new_from_icon_name("camera-photo");
  gtk_status_icon_set_tooltip_text(icon_, kAppName);
  gtk_status_icon_set_visible(icon_, TRUE);
  g_signal_connect(icon_, "activate", G_CALLBACK(OnStatusIconActivate), this);
  g_signal_connect(icon_, "popup-menu", G_CALLBACK(OnStatusIconPopup), this);
  G_GNUC_END_IGNORE_DEPRECATIONS

  state_->config.SetObserver([this](const Config&) {
    RefreshMenu(state_->EffectiveConfig());
  });
  RefreshMenu(state_->EffectiveConfig());
  return true;
}

int LinuxApplication::Run() {
  Config config = state_->EffectiveConfig();
  std::printf("%s v%s -- Linux (GTK3)\n", kAppName,
              portashot::version_string());
  std::printf("  %s = Capture region\n", ComboFor(kKeyRegion).ToString().c_str());
  std::printf("  %s = Capture full screen\n",
              ComboFor(kKeyFullscreen).ToString().c_str());
  std::printf("  %s = Capture active window\n",
              ComboFor(kKeyWindow).ToString().c_str());
  std::printf("  Format: %s | Save: %s\n",
              UpperCase(ImageFormatName(config.format)).c_str(),
              config.save_directory.c_str());

  std::string startup = ComboFor(kKeyRegion).ToString() +
                        " to capture region\nFormat: " +
                        UpperCase(ImageFormatName(config.format)) +
                        " | Save: " + config.save_directory;
  ShowTrayMessage(kAppName, startup, false, kStartupMessageMs);

  poll_source_ = g_timeout_add(kHotkeyPollMs, OnHotkeyPoll, this);

  std::printf("Ready. Click the tray icon to capture a region, "
              "right-click for the menu.\n");
  gtk_main();
  return 0;
}

void LinuxApplication::RegisterHotkeys() {
  state_->hotkey_platform = CreatePlatformHotkey();
  state_->hotkeys =
      std::make_unique<HotkeyRegistrar>(state_->hotkey_platform.get());

  struct Binding {
    int key;
    CaptureMode mode;
  };
  const Binding bindings[] = {
      {kKeyRegion, CaptureMode::kRegion},
      {kKeyFullscreen, CaptureMode::kFullscreen},
      {kKeyWindow, CaptureMode::kActiveWindow},
  };
  for (const auto& b : bindings) {
    CaptureMode mode = b.mode;
    HotkeyHandle handle;
    if (state_->hotkeys->Register(ComboFor(b.key),
                                  [this, mode] { ScheduleCapture(mode); },
                                  &handle) == HotkeyError::kNone) {
      state_->hotkey_handles.push_back(handle);
    }
  }
}

// ========================================================================
// Capture dispatch
// ========================================================================

gboolean LinuxApplication::OnHotkeyPoll(gpointer data) {
  auto* self = static_cast<LinuxApplication*>(data);
  if (self->state_->hotkeys) self->state_->hotkeys->Dispatch();
  return G_SOURCE_CONTINUE;
}

// Captures run from an idle callback so the trigger (menu, hotkey poll)
// has returned first; the poll timer then keeps firing during the overlay
// and later triggers are rejected as busy.
void LinuxApplication::ScheduleCapture(CaptureMode mode) {
  CaptureRequest* request = g_new0(CaptureRequest, 1);
  request->app = this;
  request->mode = mode;
  g_idle_add(OnIdleCapture, request);
}

gboolean LinuxApplication::OnIdleCapture(gpointer data) {
  auto* request = static_cast<CaptureRequest*>(data);
  LinuxApplication* app = request->app;
  CaptureMode mode = request->mode;
  g_free(request);
  app->RunCapture(mode);
  return G_SOURCE_REMOVE;
}

void LinuxApplication::RunCapture(CaptureMode mode) {
  CaptureOutcome outcome =
      state_->coordinator->Capture(mode, state_->EffectiveConfig());

  switch (outcome.error) {
    case CaptureError::kNone:
      break;
    case CaptureError::kBusy:
    case CaptureError::kCancelled:
      return;
    default:
      Notify(std::string("Capture failed: ") + ErrorKindName(outcome.error),
             true);
      return;
  }

  const StoreReport& report = outcome.report;
  if (report.ok()) {
    Notify(BaseName(report.saved_path), false);
  } else if (!report.disk_error) {
    Notify(BaseName(report.saved_path) + "\nNot copied: " +
               report.FailureSummary(),
           true);
  } else {
    Notify("Screenshot not saved: " + report.FailureSummary(), true);
  }
}

void LinuxApplication::Notify(const std::string& message, bool is_error) {
  const char* title = is_error ? "Screenshot Failed" : "Screenshot Saved";
  std::printf("[%s] %s\n", title, message.c_str());
  ShowTrayMessage(title, message, is_error, kSavedMessageMs);
}

// ========================================================================
// GTK tray menu
// ========================================================================

void LinuxApplication::BuildMenu() {
  menu_ = gtk_menu_new();
  g_object_ref_sink(menu_);

  std::string region_label =
      "Capture Region (" + ComboFor(kKeyRegion).ToString() + ")";
  GtkWidget* region_item = gtk_menu_item_new_with_label(region_label.c_str());
  g_signal_connect(region_item, "activate", G_CALLBACK(OnMenuRegion), this);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), region_item);

  std::string full_label =
      "Capture Full Screen (" + ComboFor(kKeyFullscreen).ToString() + ")";
  GtkWidget* full_item = gtk_menu_item_new_with_label(full_label.c_str());
  g_signal_connect(full_item, "activate", G_CALLBACK(OnMenuFullscreen), this);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), full_item);

  std::string window_label =
      "Capture Window (" + ComboFor(kKeyWindow).ToString() + ")";
  GtkWidget* window_item = gtk_menu_item_new_with_label(window_label.c_str());
  g_signal_connect(window_item, "activate", G_CALLBACK(OnMenuWindow), this);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), window_item);

  gtk_menu_shell_append(GTK_MENU_SHELL(menu_),
                        gtk_separator_menu_item_new());

  // Format submenu (radio group).
  GtkWidget* format_item = gtk_menu_item_new_with_label("Format");
  GtkWidget* format_menu = gtk_menu_new();
  png_item_ = gtk_radio_menu_item_new_with_label(nullptr, "PNG");
  jpg_item_ = gtk_radio_menu_item_new_with_label_from_widget(
      GTK_RADIO_MENU_ITEM(png_item_), "JPG");
  g_signal_connect(png_item_, "toggled", G_CALLBACK(OnFormatToggled), this);
  g_signal_connect(jpg_item_, "toggled", G_CALLBACK(OnFormatToggled), this);
  gtk_menu_shell_append(GTK_MENU_SHELL(format_menu), png_item_);
  gtk_menu_shell_append(GTK_MENU_SHELL(format_menu), jpg_item_);
  gtk_menu_item_set_submenu(GTK_MENU_ITEM(format_item), format_menu);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), format_item);

  GtkWidget* location_item = gtk_menu_item_new_with_label("Save Location...");
  g_signal_connect(location_item, "activate",
                   G_CALLBACK(OnMenuSaveLocation), this);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), location_item);

  location_item_ = gtk_menu_item_new_with_label("");
  gtk_widget_set_sensitive(location_item_, FALSE);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), location_item_);

  gtk_menu_shell_append(GTK_MENU_SHELL(menu_),
                        gtk_separator_menu_item_new());

  GtkWidget* quit_item = gtk_menu_item_new_with_label("Quit");
  g_signal_connect(quit_item, "activate", G_CALLBACK(OnMenuQuit), this);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), quit_item);

  gtk_widget_show_all(menu_);
}

void LinuxApplication::RefreshMenu(const Config& config) {
  updating_menu_ = true;
  gtk_check_menu_item_set_active(
      GTK_CHECK_MENU_ITEM(config.format == ImageFormat::kJpg ? jpg_item_
                                                             : png_item_),
      TRUE);
  updating_menu_ = false;

  std::string location = "  " + config.save_directory;
  gtk_menu_item_set_label(GTK_MENU_ITEM(location_item_), location.c_str());
}

void LinuxApplication::OnMenuRegion(GtkMenuItem* /*item*/, gpointer data) {
  static_cast<LinuxApplication*>(data)->ScheduleCapture(CaptureMode::kRegion);
}

void LinuxApplication::OnMenuFullscreen(GtkMenuItem* /*item*/,
                                        gpointer data) {
  static_cast<LinuxApplication*>(data)->ScheduleCapture(
      CaptureMode::kFullscreen);
}

void LinuxApplication::OnMenuWindow(GtkMenuItem* /*item*/, gpointer data) {
  static_cast<LinuxApplication*>(data)->ScheduleCapture(
      CaptureMode::kActiveWindow);
}

void LinuxApplication::OnFormatToggled(GtkCheckMenuItem* item,
                                       gpointer data) {
  auto* self = static_cast<LinuxApplication*>(data);
  if (self->updating_menu_ || !gtk_check_menu_item_get_active(item)) return;

  ImageFormat format = GTK_WIDGET(item) == self->jpg_item_ ? ImageFormat::kJpg
                                                           : ImageFormat::kPng;
  // A menu choice replaces the command-line override for this run.
  self->state_->has_format_override = false;
  if (!self->state_->config.SetFormat(format))
    self->Notify("Could not save settings to " + self->state_->config.path(),
                 true);
  APP_LOG_INFO("Format set to {}", ImageFormatName(format));
}

void LinuxApplication::OnMenuSaveLocation(GtkMenuItem* /*item*/,
                                          gpointer data) {
  static_cast<LinuxApplication*>(data)->ChooseSaveLocation();
}

void LinuxApplication::ChooseSaveLocation() {
  GtkWidget* dialog = gtk_file_chooser_dialog_new(
      "Choose Save Location", nullptr, GTK_FILE_CHOOSER_ACTION_SELECT_FOLDER,
      "_Cancel", GTK_RESPONSE_CANCEL,
      "_Select", GTK_RESPONSE_ACCEPT, nullptr);
  gtk_file_chooser_set_current_folder(
      GTK_FILE_CHOOSER(dialog),
      state_->EffectiveConfig().save_directory.c_str());

  if (gtk_dialog_run(GTK_DIALOG(dialog)) == GTK_RESPONSE_ACCEPT) {
    char* folder = gtk_file_chooser_get_filename(GTK_FILE_CHOOSER(dialog));
    if (folder) {
      state_->save_dir_override.clear();
      if (!state_->config.SetSaveDirectory(folder))
        Notify("Could not save settings to " + state_->config.path(), true);
      APP_LOG_INFO("Save location set to {}", folder);
      g_free(folder);
    }
  }
  gtk_widget_destroy(dialog);
}

void LinuxApplication::OnMenuQuit(GtkMenuItem* /*item*/, gpointer data) {
  static_cast<LinuxApplication*>(data)->Quit();
}

void LinuxApplication::Quit() {
  if (!state_->config.Save())
    APP_LOG_WARN("Settings not saved to {}", state_->config.path());
  if (state_->hotkeys) state_->hotkeys->UnregisterAll();
  state_->hotkey_handles.clear();
  if (poll_source_) {
    g_source_remove(poll_source_);
    poll_source_ = 0;
  }
  gtk_main_quit();
}

G_GNUC_BEGIN_IGNORE_DEPRECATIONS

void LinuxApplication::OnStatusIconActivate(GtkStatusIcon* /*icon*/,
                                            gpointer data) {
  static_cast<LinuxApplication*>(data)->ScheduleCapture(CaptureMode::kRegion);
}

void LinuxApplication::OnStatusIconPopup(GtkStatusIcon* /*icon*/,
                                         guint button, guint activate_time,
                                         gpointer data) {
  auto* self = static_cast<LinuxApplication*>(data);
  gtk_menu_popup(GTK_MENU(self->menu_), nullptr, nullptr,
                 gtk_status_icon_position_menu, self->icon_,
                 button, activate_time);
}

G_GNUC_END_IGNORE_DEPRECATIONS

#endif  // __linux__
