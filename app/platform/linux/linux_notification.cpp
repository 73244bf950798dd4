// Copyright 2026 The PortaShot Authors
// Transient tray message popup (GTK3).

#include "platform/linux/linux_notification.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <gtk/gtk.h>

static constexpr int kMargin = 16;
static constexpr int kPadding = 12;

static gboolean OnMessageTimeout(gpointer data) {
  gtk_widget_destroy(GTK_WIDGET(data));
  return G_SOURCE_REMOVE;
}

static gboolean OnMessageClick(GtkWidget* widget, GdkEventButton* /*ev*/,
                               gpointer /*data*/) {
  gtk_widget_hide(widget);
  return TRUE;
}

static void OnMessageDestroy(GtkWidget* /*widget*/, gpointer data) {
  guint source = GPOINTER_TO_UINT(data);
  if (source) g_source_remove(source);
}

void ShowTrayMessage(const std::string& title, const std::string& body,
                     bool is_error, int timeout_ms) {
  GtkWidget* window = gtk_window_new(GTK_WINDOW_POPUP);
  gtk_window_set_type_hint(GTK_WINDOW(window),
                           GDK_WINDOW_TYPE_HINT_NOTIFICATION);
  gtk_window_set_keep_above(GTK_WINDOW(window), TRUE);
  gtk_window_set_accept_focus(GTK_WINDOW(window), FALSE);
  gtk_widget_add_events(window, GDK_BUTTON_PRESS_MASK);

  GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);
  gtk_container_set_border_width(GTK_CONTAINER(box), kPadding);

  GtkWidget* title_label = gtk_label_new(nullptr);
  gchar* markup = g_markup_printf_escaped(
      is_error ? "<b><span foreground=\"#d03030\">%s</span></b>" : "<b>%s</b>",
      title.c_str());
  gtk_label_set_markup(GTK_LABEL(title_label), markup);
  g_free(markup);
  gtk_widget_set_halign(title_label, GTK_ALIGN_START);

  GtkWidget* body_label = gtk_label_new(body.c_str());
  gtk_label_set_line_wrap(GTK_LABEL(body_label), TRUE);
  gtk_label_set_max_width_chars(GTK_LABEL(body_label), 48);
  gtk_widget_set_halign(body_label, GTK_ALIGN_START);

  gtk_box_pack_start(GTK_BOX(box), title_label, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), body_label, FALSE, FALSE, 0);
  gtk_container_add(GTK_CONTAINER(window), box);
  gtk_widget_show_all(window);

  // Bottom-right of the primary monitor's work area.
  GdkDisplay* display = gdk_display_get_default();
  GdkMonitor* monitor =
      display ? gdk_display_get_primary_monitor(display) : nullptr;
  if (!monitor && display) monitor = gdk_display_get_monitor(display, 0);
  if (monitor) {
    GdkRectangle area;
    gdk_monitor_get_workarea(monitor, &area);
    int w = 0, h = 0;
    gtk_window_get_size(GTK_WINDOW(window), &w, &h);
    gtk_window_move(GTK_WINDOW(window), area.x + area.width - w - kMargin,
                    area.y + area.height - h - kMargin);
  }

  guint source = g_timeout_add(static_cast<guint>(timeout_ms),
                               OnMessageTimeout, window);
  g_signal_connect(window, "button-press-event", G_CALLBACK(OnMessageClick),
                   nullptr);
  g_signal_connect(window, "destroy", G_CALLBACK(OnMessageDestroy),
                   GUINT_TO_POINTER(source));
}

#endif  // __linux__
