// Copyright 2026 The PortaShot Authors
// Linux clipboard writer: GTK3 clipboard + GdkPixbuf.

#include "platform/linux/gtk_clipboard_writer.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <cstring>
#include <vector>

#include <gtk/gtk.h>

#include "core/image.h"
#include "core/logger.h"

namespace portashot {
namespace internal {

bool GtkClipboardWriter::WriteImage(const Image& image) {
  // No-op when the application already initialized GTK.
  if (!gtk_init_check(nullptr, nullptr)) {
    PORTASHOT_LOG_ERROR("GTK unavailable; cannot reach the clipboard");
    return false;
  }

  const int w = image.width();
  const int h = image.height();
  GdkPixbuf* pb = gdk_pixbuf_new(GDK_COLORSPACE_RGB, TRUE, 8, w, h);
  if (!pb) {
    PORTASHOT_LOG_ERROR("gdk_pixbuf_new failed for {}x{}", w, h);
    return false;
  }

  std::vector<uint8_t> rgba = image.ToPackedRgba();
  const int pb_stride = gdk_pixbuf_get_rowstride(pb);
  guchar* pb_pixels = gdk_pixbuf_get_pixels(pb);
  for (int row = 0; row < h; ++row) {
    std::memcpy(pb_pixels + static_cast<size_t>(row) * pb_stride,
                rgba.data() + static_cast<size_t>(row) * w * 4,
                static_cast<size_t>(w) * 4);
  }

  GtkClipboard* clipboard = gtk_clipboard_get(GDK_SELECTION_CLIPBOARD);
  if (!clipboard) {
    g_object_unref(pb);
    PORTASHOT_LOG_ERROR("Clipboard is not available");
    return false;
  }
  gtk_clipboard_set_image(clipboard, pb);
  // Hand the data to the clipboard manager so it outlives this process.
  gtk_clipboard_store(clipboard);
  g_object_unref(pb);

  PORTASHOT_LOG_DEBUG("Copied {}x{} image to clipboard", w, h);
  return true;
}

std::unique_ptr<ClipboardWriter> CreatePlatformClipboardWriter() {
  return std::make_unique<GtkClipboardWriter>();
}

}  // namespace internal
}  // namespace portashot

#endif  // __linux__
