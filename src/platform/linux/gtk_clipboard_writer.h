// Copyright 2026 The PortaShot Authors
// Linux clipboard writer backed by the GTK3 clipboard.

#ifndef PORTASHOT_PLATFORM_LINUX_GTK_CLIPBOARD_WRITER_H_
#define PORTASHOT_PLATFORM_LINUX_GTK_CLIPBOARD_WRITER_H_

#include "core/clipboard_writer.h"

namespace portashot {
namespace internal {

class GtkClipboardWriter : public ClipboardWriter {
 public:
  bool WriteImage(const Image& image) override;
};

}  // namespace internal
}  // namespace portashot

#endif  // PORTASHOT_PLATFORM_LINUX_GTK_CLIPBOARD_WRITER_H_
