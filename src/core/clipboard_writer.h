// Copyright 2026 The PortaShot Authors
// Clipboard writing abstract interface.

#ifndef PORTASHOT_CORE_CLIPBOARD_WRITER_H_
#define PORTASHOT_CORE_CLIPBOARD_WRITER_H_

#include <memory>

namespace portashot {
namespace internal {

class Image;

/// Abstract interface for placing image data on the platform clipboard.
class ClipboardWriter {
 public:
  virtual ~ClipboardWriter() = default;

  /// Offer `image` as the clipboard content. Returns false if the
  /// clipboard could not be claimed.
  virtual bool WriteImage(const Image& image) = 0;

 protected:
  ClipboardWriter() = default;
};

/// Factory: creates the platform-specific clipboard writer.
std::unique_ptr<ClipboardWriter> CreatePlatformClipboardWriter();

}  // namespace internal
}  // namespace portashot

#endif  // PORTASHOT_CORE_CLIPBOARD_WRITER_H_
