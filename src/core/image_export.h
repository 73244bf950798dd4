// Copyright 2026 The PortaShot Authors

#ifndef PORTASHOT_CORE_IMAGE_EXPORT_H_
#define PORTASHOT_CORE_IMAGE_EXPORT_H_

#include "portashot/portashot.h"

namespace portashot {
namespace internal {

class Image;

/// Clamp a JPEG quality value into [1, 100].
int ClampJpegQuality(int quality);

/// Encode `image` as PNG or JPEG and write it to `path`.
PortaShotError ExportImage(const Image& image, const char* path,
                           PortaShotImageFormat format, int quality);

}  // namespace internal
}  // namespace portashot

#endif  // PORTASHOT_CORE_IMAGE_EXPORT_H_
