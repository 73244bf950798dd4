// Copyright 2026 The PortaShot Authors
//
// Image file export using stb_image_write (PNG, JPEG).

#include "core/image_export.h"

#include <cstdint>
#include <vector>

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#endif

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

#include "core/image.h"
#include "core/logger.h"

namespace portashot {
namespace internal {

int ClampJpegQuality(int quality) {
  if (quality < 1) return 1;
  if (quality > 100) return 100;
  return quality;
}

PortaShotError ExportImage(const Image& image, const char* path,
                           PortaShotImageFormat format, int quality) {
  if (!path || !path[0]) return kPortaShotErrorInvalidParam;

  const int w = image.width();
  const int h = image.height();
  std::vector<uint8_t> rgba = image.ToPackedRgba();

  int result = 0;
  switch (format) {
    case kPortaShotImageFormatPng:
      result = stbi_write_png(path, w, h, 4, rgba.data(), w * 4);
      break;
    case kPortaShotImageFormatJpeg: {
      // JPEG has no alpha; drop it rather than let the encoder guess.
      std::vector<uint8_t> rgb(static_cast<size_t>(w) * h * 3);
      for (size_t i = 0, n = static_cast<size_t>(w) * h; i < n; ++i) {
        rgb[i * 3 + 0] = rgba[i * 4 + 0];
        rgb[i * 3 + 1] = rgba[i * 4 + 1];
        rgb[i * 3 + 2] = rgba[i * 4 + 2];
      }
      result = stbi_write_jpg(path, w, h, 3, rgb.data(),
                              ClampJpegQuality(quality));
      break;
    }
    default:
      return kPortaShotErrorInvalidParam;
  }

  if (!result) {
    PORTASHOT_LOG_ERROR("Failed to write {}x{} image to {}", w, h, path);
    return kPortaShotErrorWriteFailed;
  }
  PORTASHOT_LOG_DEBUG("Wrote {}x{} image to {}", w, h, path);
  return kPortaShotOk;
}

}  // namespace internal
}  // namespace portashot
