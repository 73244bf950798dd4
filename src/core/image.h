// Copyright 2026 The PortaShot Authors

#ifndef PORTASHOT_CORE_IMAGE_H_
#define PORTASHOT_CORE_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "portashot/portashot.h"

namespace portashot {
namespace internal {

/// Internal image representation holding captured pixel data.
class Image {
 public:
  Image(int width, int height, int stride, PortaShotPixelFormat format,
        std::vector<uint8_t> data);
  ~Image() = default;

  // Non-copyable, movable.
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;
  Image(Image&&) = default;
  Image& operator=(Image&&) = default;

  int width() const { return width_; }
  int height() const { return height_; }
  int stride() const { return stride_; }
  PortaShotPixelFormat format() const { return format_; }
  const uint8_t* data() const { return data_.data(); }
  size_t data_size() const { return data_.size(); }

  /// Create an image with pre-allocated buffer (to be filled by caller).
  static std::unique_ptr<Image> Create(int width, int height,
                                       PortaShotPixelFormat format);

  /// Create an image from existing data (takes ownership via move).
  static std::unique_ptr<Image> CreateFromData(int width, int height,
                                               int stride,
                                               PortaShotPixelFormat format,
                                               std::vector<uint8_t> data);

  /// Get a mutable pointer to pixel data (for backends to fill).
  uint8_t* mutable_data() { return data_.data(); }

  /// Return a tightly packed RGBA8 copy of the pixels (encoders and
  /// toolkits want this layout).
  std::vector<uint8_t> ToPackedRgba() const;

 private:
  int width_;
  int height_;
  int stride_;
  PortaShotPixelFormat format_;
  std::vector<uint8_t> data_;
};

}  // namespace internal
}  // namespace portashot

#endif  // PORTASHOT_CORE_IMAGE_H_
