// Copyright 2026 The PortaShot Authors

#include "core/image.h"

#include <cstring>
#include <utility>

namespace portashot {
namespace internal {

namespace {

constexpr int kBytesPerPixel = 4;

}  // namespace

Image::Image(int width, int height, int stride, PortaShotPixelFormat format,
             std::vector<uint8_t> data)
    : width_(width),
      height_(height),
      stride_(stride),
      format_(format),
      data_(std::move(data)) {}

static constexpr size_t kMaxImageBytes = 512ULL * 1024 * 1024;  // 512 MB

// static
std::unique_ptr<Image> Image::Create(int width, int height,
                                     PortaShotPixelFormat format) {
  if (width <= 0 || height <= 0) return nullptr;
  int stride = width * kBytesPerPixel;
  size_t total = static_cast<size_t>(stride) * static_cast<size_t>(height);
  if (total > kMaxImageBytes) return nullptr;
  std::vector<uint8_t> data(total, 0);
  return std::make_unique<Image>(width, height, stride, format,
                                 std::move(data));
}

// static
std::unique_ptr<Image> Image::CreateFromData(int width, int height, int stride,
                                             PortaShotPixelFormat format,
                                             std::vector<uint8_t> data) {
  if (width <= 0 || height <= 0) return nullptr;
  if (stride < width * kBytesPerPixel) return nullptr;
  size_t required = static_cast<size_t>(stride) * static_cast<size_t>(height);
  if (required > kMaxImageBytes || data.size() < required) return nullptr;
  return std::make_unique<Image>(width, height, stride, format,
                                 std::move(data));
}

std::vector<uint8_t> Image::ToPackedRgba() const {
  const size_t row_bytes = static_cast<size_t>(width_) * kBytesPerPixel;
  std::vector<uint8_t> rgba(row_bytes * static_cast<size_t>(height_));
  for (int y = 0; y < height_; ++y) {
    const uint8_t* src = data_.data() + static_cast<size_t>(y) * stride_;
    uint8_t* dst = rgba.data() + static_cast<size_t>(y) * row_bytes;
    if (format_ == kPortaShotFormatRgba8) {
      std::memcpy(dst, src, row_bytes);
      continue;
    }
    for (int x = 0; x < width_; ++x) {
      dst[x * 4 + 0] = src[x * 4 + 2];  // R <- B
      dst[x * 4 + 1] = src[x * 4 + 1];  // G
      dst[x * 4 + 2] = src[x * 4 + 0];  // B <- R
      dst[x * 4 + 3] = src[x * 4 + 3];  // A
    }
  }
  return rgba;
}

}  // namespace internal
}  // namespace portashot
