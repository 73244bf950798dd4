// Copyright 2026 The PortaShot Authors
// Tests for: context creation, virtual screen, capture,
//            active window lookup (require an X display)

#include "gtest/gtest.h"
#include "portashot/portashot.h"
#include "portashot/portashot.hpp"

// Fixture: provides an initialized context, or skips without a display.
class ScreenCaptureTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ctx_ = portashot_context_create();
    if (!ctx_) GTEST_SKIP() << "No display available";
  }
  void TearDown() override { portashot_context_destroy(ctx_); }

  PortaShotContext* ctx_ = nullptr;
};

// ---------------------------------------------------------------------------
// Null handling (no display needed)
// ---------------------------------------------------------------------------

TEST(ScreenCaptureNullTest, NullContext) {
  EXPECT_EQ(portashot_capture_virtual_screen(nullptr), nullptr);
  EXPECT_EQ(portashot_capture_region(nullptr, 0, 0, 10, 10), nullptr);
  PortaShotRect r = {};
  EXPECT_EQ(portashot_get_virtual_screen(nullptr, &r),
            kPortaShotErrorInvalidParam);
  EXPECT_EQ(portashot_get_last_error(nullptr), kPortaShotErrorInvalidParam);
  EXPECT_NE(portashot_get_last_error_message(nullptr), nullptr);
  portashot_context_destroy(nullptr);
}

// ---------------------------------------------------------------------------
// Virtual screen
// ---------------------------------------------------------------------------

TEST_F(ScreenCaptureTest, VirtualScreenIsNonEmpty) {
  PortaShotRect vs = {};
  ASSERT_EQ(portashot_get_virtual_screen(ctx_, &vs), kPortaShotOk);
  EXPECT_GT(vs.width, 0);
  EXPECT_GT(vs.height, 0);
}

TEST_F(ScreenCaptureTest, VirtualScreenNullOutParam) {
  EXPECT_EQ(portashot_get_virtual_screen(ctx_, nullptr),
            kPortaShotErrorInvalidParam);
}

// ---------------------------------------------------------------------------
// Capture
// ---------------------------------------------------------------------------

TEST_F(ScreenCaptureTest, CaptureVirtualScreenMatchesBounds) {
  PortaShotRect vs = {};
  ASSERT_EQ(portashot_get_virtual_screen(ctx_, &vs), kPortaShotOk);
  PortaShotImage* img = portashot_capture_virtual_screen(ctx_);
  ASSERT_NE(img, nullptr);
  EXPECT_EQ(portashot_image_get_width(img), vs.width);
  EXPECT_EQ(portashot_image_get_height(img), vs.height);
  EXPECT_GE(portashot_image_get_stride(img), vs.width * 4);
  EXPECT_EQ(portashot_image_get_format(img), kPortaShotFormatBgra8);
  portashot_image_destroy(img);
}

TEST_F(ScreenCaptureTest, CaptureRegionExactSize) {
  PortaShotImage* img = portashot_capture_region(ctx_, 10, 20, 64, 48);
  ASSERT_NE(img, nullptr);
  EXPECT_EQ(portashot_image_get_width(img), 64);
  EXPECT_EQ(portashot_image_get_height(img), 48);
  portashot_image_destroy(img);
}

TEST_F(ScreenCaptureTest, CaptureRegionZeroSizeFails) {
  EXPECT_EQ(portashot_capture_region(ctx_, 0, 0, 0, 10), nullptr);
  EXPECT_EQ(portashot_get_last_error(ctx_), kPortaShotErrorInvalidParam);
  EXPECT_EQ(portashot_capture_region(ctx_, 0, 0, 10, -1), nullptr);
}

TEST_F(ScreenCaptureTest, CaptureRegionIsClipped) {
  PortaShotRect vs = {};
  ASSERT_EQ(portashot_get_virtual_screen(ctx_, &vs), kPortaShotOk);
  PortaShotImage* img = portashot_capture_region(
      ctx_, vs.x + vs.width - 10, vs.y + vs.height - 10, 100, 100);
  ASSERT_NE(img, nullptr);
  EXPECT_EQ(portashot_image_get_width(img), 10);
  EXPECT_EQ(portashot_image_get_height(img), 10);
  portashot_image_destroy(img);
}

TEST_F(ScreenCaptureTest, ActiveWindowEitherResolvesOrReportsNone) {
  PortaShotRect r = {};
  PortaShotError err = portashot_get_active_window_rect(ctx_, &r);
  if (err == kPortaShotOk) {
    EXPECT_GT(r.width, 0);
    EXPECT_GT(r.height, 0);
  } else {
    EXPECT_EQ(err, kPortaShotErrorNoActiveWindow);
  }
}

TEST_F(ScreenCaptureTest, CppWrapperCapture) {
  portashot::Context ctx;
  auto img = ctx.CaptureRegion(0, 0, 32, 16);
  EXPECT_EQ(img.width(), 32);
  EXPECT_EQ(img.height(), 16);
  EXPECT_THROW(ctx.CaptureRegion(0, 0, 0, 0), portashot::Error);
}
