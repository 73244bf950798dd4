// Copyright 2026 The PortaShot Authors
// Tests for: screenshot file naming, FileClipboardSink, end-to-end capture
//            through the coordinator with real file output

#include <stdlib.h>
#include <time.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "core/capture_coordinator.h"
#include "core/capture_sink.h"
#include "gtest/gtest.h"
#include "test_fakes.h"

namespace {

CaptureClock::time_point At(long long seconds, long long micros) {
  return CaptureClock::time_point(
      std::chrono::duration_cast<CaptureClock::duration>(
          std::chrono::seconds(seconds) + std::chrono::microseconds(micros)));
}

CaptureResult MakeResult(int w, int h, CaptureClock::time_point ts) {
  CaptureResult result;
  result.image = MakeSolidImage(w, h);
  result.mode = CaptureMode::kFullscreen;
  result.timestamp = ts;
  return result;
}

}  // namespace

// File names are in local time; pin the zone.
class FileNameTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* tz = getenv("TZ");
    had_tz_ = tz != nullptr;
    if (had_tz_) old_tz_ = tz;
    setenv("TZ", "UTC", 1);
    tzset();
  }
  void TearDown() override {
    if (had_tz_) {
      setenv("TZ", old_tz_.c_str(), 1);
    } else {
      unsetenv("TZ");
    }
    tzset();
  }

  bool had_tz_ = false;
  std::string old_tz_;
};

TEST_F(FileNameTest, FormatWithMicroseconds) {
  // 2023-11-14 22:13:20 UTC
  EXPECT_EQ(MakeScreenshotFileName(At(1700000000, 123), ImageFormat::kPng),
            "Screenshot_20231114_221320_000123.png");
  EXPECT_EQ(MakeScreenshotFileName(At(1700000000, 999999), ImageFormat::kJpg),
            "Screenshot_20231114_221320_999999.jpg");
}

TEST_F(FileNameTest, NamesSortInCaptureOrder) {
  std::vector<CaptureClock::time_point> stamps;
  for (int i = 0; i < 50; ++i)
    stamps.push_back(At(1700000000 + i / 10, 999990 + i % 10));
  stamps.push_back(At(1700000100, 0));

  std::vector<std::string> names;
  for (const auto& ts : stamps)
    names.push_back(MakeScreenshotFileName(ts, ImageFormat::kPng));

  std::vector<std::string> sorted = names;
  std::sort(sorted.begin(), sorted.end());
  EXPECT_EQ(sorted, names);
  EXPECT_EQ(std::unique(sorted.begin(), sorted.end()), sorted.end());
}

// ---------------------------------------------------------------------------
// FileClipboardSink
// ---------------------------------------------------------------------------

class CaptureSinkTest : public ::testing::Test {
 protected:
  CaptureSinkTest() : sink_(&clipboard_) {}

  void SetUp() override {
    ASSERT_TRUE(dir_.ok());
    config_ = DefaultConfig();
    config_.save_directory = dir_.path();
  }

  TempDir dir_;
  FakeClipboard clipboard_;
  FileClipboardSink sink_;
  Config config_;
};

TEST_F(CaptureSinkTest, WritesFileAndCopiesToClipboard) {
  StoreReport report = sink_.Store(MakeResult(40, 30, At(1700000000, 1)),
                                   config_);
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.FailureSummary(), "");
  ASSERT_FALSE(report.saved_path.empty());
  EXPECT_TRUE(std::filesystem::exists(report.saved_path));
  EXPECT_EQ(report.saved_path.substr(report.saved_path.size() - 4), ".png");
  EXPECT_EQ(clipboard_.calls, 1);
  EXPECT_EQ(clipboard_.width, 40);
  EXPECT_EQ(clipboard_.height, 30);
}

TEST_F(CaptureSinkTest, CreatesMissingDirectory) {
  config_.save_directory = dir_.path() + "/nested/shots";
  StoreReport report = sink_.Store(MakeResult(8, 8, At(1700000000, 2)),
                                   config_);
  EXPECT_TRUE(report.ok());
  EXPECT_TRUE(std::filesystem::is_directory(config_.save_directory));
  EXPECT_TRUE(std::filesystem::exists(report.saved_path));
}

TEST_F(CaptureSinkTest, DiskFailureStillCopiesToClipboard) {
  // The save directory disappears and a plain file takes its place, so it
  // can be neither written into nor recreated.
  std::string target = dir_.path() + "/shots";
  config_.save_directory = target;
  { std::ofstream blocker(target); }

  StoreReport report = sink_.Store(MakeResult(64, 48, At(1700000000, 3)),
                                   config_);
  EXPECT_TRUE(report.disk_error);
  EXPECT_FALSE(report.clipboard_error);
  EXPECT_TRUE(report.saved_path.empty());
  EXPECT_EQ(report.FailureSummary(), "DiskWriteError");
  EXPECT_EQ(clipboard_.width, 64);
  EXPECT_EQ(clipboard_.height, 48);
}

TEST_F(CaptureSinkTest, ClipboardFailureStillWritesFile) {
  clipboard_.fail = true;
  StoreReport report = sink_.Store(MakeResult(16, 16, At(1700000000, 4)),
                                   config_);
  EXPECT_FALSE(report.disk_error);
  EXPECT_TRUE(report.clipboard_error);
  EXPECT_EQ(report.FailureSummary(), "ClipboardError");
  EXPECT_TRUE(std::filesystem::exists(report.saved_path));
}

TEST_F(CaptureSinkTest, BothFailuresReported) {
  clipboard_.fail = true;
  std::string target = dir_.path() + "/blocked";
  config_.save_directory = target;
  { std::ofstream blocker(target); }

  StoreReport report = sink_.Store(MakeResult(4, 4, At(1700000000, 5)),
                                   config_);
  EXPECT_EQ(report.FailureSummary(), "DiskWriteError, ClipboardError");
}

TEST_F(CaptureSinkTest, JpgExtensionFollowsConfig) {
  config_.format = ImageFormat::kJpg;
  config_.jpg_quality = 80;
  StoreReport report = sink_.Store(MakeResult(8, 8, At(1700000000, 6)),
                                   config_);
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(report.saved_path.substr(report.saved_path.size() - 4), ".jpg");
}

// ---------------------------------------------------------------------------
// End to end: coordinator + real sink
// ---------------------------------------------------------------------------

TEST_F(CaptureSinkTest, FullscreenJpgEndToEnd) {
  FakeScreenSource screen(1920, 1080);
  CaptureCoordinator coordinator(&screen, nullptr, &sink_);
  config_.format = ImageFormat::kJpg;
  config_.jpg_quality = 95;

  CaptureOutcome out = coordinator.Capture(CaptureMode::kFullscreen, config_);
  EXPECT_TRUE(out.ok());

  std::vector<std::string> files = dir_.Files();
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].rfind("Screenshot_", 0), 0u);
  EXPECT_EQ(files[0].substr(files[0].size() - 4), ".jpg");
  EXPECT_EQ(clipboard_.width, 1920);
  EXPECT_EQ(clipboard_.height, 1080);
}

TEST_F(CaptureSinkTest, CancelledRegionWritesNothing) {
  FakeScreenSource screen(800, 600);
  FakeRegionSelector selector;
  selector.outcome = FakeRegionSelector::Cancelled();
  CaptureCoordinator coordinator(&screen, &selector, &sink_);

  CaptureOutcome out = coordinator.Capture(CaptureMode::kRegion, config_);
  EXPECT_EQ(out.error, CaptureError::kCancelled);
  EXPECT_TRUE(dir_.Files().empty());
  EXPECT_EQ(clipboard_.calls, 0);
}

TEST_F(CaptureSinkTest, RapidCapturesProduceDistinctOrderedFiles) {
  FakeScreenSource screen(32, 32);
  CaptureCoordinator coordinator(&screen, nullptr, &sink_);
  long long tick = 0;
  coordinator.set_clock([&tick] { return At(1700000000, tick++); });

  for (int i = 0; i < 5; ++i)
    ASSERT_TRUE(coordinator.Capture(CaptureMode::kFullscreen, config_).ok());

  std::vector<std::string> files = dir_.Files();
  ASSERT_EQ(files.size(), 5u);
  std::sort(files.begin(), files.end());
  EXPECT_EQ(std::unique(files.begin(), files.end()), files.end());
}
