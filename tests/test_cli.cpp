// Copyright 2026 The PortaShot Authors
// Tests for: ParseCli, ApplyCliOverrides, RunOneShot exit codes

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "core/cli.h"
#include "core/one_shot.h"
#include "gtest/gtest.h"
#include "test_fakes.h"

namespace {

bool Parse(std::vector<const char*> args, CliOptions* out, std::string* err) {
  args.insert(args.begin(), "portashot");
  return ParseCli(static_cast<int>(args.size()), args.data(), out, err);
}

}  // namespace

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

TEST(CliTest, DefaultsWithNoArguments) {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(Parse({}, &o, &err));
  EXPECT_FALSE(o.once);
  EXPECT_EQ(o.mode, CaptureMode::kFullscreen);
  EXPECT_FALSE(o.has_format);
  EXPECT_TRUE(o.save_dir.empty());
  EXPECT_TRUE(o.config_path.empty());
  EXPECT_FALSE(o.verbose);
}

TEST(CliTest, OnceWithOverrides) {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(Parse({"--once", "--format", "jpg", "--save-dir", "/tmp/x",
                     "--mode", "window", "--verbose"},
                    &o, &err))
      << err;
  EXPECT_TRUE(o.once);
  EXPECT_TRUE(o.has_format);
  EXPECT_EQ(o.format, ImageFormat::kJpg);
  EXPECT_EQ(o.save_dir, "/tmp/x");
  EXPECT_EQ(o.mode, CaptureMode::kActiveWindow);
  EXPECT_TRUE(o.verbose);
}

TEST(CliTest, EqualsSyntax) {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(Parse({"--format=PNG", "--mode=region", "--config=/a/b.json"},
                    &o, &err))
      << err;
  EXPECT_EQ(o.format, ImageFormat::kPng);
  EXPECT_EQ(o.mode, CaptureMode::kRegion);
  EXPECT_EQ(o.config_path, "/a/b.json");
}

TEST(CliTest, BadFormatValue) {
  CliOptions o;
  std::string err;
  EXPECT_FALSE(Parse({"--format", "gif"}, &o, &err));
  EXPECT_NE(err.find("gif"), std::string::npos);
}

TEST(CliTest, BadModeValue) {
  CliOptions o;
  std::string err;
  EXPECT_FALSE(Parse({"--mode", "monitor"}, &o, &err));
}

TEST(CliTest, MissingValue) {
  CliOptions o;
  std::string err;
  EXPECT_FALSE(Parse({"--save-dir"}, &o, &err));
  EXPECT_NE(err.find("--save-dir"), std::string::npos);
}

TEST(CliTest, UnknownFlag) {
  CliOptions o;
  std::string err;
  EXPECT_FALSE(Parse({"--once", "--bogus"}, &o, &err));
  EXPECT_NE(err.find("--bogus"), std::string::npos);
}

TEST(CliTest, FlagWithValueRejected) {
  CliOptions o;
  std::string err;
  EXPECT_FALSE(Parse({"--once=yes"}, &o, &err));
}

TEST(CliTest, HelpAndVersion) {
  CliOptions o;
  std::string err;
  ASSERT_TRUE(Parse({"-h", "--version"}, &o, &err));
  EXPECT_TRUE(o.show_help);
  EXPECT_TRUE(o.show_version);
}

TEST(CliTest, UsageMentionsEveryOption) {
  std::ostringstream os;
  PrintUsage(os, "portashot");
  std::string text = os.str();
  for (const char* opt : {"--once", "--mode", "--format", "--save-dir",
                          "--config", "--verbose", "--version", "--help"}) {
    EXPECT_NE(text.find(opt), std::string::npos) << opt;
  }
}

TEST(CliTest, OverridesApplyOnlyWhenGiven) {
  Config c = DefaultConfig();
  c.format = ImageFormat::kPng;
  c.save_directory = "/home/u/Desktop";

  CliOptions none;
  ApplyCliOverrides(none, &c);
  EXPECT_EQ(c.format, ImageFormat::kPng);
  EXPECT_EQ(c.save_directory, "/home/u/Desktop");

  CliOptions both;
  both.has_format = true;
  both.format = ImageFormat::kJpg;
  both.save_dir = "/tmp/out";
  ApplyCliOverrides(both, &c);
  EXPECT_EQ(c.format, ImageFormat::kJpg);
  EXPECT_EQ(c.save_directory, "/tmp/out");
}

// ---------------------------------------------------------------------------
// One-shot exit codes
// ---------------------------------------------------------------------------

class OneShotTest : public ::testing::Test {
 protected:
  OneShotTest() : screen_(320, 200), sink_(&clipboard_) {}

  void SetUp() override {
    ASSERT_TRUE(dir_.ok());
    config_ = DefaultConfig();
    config_.save_directory = dir_.path();
  }

  int Run(CaptureMode mode, IRegionSelector* selector = nullptr) {
    CaptureCoordinator coordinator(&screen_, selector, &sink_);
    return RunOneShot(&coordinator, config_, mode, out_, err_);
  }

  TempDir dir_;
  FakeScreenSource screen_;
  FakeClipboard clipboard_;
  FileClipboardSink sink_;
  Config config_;
  std::ostringstream out_;
  std::ostringstream err_;
};

TEST_F(OneShotTest, SuccessExitsZero) {
  EXPECT_EQ(Run(CaptureMode::kFullscreen), kExitOk);
  EXPECT_NE(out_.str().find("Saved: " + dir_.path()), std::string::npos);
  EXPECT_TRUE(err_.str().empty());
  EXPECT_EQ(dir_.Files().size(), 1u);
}

TEST_F(OneShotTest, DiskErrorPrintsKind) {
  config_.save_directory = dir_.path() + "/blocked";
  { std::ofstream blocker(config_.save_directory); }
  EXPECT_EQ(Run(CaptureMode::kFullscreen), kExitCaptureError);
  EXPECT_EQ(err_.str(), "DiskWriteError\n");
}

TEST_F(OneShotTest, ClipboardErrorPrintsKind) {
  clipboard_.fail = true;
  EXPECT_EQ(Run(CaptureMode::kFullscreen), kExitCaptureError);
  EXPECT_EQ(err_.str(), "ClipboardError\n");
}

TEST_F(OneShotTest, CancelledPrintsKind) {
  FakeRegionSelector selector;
  selector.outcome = FakeRegionSelector::Cancelled();
  EXPECT_EQ(Run(CaptureMode::kRegion, &selector), kExitCaptureError);
  EXPECT_EQ(err_.str(), "Cancelled\n");
}

TEST_F(OneShotTest, NoActiveWindowPrintsKind) {
  EXPECT_EQ(Run(CaptureMode::kActiveWindow), kExitCaptureError);
  EXPECT_EQ(err_.str(), "NoActiveWindow\n");
}
