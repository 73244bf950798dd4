// Copyright 2026 The PortaShot Authors
// Tests for: portashot_set_log_level, portashot_set_log_callback,
//            portashot_set_log_verbose, portashot_log

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "portashot/portashot.h"

// ---------------------------------------------------------------------------
// Helper: capture log messages via callback
// ---------------------------------------------------------------------------

struct LogEntry {
  PortaShotLogLevel level;
  std::string message;
};

static void TestLogCallback(PortaShotLogLevel level, const char* message,
                            void* userdata) {
  auto* entries = static_cast<std::vector<LogEntry>*>(userdata);
  entries->push_back({level, message ? message : ""});
}

class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    entries_.clear();
    portashot_set_log_level(kPortaShotLogTrace);
    portashot_set_log_callback(TestLogCallback, &entries_);
  }

  void TearDown() override {
    portashot_set_log_callback(nullptr, nullptr);
    portashot_set_log_verbose(0);
    portashot_set_log_level(kPortaShotLogInfo);
  }

  bool Contains(const std::string& text) const {
    for (const auto& e : entries_) {
      if (e.message.find(text) != std::string::npos) return true;
    }
    return false;
  }

  std::vector<LogEntry> entries_;
};

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

TEST_F(LoggingTest, LogCallbackReceivesMessage) {
  portashot_log(kPortaShotLogInfo, "test message");
  EXPECT_TRUE(Contains("test message"));
}

TEST_F(LoggingTest, LogCallbackReceivesCorrectLevel) {
  portashot_log(kPortaShotLogWarn, "warn msg");

  bool found = false;
  for (const auto& e : entries_) {
    if (e.level == kPortaShotLogWarn &&
        e.message.find("warn msg") != std::string::npos) {
      found = true;
      break;
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(LoggingTest, MessageHasNoTrailingNewline) {
  portashot_log(kPortaShotLogInfo, "no newline");
  ASSERT_FALSE(entries_.empty());
  const std::string& last = entries_.back().message;
  ASSERT_FALSE(last.empty());
  EXPECT_NE(last.back(), '\n');
}

TEST_F(LoggingTest, LogLevelFiltering) {
  // Set level to Warn; Info messages should be filtered out.
  portashot_set_log_level(kPortaShotLogWarn);
  entries_.clear();

  portashot_log(kPortaShotLogInfo, "should be filtered");
  portashot_log(kPortaShotLogWarn, "should appear");

  EXPECT_FALSE(Contains("should be filtered"))
      << "Info message should have been filtered";
  EXPECT_TRUE(Contains("should appear"))
      << "Warn message should have appeared";
}

TEST_F(LoggingTest, DebugVisibleAtDebugLevel) {
  portashot_set_log_level(kPortaShotLogDebug);
  portashot_log(kPortaShotLogDebug, "debug detail");
  EXPECT_TRUE(Contains("debug detail"));
}

TEST_F(LoggingTest, UnregisterCallback) {
  portashot_set_log_callback(nullptr, nullptr);
  entries_.clear();
  portashot_log(kPortaShotLogInfo, "after unregister");
  EXPECT_FALSE(Contains("after unregister"));
}

TEST_F(LoggingTest, LogNullMessage) {
  // Should not crash.
  portashot_log(kPortaShotLogInfo, nullptr);
}

TEST_F(LoggingTest, VerboseEnablesDebugWithTimestamp) {
  portashot_set_log_level(kPortaShotLogInfo);
  portashot_set_log_verbose(1);
  entries_.clear();

  portashot_log(kPortaShotLogDebug, "verbose detail");
  ASSERT_EQ(entries_.size(), 1u);
  const std::string& line = entries_.back().message;
  // "[portashot HH:MM:SS.mmm][debug] verbose detail"
  EXPECT_EQ(line.rfind("[portashot ", 0), 0u) << line;
  ASSERT_GT(line.size(), 24u);
  EXPECT_EQ(line[13], ':');
  EXPECT_EQ(line[16], ':');
  EXPECT_EQ(line[19], '.');
  EXPECT_NE(line.find("][debug] verbose detail"), std::string::npos) << line;
}

TEST_F(LoggingTest, VerboseOffRestoresDefaults) {
  portashot_set_log_verbose(1);
  portashot_set_log_verbose(0);
  entries_.clear();

  portashot_log(kPortaShotLogDebug, "hidden detail");
  portashot_log(kPortaShotLogInfo, "plain line");
  EXPECT_FALSE(Contains("hidden detail"));
  ASSERT_EQ(entries_.size(), 1u);
  EXPECT_EQ(entries_.back().message, "[portashot][info] plain line");
}
