// Copyright 2026 The PortaShot Authors
// Tests for: HotkeyRegistrar registration, conflicts and dispatch

#include <string>
#include <vector>

#include "core/app_defs.h"
#include "core/hotkey_registrar.h"
#include "gtest/gtest.h"
#include "portashot/portashot.h"
#include "test_fakes.h"

namespace {

HotkeyCombo CtrlAlt(int key) {
  HotkeyCombo c;
  c.modifiers = kModCtrl | kModAlt;
  c.key_code = key;
  return c;
}

std::vector<std::string>* g_warnings = nullptr;

void CollectWarnings(PortaShotLogLevel level, const char* message,
                     void* /*userdata*/) {
  if (g_warnings && level == kPortaShotLogWarn) g_warnings->push_back(message);
}

}  // namespace

class HotkeyRegistrarTest : public ::testing::Test {
 protected:
  void SetUp() override {
    g_warnings = &warnings_;
    portashot_set_log_callback(CollectWarnings, nullptr);
  }
  void TearDown() override {
    portashot_set_log_callback(nullptr, nullptr);
    g_warnings = nullptr;
  }

  FakePlatformHotkey platform_;
  std::vector<std::string> warnings_;
};

TEST(HotkeyComboTest, ToString) {
  EXPECT_EQ(CtrlAlt('P').ToString(), "Ctrl+Alt+P");
  HotkeyCombo c;
  c.modifiers = kModShift | kModSuper;
  c.key_code = 'W';
  EXPECT_EQ(c.ToString(), "Shift+Super+W");
}

TEST_F(HotkeyRegistrarTest, RegisterAndDispatch) {
  HotkeyRegistrar registrar(&platform_);
  int region = 0, full = 0;
  HotkeyHandle h1, h2;
  ASSERT_EQ(registrar.Register(CtrlAlt('P'), [&] { ++region; }, &h1),
            HotkeyError::kNone);
  ASSERT_EQ(registrar.Register(CtrlAlt('F'), [&] { ++full; }, &h2),
            HotkeyError::kNone);
  EXPECT_NE(h1.id, h2.id);
  ASSERT_EQ(platform_.registered.size(), 2u);
  EXPECT_EQ(platform_.registered[0].modifiers, kModCtrl | kModAlt);

  platform_.Press('P');
  platform_.Press('P');
  platform_.Press('F');
  EXPECT_EQ(registrar.Dispatch(), 3);
  EXPECT_EQ(region, 2);
  EXPECT_EQ(full, 1);
  EXPECT_EQ(registrar.Dispatch(), 0);
}

TEST_F(HotkeyRegistrarTest, ConflictWarnsAndOthersStillWork) {
  platform_.taken_keys.push_back('P');
  HotkeyRegistrar registrar(&platform_);
  int full = 0, window = 0;
  HotkeyHandle handle;

  EXPECT_EQ(registrar.Register(CtrlAlt('P'), [] {}, &handle),
            HotkeyError::kAlreadyInUse);
  EXPECT_EQ(registrar.Register(CtrlAlt('F'), [&] { ++full; }, &handle),
            HotkeyError::kNone);
  EXPECT_EQ(registrar.Register(CtrlAlt('W'), [&] { ++window; }, &handle),
            HotkeyError::kNone);

  ASSERT_EQ(registrar.unavailable().size(), 1u);
  EXPECT_EQ(registrar.unavailable()[0].key_code, 'P');

  int matching = 0;
  for (const auto& w : warnings_) {
    if (w.find("Could not register Ctrl+Alt+P (already in use)") !=
        std::string::npos)
      ++matching;
  }
  EXPECT_EQ(matching, 1);

  platform_.Press('F');
  platform_.Press('W');
  registrar.Dispatch();
  EXPECT_EQ(full, 1);
  EXPECT_EQ(window, 1);
}

TEST_F(HotkeyRegistrarTest, UnregisterStopsDispatch) {
  HotkeyRegistrar registrar(&platform_);
  int calls = 0;
  HotkeyHandle handle;
  ASSERT_EQ(registrar.Register(CtrlAlt('P'), [&] { ++calls; }, &handle),
            HotkeyError::kNone);
  platform_.Press('P');
  registrar.Unregister(handle);
  EXPECT_TRUE(platform_.registered.empty());
  registrar.Dispatch();
  EXPECT_EQ(calls, 0);
}

TEST_F(HotkeyRegistrarTest, DestructorUnregistersAll) {
  {
    HotkeyRegistrar registrar(&platform_);
    HotkeyHandle handle;
    registrar.Register(CtrlAlt('P'), [] {}, &handle);
    registrar.Register(CtrlAlt('F'), [] {}, &handle);
    EXPECT_EQ(platform_.registered.size(), 2u);
  }
  EXPECT_TRUE(platform_.registered.empty());
}
