// Copyright 2026 The PortaShot Authors
// Tests for: portashot_version_string, portashot_version_major,
//            portashot_version_minor, portashot_version_patch

#include "gtest/gtest.h"
#include "portashot/portashot.h"
#include "portashot/portashot.hpp"

TEST(VersionTest, VersionStringIsNotNull) {
  const char* ver = portashot_version_string();
  ASSERT_NE(ver, nullptr);
}

TEST(VersionTest, VersionStringMatchesMacro) {
  EXPECT_STREQ(portashot_version_string(), PORTASHOT_VERSION_STRING);
}

TEST(VersionTest, VersionStringMatchesExpected) {
  EXPECT_STREQ(portashot_version_string(), "1.0.0");
}

TEST(VersionTest, ComponentsMatchMacros) {
  EXPECT_EQ(portashot_version_major(), PORTASHOT_VERSION_MAJOR);
  EXPECT_EQ(portashot_version_minor(), PORTASHOT_VERSION_MINOR);
  EXPECT_EQ(portashot_version_patch(), PORTASHOT_VERSION_PATCH);
}

TEST(VersionTest, CppWrapperAgrees) {
  EXPECT_STREQ(portashot::version_string(), portashot_version_string());
}
