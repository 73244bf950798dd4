// Copyright 2026 The PortaShot Authors
//
// Platform-neutral constants for the PortaShot tray application.
//
// Platform-specific types (X11 keysyms, GTK widgets …) live in the platform
// layer, e.g. platform/linux/.

#ifndef PORTASHOT_APP_CORE_APP_DEFS_H_
#define PORTASHOT_APP_CORE_APP_DEFS_H_

#include <cstdint>

static constexpr const char* kAppName = "PortaShot";
static constexpr const char* kConfigFileName = "config.json";

// Config defaults.
static constexpr int kDefaultJpgQuality = 95;
static constexpr int kMinJpgQuality = 1;
static constexpr int kMaxJpgQuality = 100;


// Platform-neutral modifier bits for global hotkeys.
static constexpr uint32_t kModCtrl  = 1u << 0;
static constexpr uint32_t kModAlt   = 1u << 1;
static constexpr uint32_t kModShift = 1u << 2;
static constexpr uint32_t kModSuper = 1u << 3;

// Default key bindings; key codes are ASCII upper-case letters.
static constexpr uint32_t kCaptureModifiers = kModCtrl | kModAlt;
static constexpr int kKeyRegion     = 'P';
static constexpr int kKeyFullscreen = 'F';
static constexpr int kKeyWindow     = 'W';

// Hotkey poll interval on the main loop.
static constexpr int kHotkeyPollMs = 50;

// Selection overlay look.
static constexpr double kOverlayDimAlpha = 0.4;
static constexpr int kSizeLabelOffset = 15;
static constexpr int kSizeLabelFontSize = 12;
static constexpr int kOverlaySettleMs = 50;  // compositor fade-out after teardown

// Tray notification timeouts.
static constexpr int kStartupMessageMs = 3000;
static constexpr int kSavedMessageMs = 2000;

#endif  // PORTASHOT_APP_CORE_APP_DEFS_H_
