// Copyright 2026 The PortaShot Authors
//
// IPlatformHotkey: abstract interface for system-wide global hotkeys.
//
// Linux:    XGrabKey (X11), key events drained by Poll() on the main loop

#ifndef PORTASHOT_APP_CORE_PLATFORM_HOTKEY_H_
#define PORTASHOT_APP_CORE_PLATFORM_HOTKEY_H_

#include <cstdint>
#include <memory>
#include <vector>

class IPlatformHotkey {
 public:
  virtual ~IPlatformHotkey() = default;

  /// Register a global hotkey.
  /// @param hotkey_id  Application-defined identifier (e.g. kHotkeyRegion).
  /// @param modifiers  kMod* bits from core/app_defs.h.
  /// @param key_code   ASCII upper-case letter or digit.
  /// @return true if the hotkey was registered; false if another client
  ///         already owns the combination or the key is unknown.
  virtual bool Register(int hotkey_id, uint32_t modifiers, int key_code) = 0;

  /// Unregister a previously registered hotkey.
  virtual void Unregister(int hotkey_id) = 0;

  /// Unregister all hotkeys registered through this instance.
  virtual void UnregisterAll() = 0;

  /// Drain pending key events.  Returns the ids of hotkeys pressed since the
  /// last call, in order.
  virtual std::vector<int> Poll() = 0;

 protected:
  IPlatformHotkey() = default;

 private:
  IPlatformHotkey(const IPlatformHotkey&) = delete;
  IPlatformHotkey& operator=(const IPlatformHotkey&) = delete;
};

/// Factory: returns the platform-specific implementation.
std::unique_ptr<IPlatformHotkey> CreatePlatformHotkey();

#endif  // PORTASHOT_APP_CORE_PLATFORM_HOTKEY_H_
