// Copyright 2026 The PortaShot Authors
//
// HotkeyRegistrar: binds key combinations to application actions on top of
// an IPlatformHotkey.  A combination that is already taken is reported once
// as a warning; the remaining bindings keep working.

#ifndef PORTASHOT_APP_CORE_HOTKEY_REGISTRAR_H_
#define PORTASHOT_APP_CORE_HOTKEY_REGISTRAR_H_

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "core/platform_hotkey.h"

struct HotkeyCombo {
  uint32_t modifiers = 0;
  int key_code = 0;

  /// "Ctrl+Alt+P"
  std::string ToString() const;
};

/// Opaque handle of a registered binding.
struct HotkeyHandle {
  int id = 0;
};

enum class HotkeyError {
  kNone,
  kAlreadyInUse,
};

class HotkeyRegistrar {
 public:
  using Action = std::function<void()>;

  /// `platform` must outlive the registrar.
  explicit HotkeyRegistrar(IPlatformHotkey* platform) : platform_(platform) {}
  ~HotkeyRegistrar();

  HotkeyRegistrar(const HotkeyRegistrar&) = delete;
  HotkeyRegistrar& operator=(const HotkeyRegistrar&) = delete;

  /// Returns kNone and fills `out_handle` on success.
  HotkeyError Register(const HotkeyCombo& combo, Action action,
                       HotkeyHandle* out_handle);

  void Unregister(HotkeyHandle handle);
  void UnregisterAll();

  /// Poll the platform and run the actions of triggered hotkeys.
  /// Returns the number of actions run.
  int Dispatch();

  /// Combos whose registration failed, in registration order.
  const std::vector<HotkeyCombo>& unavailable() const { return unavailable_; }

 private:
  struct Binding {
    int id;
    HotkeyCombo combo;
    Action action;
  };

  IPlatformHotkey* platform_;
  std::vector<Binding> bindings_;
  std::vector<HotkeyCombo> unavailable_;
  int next_id_ = 1;
};

#endif  // PORTASHOT_APP_CORE_HOTKEY_REGISTRAR_H_
