// Copyright 2026 The PortaShot Authors

#include "core/hotkey_registrar.h"

#include <algorithm>
#include <utility>

#include "core/app_defs.h"
#include "core/app_log.h"

std::string HotkeyCombo::ToString() const {
  std::string out;
  if (modifiers & kModCtrl) out += "Ctrl+";
  if (modifiers & kModAlt) out += "Alt+";
  if (modifiers & kModShift) out += "Shift+";
  if (modifiers & kModSuper) out += "Super+";
  out += static_cast<char>(key_code);
  return out;
}

HotkeyRegistrar::~HotkeyRegistrar() {
  UnregisterAll();
}

HotkeyError HotkeyRegistrar::Register(const HotkeyCombo& combo, Action action,
                                      HotkeyHandle* out_handle) {
  int id = next_id_++;
  if (!platform_ || !platform_->Register(id, combo.modifiers, combo.key_code)) {
    APP_LOG_WARN("Could not register {} (already in use)", combo.ToString());
    unavailable_.push_back(combo);
    return HotkeyError::kAlreadyInUse;
  }
  bindings_.push_back({id, combo, std::move(action)});
  if (out_handle) out_handle->id = id;
  APP_LOG_DEBUG("Registered hotkey {} (id {})", combo.ToString(), id);
  return HotkeyError::kNone;
}

void HotkeyRegistrar::Unregister(HotkeyHandle handle) {
  auto it = std::find_if(bindings_.begin(), bindings_.end(),
                         [&](const Binding& b) { return b.id == handle.id; });
  if (it == bindings_.end()) return;
  platform_->Unregister(it->id);
  bindings_.erase(it);
}

void HotkeyRegistrar::UnregisterAll() {
  if (bindings_.empty()) return;
  platform_->UnregisterAll();
  bindings_.clear();
}

int HotkeyRegistrar::Dispatch() {
  if (!platform_) return 0;
  int ran = 0;
  for (int id : platform_->Poll()) {
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&](const Binding& b) { return b.id == id; });
    if (it == bindings_.end() || !it->action) continue;
    // Copy: the action may unregister bindings.
    Action action = it->action;
    action();
    ++ran;
  }
  return ran;
}
