// Copyright 2026 The PortaShot Authors
// Linux implementation of IPlatformHotkey using X11 XGrabKey.

#include "core/platform_hotkey.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <X11/Xlib.h>
#include <X11/keysym.h>

#include "core/app_defs.h"
#include "core/app_log.h"

namespace {

// NumLock (Mod2) and CapsLock must not block the combination.
const unsigned int kLockVariants[] = {0, Mod2Mask, LockMask,
                                      Mod2Mask | LockMask};

bool g_grab_failed = false;

int GrabErrorHandler(Display* /*dpy*/, XErrorEvent* ev) {
  if (ev->error_code == BadAccess) g_grab_failed = true;
  return 0;
}

unsigned int ToX11Modifiers(uint32_t modifiers) {
  unsigned int mask = 0;
  if (modifiers & kModCtrl) mask |= ControlMask;
  if (modifiers & kModAlt) mask |= Mod1Mask;
  if (modifiers & kModShift) mask |= ShiftMask;
  if (modifiers & kModSuper) mask |= Mod4Mask;
  return mask;
}

// Letters map to their lower-case keysym; digits map directly.
KeySym ToX11Keysym(int key_code) {
  if (key_code >= 'A' && key_code <= 'Z')
    return static_cast<KeySym>(XK_a + (key_code - 'A'));
  return static_cast<KeySym>(key_code);
}

}  // namespace

class LinuxPlatformHotkey : public IPlatformHotkey {
 public:
  LinuxPlatformHotkey() {
    dpy_ = XOpenDisplay(nullptr);
    if (!dpy_) {
      APP_LOG_ERROR("Cannot open X display for hotkeys");
    }
  }

  ~LinuxPlatformHotkey() override {
    UnregisterAll();
    if (dpy_) XCloseDisplay(dpy_);
  }

  bool Register(int hotkey_id, uint32_t modifiers, int key_code) override {
    if (!dpy_) return false;

    Window root = DefaultRootWindow(dpy_);
    KeyCode kc = XKeysymToKeycode(dpy_, ToX11Keysym(key_code));
    if (kc == 0) {
      APP_LOG_WARN("No keycode for key 0x{:X}", key_code);
      return false;
    }
    unsigned int mods = ToX11Modifiers(modifiers);

    // A grab held by another client fails asynchronously with BadAccess.
    XSync(dpy_, False);
    g_grab_failed = false;
    auto old_handler = XSetErrorHandler(GrabErrorHandler);
    for (unsigned int lock : kLockVariants) {
      XGrabKey(dpy_, kc, mods | lock, root, True, GrabModeAsync,
               GrabModeAsync);
    }
    XSync(dpy_, False);
    XSetErrorHandler(old_handler);

    if (g_grab_failed) {
      for (unsigned int lock : kLockVariants)
        XUngrabKey(dpy_, kc, mods | lock, root);
      XFlush(dpy_);
      return false;
    }

    entries_.push_back({hotkey_id, kc, mods});
    return true;
  }

  void Unregister(int hotkey_id) override {
    if (!dpy_) return;
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->id == hotkey_id) {
        Ungrab(*it);
        XFlush(dpy_);
        entries_.erase(it);
        return;
      }
    }
  }

  void UnregisterAll() override {
    if (!dpy_) return;
    for (const auto& e : entries_) Ungrab(e);
    XFlush(dpy_);
    entries_.clear();
  }

  std::vector<int> Poll() override {
    std::vector<int> fired;
    if (!dpy_) return fired;

    const unsigned int relevant = ControlMask | Mod1Mask | ShiftMask | Mod4Mask;
    while (XPending(dpy_)) {
      XEvent ev;
      XNextEvent(dpy_, &ev);
      if (ev.type != KeyPress) continue;
      unsigned int state = ev.xkey.state & relevant;
      for (const auto& e : entries_) {
        if (e.keycode == ev.xkey.keycode && e.modifiers == state) {
          fired.push_back(e.id);
          break;
        }
      }
    }
    return fired;
  }

 private:
  struct HotkeyEntry {
    int id;
    KeyCode keycode;
    unsigned int modifiers;
  };

  void Ungrab(const HotkeyEntry& e) {
    Window root = DefaultRootWindow(dpy_);
    for (unsigned int lock : kLockVariants)
      XUngrabKey(dpy_, e.keycode, e.modifiers | lock, root);
  }

  Display* dpy_ = nullptr;
  std::vector<HotkeyEntry> entries_;
};

std::unique_ptr<IPlatformHotkey> CreatePlatformHotkey() {
  return std::make_unique<LinuxPlatformHotkey>();
}

#endif  // __linux__
