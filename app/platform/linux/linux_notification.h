// Copyright 2026 The PortaShot Authors
// Transient tray message popup (GTK3).

#ifndef PORTASHOT_APP_PLATFORM_LINUX_LINUX_NOTIFICATION_H_
#define PORTASHOT_APP_PLATFORM_LINUX_LINUX_NOTIFICATION_H_

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <string>

/// Show a small undecorated message near the bottom-right corner of the
/// primary monitor.  It closes itself after `timeout_ms` or on click.
/// Requires an initialized GTK.
void ShowTrayMessage(const std::string& title, const std::string& body,
                     bool is_error, int timeout_ms);

#endif  // __linux__
#endif  // PORTASHOT_APP_PLATFORM_LINUX_LINUX_NOTIFICATION_H_
