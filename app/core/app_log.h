// Copyright 2026 The PortaShot Authors
//
// Application logging: formats with fmt and routes the message through the
// portashot logging pipeline (stderr + user callback).

#ifndef PORTASHOT_APP_CORE_APP_LOG_H_
#define PORTASHOT_APP_CORE_APP_LOG_H_

#include "spdlog/fmt/fmt.h"

#include "portashot/portashot.hpp"

#define APP_LOG_DEBUG(...) ::portashot::log(kPortaShotLogDebug, fmt::format(__VA_ARGS__))
#define APP_LOG_INFO(...)  ::portashot::log(kPortaShotLogInfo, fmt::format(__VA_ARGS__))
#define APP_LOG_WARN(...)  ::portashot::log(kPortaShotLogWarn, fmt::format(__VA_ARGS__))
#define APP_LOG_ERROR(...) ::portashot::log(kPortaShotLogError, fmt::format(__VA_ARGS__))

#endif  // PORTASHOT_APP_CORE_APP_LOG_H_
