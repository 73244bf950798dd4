// Copyright 2026 The PortaShot Authors

#ifndef PORTASHOT_CORE_LOGGER_H_
#define PORTASHOT_CORE_LOGGER_H_

#include <memory>

#include "spdlog/spdlog.h"

#include "portashot/portashot.h"

namespace portashot {
namespace internal {

class CallbackSink;

/// Initialize the global portashot logger (stderr + callback sink).
/// Safe to call multiple times; subsequent calls are no-ops.
void InitLogger();

/// Get the global portashot spdlog logger instance.
std::shared_ptr<spdlog::logger> GetLogger();

/// Get the global callback sink (used to register/unregister user callback).
std::shared_ptr<CallbackSink> GetCallbackSink();

/// Set the global log level.
void SetLogLevel(PortaShotLogLevel level);

/// Switch between the default logger setup (info, plain pattern) and the
/// diagnostic one (debug, timestamped pattern, flush on every message).
void SetVerbose(bool verbose);

/// Map PortaShotLogLevel to spdlog::level::level_enum.
spdlog::level::level_enum ToSpdlogLevel(PortaShotLogLevel level);

}  // namespace internal
}  // namespace portashot

// ---------------------------------------------------------------------------
// Convenience macros (internal use only).
// ---------------------------------------------------------------------------

#define PORTASHOT_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::portashot::internal::GetLogger(), __VA_ARGS__)
#define PORTASHOT_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::portashot::internal::GetLogger(), __VA_ARGS__)
#define PORTASHOT_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::portashot::internal::GetLogger(), __VA_ARGS__)
#define PORTASHOT_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::portashot::internal::GetLogger(), __VA_ARGS__)
#define PORTASHOT_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::portashot::internal::GetLogger(), __VA_ARGS__)
#define PORTASHOT_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::portashot::internal::GetLogger(), __VA_ARGS__)

#endif  // PORTASHOT_CORE_LOGGER_H_
