// Copyright 2026 The PortaShot Authors

#include "core/logger.h"

#include <mutex>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "core/callback_sink.h"

namespace portashot {
namespace internal {

namespace {

std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<CallbackSink> g_callback_sink;

// [portashot][level] message
constexpr const char* kDefaultPattern = "[portashot][%l] %v";
// [portashot 12:34:56.789][level] message
constexpr const char* kVerbosePattern = "[portashot %H:%M:%S.%e][%l] %v";

}  // namespace

void InitLogger() {
  std::call_once(g_init_flag, []() {
    auto stderr_sink =
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_callback_sink = std::make_shared<CallbackSink>();

    spdlog::sinks_init_list sinks = {stderr_sink, g_callback_sink};
    g_logger = std::make_shared<spdlog::logger>("portashot", sinks);

    g_logger->set_pattern(kDefaultPattern);
    g_logger->set_level(spdlog::level::info);
    g_logger->flush_on(spdlog::level::warn);
  });
}

std::shared_ptr<spdlog::logger> GetLogger() {
  InitLogger();
  return g_logger;
}

std::shared_ptr<CallbackSink> GetCallbackSink() {
  InitLogger();
  return g_callback_sink;
}

void SetLogLevel(PortaShotLogLevel level) {
  InitLogger();
  g_logger->set_level(ToSpdlogLevel(level));
}

void SetVerbose(bool verbose) {
  InitLogger();
  if (verbose) {
    g_logger->set_pattern(kVerbosePattern);
    g_logger->set_level(spdlog::level::debug);
    // One-shot runs exit right after the capture; keep stderr current.
    g_logger->flush_on(spdlog::level::debug);
  } else {
    g_logger->set_pattern(kDefaultPattern);
    g_logger->set_level(spdlog::level::info);
    g_logger->flush_on(spdlog::level::warn);
  }
}

spdlog::level::level_enum ToSpdlogLevel(PortaShotLogLevel level) {
  switch (level) {
    case kPortaShotLogTrace: return spdlog::level::trace;
    case kPortaShotLogDebug: return spdlog::level::debug;
    case kPortaShotLogInfo:  return spdlog::level::info;
    case kPortaShotLogWarn:  return spdlog::level::warn;
    case kPortaShotLogError: return spdlog::level::err;
    case kPortaShotLogFatal: return spdlog::level::critical;
    default:                 return spdlog::level::info;
  }
}

}  // namespace internal
}  // namespace portashot
