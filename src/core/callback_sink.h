// Copyright 2026 The PortaShot Authors

#ifndef PORTASHOT_CORE_CALLBACK_SINK_H_
#define PORTASHOT_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "portashot/portashot.h"

namespace portashot {
namespace internal {

/// spdlog sink that forwards formatted messages to the user C callback
/// registered with portashot_set_log_callback().
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  CallbackSink() = default;

  /// Passing nullptr as callback disables forwarding.
  void SetCallback(portashot_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(spdlog::sinks::base_sink<std::mutex>::mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;

    spdlog::memory_buf_t formatted;
    spdlog::sinks::base_sink<std::mutex>::formatter_->format(msg, formatted);
    std::string text(formatted.data(), formatted.size());
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
      text.pop_back();

    callback_(MapLevel(msg.level), text.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  static PortaShotLogLevel MapLevel(spdlog::level::level_enum lvl) {
    switch (lvl) {
      case spdlog::level::trace:    return kPortaShotLogTrace;
      case spdlog::level::debug:    return kPortaShotLogDebug;
      case spdlog::level::info:     return kPortaShotLogInfo;
      case spdlog::level::warn:     return kPortaShotLogWarn;
      case spdlog::level::err:      return kPortaShotLogError;
      case spdlog::level::critical: return kPortaShotLogFatal;
      case spdlog::level::off:      return kPortaShotLogFatal;
      default:                      return kPortaShotLogInfo;
    }
  }

  portashot_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace portashot

#endif  // PORTASHOT_CORE_CALLBACK_SINK_H_
