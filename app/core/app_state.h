// Copyright 2026 The PortaShot Authors
//
// AppState: everything the running application owns, held by the event
// loop.  Members are declared so that dependents are destroyed before the
// objects they point to.

#ifndef PORTASHOT_APP_CORE_APP_STATE_H_
#define PORTASHOT_APP_CORE_APP_STATE_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/capture_coordinator.h"
#include "core/capture_sink.h"
#include "core/capture_sources.h"
#include "core/cli.h"
#include "core/config_store.h"
#include "core/hotkey_registrar.h"
#include "core/platform_hotkey.h"
#include "portashot/portashot.hpp"

struct AppState {
  explicit AppState(std::string config_path)
      : config(std::move(config_path)) {}

  ConfigStore config;

  // Command-line overrides, applied on top of `config` but never saved.
  bool has_format_override = false;
  ImageFormat format_override = ImageFormat::kPng;
  std::string save_dir_override;

  std::unique_ptr<portashot::Context> context;
  std::unique_ptr<IScreenSource> screen;
  std::unique_ptr<IImageClipboard> clipboard;
  std::unique_ptr<IRegionSelector> selector;
  std::unique_ptr<ICaptureSink> sink;
  std::unique_ptr<CaptureCoordinator> coordinator;

  std::unique_ptr<IPlatformHotkey> hotkey_platform;
  std::unique_ptr<HotkeyRegistrar> hotkeys;
  std::vector<HotkeyHandle> hotkey_handles;

  /// Copy the per-invocation overrides out of the parsed command line.
  void SetOverrides(const CliOptions& options) {
    has_format_override = options.has_format;
    format_override = options.format;
    save_dir_override = options.save_dir;
  }

  /// Config used for the next capture: the stored config plus overrides.
  Config EffectiveConfig() const {
    Config effective = config.config();
    if (has_format_override) effective.format = format_override;
    if (!save_dir_override.empty())
      effective.save_directory = save_dir_override;
    return effective;
  }
};

#endif  // PORTASHOT_APP_CORE_APP_STATE_H_
