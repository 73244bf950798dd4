// Copyright 2026 The PortaShot Authors
//
// PortaShot -- tray screenshot tool with region / full screen / window
// capture and a one-shot command-line mode.
// Entry point: parses the command line, builds the capture stack and hands
// over to either one-shot mode or the platform tray application.

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <gtk/gtk.h>

#include <iostream>
#include <memory>

#include "core/app_log.h"
#include "core/app_state.h"
#include "core/cli.h"
#include "core/context_sources.h"
#include "core/one_shot.h"
#include "platform/linux/linux_application.h"
#include "platform/linux/linux_capture_overlay.h"

// Creates the library context and everything the coordinator depends on.
static bool BuildCaptureStack(AppState* state) {
  try {
    state->context = std::make_unique<portashot::Context>();
  } catch (const portashot::Error& e) {
    std::cerr << "FATAL: cannot initialize screen capture: " << e.what()
              << "\n";
    return false;
  }
  state->screen = std::make_unique<ContextScreenSource>(*state->context);
  state->clipboard = std::make_unique<ContextClipboard>(*state->context);
  state->selector = std::make_unique<CaptureOverlay>(state->screen.get());
  state->sink = std::make_unique<FileClipboardSink>(state->clipboard.get());
  state->coordinator = std::make_unique<CaptureCoordinator>(
      state->screen.get(), state->selector.get(), state->sink.get());
  return true;
}

int main(int argc, char** argv) {
  CliOptions options;
  std::string err;
  if (!ParseCli(argc, argv, &options, &err)) {
    std::cerr << argv[0] << ": " << err << "\n\n";
    PrintUsage(std::cerr, argv[0]);
    return kExitUsage;
  }
  if (options.show_help) {
    PrintUsage(std::cout, argv[0]);
    return kExitOk;
  }
  if (options.show_version) {
    std::cout << "portashot " << portashot::version_string() << "\n";
    return kExitOk;
  }
  if (options.verbose) portashot_set_log_verbose(1);

  AppState state(options.config_path.empty() ? ConfigStore::DefaultPath()
                                             : options.config_path);
  state.config.Load();
  state.SetOverrides(options);

  if (!gtk_init_check(&argc, &argv)) {
    std::cerr << "FATAL: cannot open display (GTK initialization failed)\n";
    return kExitStartupError;
  }
  if (!BuildCaptureStack(&state)) return kExitStartupError;

  if (options.once) {
    APP_LOG_DEBUG("One-shot capture ({})", CaptureModeName(options.mode));
    return RunOneShot(state.coordinator.get(), state.EffectiveConfig(),
                      options.mode, std::cout, std::cerr);
  }

  LinuxApplication app(&state);
  if (!app.Init()) return kExitStartupError;
  int ret = app.Run();
  std::cout << "\nExiting...\n";
  return ret;
}

#else

#include <cstdio>

int main() {
  std::printf("This platform is not yet supported.\n");
  return 0;
}

#endif  // __linux__
