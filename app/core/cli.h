// Copyright 2026 The PortaShot Authors
//
// Command-line parsing for the portashot executable.

#ifndef PORTASHOT_APP_CORE_CLI_H_
#define PORTASHOT_APP_CORE_CLI_H_

#include <ostream>
#include <string>

#include "core/capture_types.h"
#include "core/config_store.h"

struct CliOptions {
  bool once = false;
  CaptureMode mode = CaptureMode::kFullscreen;

  // Per-invocation overrides; never persisted.
  bool has_format = false;
  ImageFormat format = ImageFormat::kPng;
  std::string save_dir;

  std::string config_path;  // empty: next to the executable
  bool verbose = false;
  bool show_version = false;
  bool show_help = false;
};

/// Exit code for command-line usage errors.
static constexpr int kExitUsage = 2;

/// Parse argv.  Accepts "--opt value" and "--opt=value".  On failure returns
/// false with a one-line reason in `err`.
bool ParseCli(int argc, const char* const* argv, CliOptions* out,
              std::string* err);

void PrintUsage(std::ostream& os, const char* exe);

/// Apply the per-invocation overrides to a loaded config.
void ApplyCliOverrides(const CliOptions& options, Config* config);

#endif  // PORTASHOT_APP_CORE_CLI_H_
