// Copyright 2026 The PortaShot Authors

#include "core/cli.h"

void PrintUsage(std::ostream& os, const char* exe) {
  os << "Usage: " << exe << " [options]\n"
     << "\n"
     << "Without --once, runs in the system tray.\n"
     << "\n"
     << "Options:\n"
     << "  --once                 Take a single screenshot and exit\n"
     << "  --mode <mode>          Capture mode for --once: "
        "fullscreen|region|window (default: fullscreen)\n"
     << "  --format <fmt>         Image format: png|jpg "
        "(this run only)\n"
     << "  --save-dir <path>      Output directory (this run only)\n"
     << "  --config <path>        Config file (default: config.json next "
        "to the executable)\n"
     << "  --verbose              Enable debug logging\n"
     << "  --version              Print version and exit\n"
     << "  --help, -h             Show this help message\n"
     << "\n"
     << "Hotkeys (tray mode):\n"
     << "  Ctrl+Alt+P: capture region\n"
     << "  Ctrl+Alt+F: capture full screen\n"
     << "  Ctrl+Alt+W: capture active window\n";
}

bool ParseCli(int argc, const char* const* argv, CliOptions* out,
              std::string* err) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    bool inline_value = false;
    if (arg.compare(0, 2, "--") == 0) {
      auto eq = arg.find('=');
      if (eq != std::string::npos) {
        value = arg.substr(eq + 1);
        arg = arg.substr(0, eq);
        inline_value = true;
      }
    }

    // Fetch the value of an option that requires one.
    auto take_value = [&](const char* name) {
      if (inline_value) return true;
      if (i + 1 >= argc) {
        *err = std::string(name) + " requires a value";
        return false;
      }
      value = argv[++i];
      return true;
    };

    bool is_flag = arg == "--once" || arg == "--verbose" ||
                   arg == "--version" || arg == "--help";
    if (is_flag && inline_value) {
      *err = arg + " does not take a value";
      return false;
    }

    if (arg == "--once") {
      out->once = true;
    } else if (arg == "--mode") {
      if (!take_value("--mode")) return false;
      if (!ParseCaptureMode(value, &out->mode)) {
        *err = "unknown mode: " + value;
        return false;
      }
    } else if (arg == "--format") {
      if (!take_value("--format")) return false;
      if (!ParseImageFormat(value, &out->format)) {
        *err = "unknown format: " + value;
        return false;
      }
      out->has_format = true;
    } else if (arg == "--save-dir") {
      if (!take_value("--save-dir")) return false;
      if (value.empty()) {
        *err = "--save-dir requires a non-empty path";
        return false;
      }
      out->save_dir = value;
    } else if (arg == "--config") {
      if (!take_value("--config")) return false;
      out->config_path = value;
    } else if (arg == "--verbose") {
      out->verbose = true;
    } else if (arg == "--version") {
      out->show_version = true;
    } else if (arg == "-h" || arg == "--help") {
      out->show_help = true;
    } else {
      *err = "unknown argument: " + std::string(argv[i]);
      return false;
    }
  }
  return true;
}

void ApplyCliOverrides(const CliOptions& options, Config* config) {
  if (options.has_format) config->format = options.format;
  if (!options.save_dir.empty()) config->save_directory = options.save_dir;
}
