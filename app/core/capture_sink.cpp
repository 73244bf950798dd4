// Copyright 2026 The PortaShot Authors

#include "core/capture_sink.h"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <system_error>

#include "core/app_log.h"

std::string MakeScreenshotFileName(CaptureClock::time_point timestamp,
                                   ImageFormat format) {
  auto since_epoch = timestamp.time_since_epoch();
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs);
  std::time_t tt = static_cast<std::time_t>(secs.count());

  struct tm local = {};
  localtime_r(&tt, &local);

  char stamp[32] = {};
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);

  char name[96] = {};
  std::snprintf(name, sizeof(name), "Screenshot_%s_%06lld.%s", stamp,
                static_cast<long long>(micros.count()),
                ImageFormatName(format));
  return name;
}

StoreReport FileClipboardSink::Store(CaptureResult result,
                                     const Config& config) {
  StoreReport report;
  report.width = result.image.width();
  report.height = result.image.height();

  std::string path = config.save_directory + "/" +
                     MakeScreenshotFileName(result.timestamp, config.format);
  if (WriteFile(result.image, config, path)) {
    report.saved_path = path;
  } else {
    report.disk_error = true;
  }

  if (!clipboard_ || !clipboard_->SetImage(result.image)) {
    report.clipboard_error = true;
  }

  if (report.ok()) {
    APP_LOG_INFO("Saved {} ({}x{}) and copied to clipboard", path,
                 report.width, report.height);
  } else {
    APP_LOG_WARN("Capture stored with errors: {}", report.FailureSummary());
  }
  return report;
}

bool FileClipboardSink::WriteFile(const portashot::Image& image,
                                  const Config& config,
                                  const std::string& path) {
  std::error_code ec;
  std::filesystem::create_directories(config.save_directory, ec);
  if (ec) {
    APP_LOG_ERROR("Cannot create directory {}: {}", config.save_directory,
                  ec.message());
    return false;
  }

  PortaShotImageFormat format = config.format == ImageFormat::kJpg
                                    ? kPortaShotImageFormatJpeg
                                    : kPortaShotImageFormatPng;
  try {
    image.Export(path, format, config.jpg_quality);
  } catch (const portashot::Error& e) {
    APP_LOG_ERROR("Writing {} failed: {}", path, e.what());
    return false;
  }
  return true;
}
