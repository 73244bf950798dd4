// Copyright 2026 The PortaShot Authors
//
// Persistence & clipboard sink: writes a capture to disk and copies it to the
// clipboard.  The two steps are independent and both always run.

#ifndef PORTASHOT_APP_CORE_CAPTURE_SINK_H_
#define PORTASHOT_APP_CORE_CAPTURE_SINK_H_

#include <string>

#include "core/capture_sources.h"
#include "core/capture_types.h"
#include "core/config_store.h"

/// "Screenshot_YYYYMMDD_HHMMSS_uuuuuu.<ext>" in local time.
std::string MakeScreenshotFileName(CaptureClock::time_point timestamp,
                                   ImageFormat format);

class ICaptureSink {
 public:
  virtual ~ICaptureSink() = default;

  /// Takes ownership of the capture.
  virtual StoreReport Store(CaptureResult result, const Config& config) = 0;

 protected:
  ICaptureSink() = default;

 private:
  ICaptureSink(const ICaptureSink&) = delete;
  ICaptureSink& operator=(const ICaptureSink&) = delete;
};

class FileClipboardSink : public ICaptureSink {
 public:
  /// `clipboard` must outlive the sink.
  explicit FileClipboardSink(IImageClipboard* clipboard)
      : clipboard_(clipboard) {}

  StoreReport Store(CaptureResult result, const Config& config) override;

 private:
  bool WriteFile(const portashot::Image& image, const Config& config,
                 const std::string& path);

  IImageClipboard* clipboard_;
};

#endif  // PORTASHOT_APP_CORE_CAPTURE_SINK_H_
