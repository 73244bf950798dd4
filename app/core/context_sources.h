// Copyright 2026 The PortaShot Authors
//
// IScreenSource / IImageClipboard backed by a portashot::Context.

#ifndef PORTASHOT_APP_CORE_CONTEXT_SOURCES_H_
#define PORTASHOT_APP_CORE_CONTEXT_SOURCES_H_

#include "core/capture_sources.h"

class ContextScreenSource : public IScreenSource {
 public:
  explicit ContextScreenSource(portashot::Context& ctx) : ctx_(ctx) {}

  bool GetVirtualScreen(SelectionRect* out_rect) override;
  bool GetActiveWindowRect(SelectionRect* out_rect) override;
  portashot::Image GrabRegion(const SelectionRect& rect) override;

 private:
  portashot::Context& ctx_;
};

class ContextClipboard : public IImageClipboard {
 public:
  explicit ContextClipboard(portashot::Context& ctx) : ctx_(ctx) {}

  bool SetImage(const portashot::Image& image) override;

 private:
  portashot::Context& ctx_;
};

#endif  // PORTASHOT_APP_CORE_CONTEXT_SOURCES_H_
