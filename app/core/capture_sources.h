// Copyright 2026 The PortaShot Authors
//
// Seams between the capture coordinator and the desktop:
//
//   IScreenSource    pixels and window geometry (portashot::Context)
//   IRegionSelector  interactive rectangle selection (GTK overlay)
//   IImageClipboard  system clipboard (portashot::Context)

#ifndef PORTASHOT_APP_CORE_CAPTURE_SOURCES_H_
#define PORTASHOT_APP_CORE_CAPTURE_SOURCES_H_

#include <memory>

#include "core/capture_types.h"
#include "core/selection_session.h"

class IScreenSource {
 public:
  virtual ~IScreenSource() = default;

  /// Bounds of the union of all monitors.
  virtual bool GetVirtualScreen(SelectionRect* out_rect) = 0;

  /// Frame rectangle of the focused top-level window, at call time.
  /// Returns false when there is none.
  virtual bool GetActiveWindowRect(SelectionRect* out_rect) = 0;

  /// Grab `rect` from the virtual screen.  Returns an empty image on failure.
  virtual portashot::Image GrabRegion(const SelectionRect& rect) = 0;

 protected:
  IScreenSource() = default;

 private:
  IScreenSource(const IScreenSource&) = delete;
  IScreenSource& operator=(const IScreenSource&) = delete;
};

class IRegionSelector {
 public:
  virtual ~IRegionSelector() = default;

  /// Run a modal selection and return once the user commits or cancels.
  /// The selector must be fully torn down when this returns.
  virtual SelectionOutcome SelectRegion() = 0;

 protected:
  IRegionSelector() = default;

 private:
  IRegionSelector(const IRegionSelector&) = delete;
  IRegionSelector& operator=(const IRegionSelector&) = delete;
};

class IImageClipboard {
 public:
  virtual ~IImageClipboard() = default;

  /// Place the image on the clipboard as image data.  Returns true on success.
  virtual bool SetImage(const portashot::Image& image) = 0;

 protected:
  IImageClipboard() = default;

 private:
  IImageClipboard(const IImageClipboard&) = delete;
  IImageClipboard& operator=(const IImageClipboard&) = delete;
};

#endif  // PORTASHOT_APP_CORE_CAPTURE_SOURCES_H_
