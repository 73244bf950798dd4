// Copyright 2026 The PortaShot Authors

#include "platform/linux/x11_capture_backend.h"

#if defined(__linux__)

#include <cstring>
#include <vector>

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/Xatom.h>

#include "core/image.h"
#include "core/logger.h"

namespace portashot {
namespace internal {

namespace {

// BadWindow / BadDrawable are expected when the focused window closes while
// we query it; record the failure instead of letting Xlib exit the process.
bool g_x_error = false;

int TrapXError(Display* /*dpy*/, XErrorEvent* /*ev*/) {
  g_x_error = true;
  return 0;
}

class XErrorTrap {
 public:
  explicit XErrorTrap(Display* dpy) : dpy_(dpy) {
    XSync(dpy_, False);
    g_x_error = false;
    previous_ = XSetErrorHandler(TrapXError);
  }
  ~XErrorTrap() {
    XSync(dpy_, False);
    XSetErrorHandler(previous_);
  }

  bool failed() {
    XSync(dpy_, False);
    return g_x_error;
  }

 private:
  Display* dpy_;
  int (*previous_)(Display*, XErrorEvent*) = nullptr;
};

std::unique_ptr<Image> XImageToImage(XImage* ximg) {
  if (!ximg) return nullptr;

  int w = ximg->width;
  int h = ximg->height;
  int stride = w * 4;
  std::vector<uint8_t> pixels(static_cast<size_t>(stride) * h);

  // Fast path: 32bpp little-endian with standard RGB masks (most common).
  // In-memory layout is already B G R pad; copy and set alpha.
  if (ximg->bits_per_pixel == 32 && ximg->byte_order == LSBFirst &&
      ximg->red_mask == 0xFF0000 && ximg->green_mask == 0x00FF00 &&
      ximg->blue_mask == 0x0000FF) {
    for (int y = 0; y < h; ++y) {
      const uint8_t* src =
          reinterpret_cast<const uint8_t*>(ximg->data) +
          static_cast<ptrdiff_t>(y) * ximg->bytes_per_line;
      uint8_t* dst = pixels.data() + static_cast<ptrdiff_t>(y) * stride;
      std::memcpy(dst, src, static_cast<size_t>(w) * 4);
      for (int x = 0; x < w; ++x) dst[x * 4 + 3] = 0xFF;
    }
  } else {
    // Generic fallback via XGetPixel.
    for (int y = 0; y < h; ++y) {
      uint8_t* dst = pixels.data() + static_cast<ptrdiff_t>(y) * stride;
      for (int x = 0; x < w; ++x) {
        unsigned long px = XGetPixel(ximg, x, y);
        dst[x * 4 + 0] = static_cast<uint8_t>((px >> 0) & 0xFF);
        dst[x * 4 + 1] = static_cast<uint8_t>((px >> 8) & 0xFF);
        dst[x * 4 + 2] = static_cast<uint8_t>((px >> 16) & 0xFF);
        dst[x * 4 + 3] = 0xFF;
      }
    }
  }

  return Image::CreateFromData(w, h, stride, kPortaShotFormatBgra8,
                               std::move(pixels));
}

// Read a single-window property such as _NET_ACTIVE_WINDOW.
Window GetWindowProperty(Display* dpy, Window w, const char* name) {
  Atom atom = XInternAtom(dpy, name, True);
  if (atom == None) return None;

  Atom type;
  int fmt;
  unsigned long items, after;
  unsigned char* data = nullptr;
  Window result = None;
  if (XGetWindowProperty(dpy, w, atom, 0, 1, False, XA_WINDOW, &type, &fmt,
                         &items, &after, &data) == Success &&
      data) {
    if (items == 1 && fmt == 32) result = *reinterpret_cast<Window*>(data);
    XFree(data);
  }
  return result;
}

// _NET_FRAME_EXTENTS: left, right, top, bottom decoration sizes.
bool GetFrameExtents(Display* dpy, Window w, long extents[4]) {
  Atom atom = XInternAtom(dpy, "_NET_FRAME_EXTENTS", True);
  if (atom == None) return false;

  Atom type;
  int fmt;
  unsigned long items, after;
  unsigned char* data = nullptr;
  bool ok = false;
  if (XGetWindowProperty(dpy, w, atom, 0, 4, False, XA_CARDINAL, &type, &fmt,
                         &items, &after, &data) == Success &&
      data) {
    if (items == 4 && fmt == 32) {
      const long* v = reinterpret_cast<const long*>(data);
      for (int i = 0; i < 4; ++i) extents[i] = v[i];
      ok = true;
    }
    XFree(data);
  }
  return ok;
}

}  // namespace

X11CaptureBackend::X11CaptureBackend() = default;
X11CaptureBackend::~X11CaptureBackend() { Shutdown(); }

bool X11CaptureBackend::Initialize() {
  if (initialized_) return true;
  Display* dpy = XOpenDisplay(nullptr);
  if (!dpy) {
    PORTASHOT_LOG_ERROR("Failed to open X11 display");
    return false;
  }
  display_ = dpy;
  initialized_ = true;
  return true;
}

void X11CaptureBackend::Shutdown() {
  if (display_) {
    XCloseDisplay(static_cast<Display*>(display_));
    display_ = nullptr;
  }
  initialized_ = false;
}

// -----------------------------------------------------------------------

PortaShotRect X11CaptureBackend::GetVirtualScreen() {
  PortaShotRect r{};
  if (!initialized_) return r;

  auto* dpy = static_cast<Display*>(display_);
  int scr = DefaultScreen(dpy);
  r.width = DisplayWidth(dpy, scr);
  r.height = DisplayHeight(dpy, scr);
  return r;
}

bool X11CaptureBackend::GetActiveWindowRect(PortaShotRect* out_rect) {
  if (!initialized_ || !out_rect) return false;

  auto* dpy = static_cast<Display*>(display_);
  Window root = DefaultRootWindow(dpy);

  Window active = GetWindowProperty(dpy, root, "_NET_ACTIVE_WINDOW");
  if (active == None) {
    int revert = 0;
    XGetInputFocus(dpy, &active, &revert);
    if (active == PointerRoot) active = None;
  }
  if (active == None || active == root) {
    PORTASHOT_LOG_DEBUG("No focused top-level window");
    return false;
  }

  XErrorTrap trap(dpy);

  XWindowAttributes attrs;
  if (!XGetWindowAttributes(dpy, active, &attrs) || trap.failed()) {
    PORTASHOT_LOG_DEBUG("Active window 0x{:x} vanished",
                        static_cast<unsigned long>(active));
    return false;
  }
  if (attrs.map_state != IsViewable) return false;

  int abs_x = 0, abs_y = 0;
  Window child;
  XTranslateCoordinates(dpy, active, root, 0, 0, &abs_x, &abs_y, &child);
  if (trap.failed()) return false;

  int x = abs_x;
  int y = abs_y;
  int w = attrs.width;
  int h = attrs.height;

  // Include window-manager decorations, like the frame rectangle users see.
  long ext[4] = {0, 0, 0, 0};
  if (GetFrameExtents(dpy, active, ext) && !trap.failed()) {
    x -= static_cast<int>(ext[0]);
    y -= static_cast<int>(ext[2]);
    w += static_cast<int>(ext[0] + ext[1]);
    h += static_cast<int>(ext[2] + ext[3]);
  }

  if (w <= 0 || h <= 0) return false;
  *out_rect = PortaShotRect{x, y, w, h};
  return true;
}

std::unique_ptr<Image> X11CaptureBackend::CaptureRegion(int x, int y,
                                                        int width,
                                                        int height) {
  if (!initialized_) return nullptr;

  auto* dpy = static_cast<Display*>(display_);
  int scr = DefaultScreen(dpy);
  Window root = RootWindow(dpy, scr);
  int scr_w = DisplayWidth(dpy, scr);
  int scr_h = DisplayHeight(dpy, scr);

  if (x < 0) { width += x; x = 0; }
  if (y < 0) { height += y; y = 0; }
  if (x + width > scr_w) width = scr_w - x;
  if (y + height > scr_h) height = scr_h - y;
  if (width <= 0 || height <= 0) return nullptr;

  XImage* ximg = XGetImage(dpy, root, x, y, width, height,
                           AllPlanes, ZPixmap);
  if (!ximg) {
    PORTASHOT_LOG_ERROR("XGetImage failed for region capture");
    return nullptr;
  }

  auto img = XImageToImage(ximg);
  XDestroyImage(ximg);
  return img;
}

// Factory function.
std::unique_ptr<CaptureBackend> CreatePlatformBackend() {
  return std::make_unique<X11CaptureBackend>();
}

}  // namespace internal
}  // namespace portashot

#endif  // __linux__
