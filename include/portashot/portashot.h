// Copyright 2026 The PortaShot Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef PORTASHOT_PORTASHOT_H_
#define PORTASHOT_PORTASHOT_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(_WIN32)
#if defined(PORTASHOT_BUILDING)
#define PORTASHOT_API __declspec(dllexport)
#else
#define PORTASHOT_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define PORTASHOT_API __attribute__((visibility("default")))
#else
#define PORTASHOT_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "portashot/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
//   - Each PortaShotContext is independent.  Calls on the same context are
//     serialized internally, so a context may be shared across threads.
//   - PortaShotImage objects are immutable after creation; reading image
//     properties and data is safe from multiple threads simultaneously.
//   - portashot_clipboard_set_image() must be called from the thread that
//     runs the GTK main loop (if any).
//   - portashot_set_log_level() and portashot_set_log_callback() are
//     process-global and internally synchronized.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct PortaShotContext PortaShotContext;
typedef struct PortaShotImage PortaShotImage;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Error codes returned by portashot functions.
typedef enum PortaShotError {
  kPortaShotOk = 0,
  kPortaShotErrorNotInitialized = -1,
  kPortaShotErrorInvalidParam = -2,
  kPortaShotErrorCaptureFailed = -3,
  kPortaShotErrorPermissionDenied = -4,
  kPortaShotErrorOutOfMemory = -5,
  kPortaShotErrorNotSupported = -6,
  kPortaShotErrorNoActiveWindow = -7,   ///< No focused top-level window
  kPortaShotErrorClipboardFailed = -8,  ///< Clipboard unavailable or refused
  kPortaShotErrorWriteFailed = -9,      ///< Image file could not be written
  kPortaShotErrorUnknown = -99,
} PortaShotError;

/// Log severity levels for the internal logging system.
typedef enum PortaShotLogLevel {
  kPortaShotLogTrace = 0,   ///< Very detailed diagnostic info
  kPortaShotLogDebug = 1,   ///< Debug-level messages
  kPortaShotLogInfo = 2,    ///< Informational messages (default)
  kPortaShotLogWarn = 3,    ///< Warnings
  kPortaShotLogError = 4,   ///< Errors
  kPortaShotLogFatal = 5,   ///< Fatal / critical errors
} PortaShotLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 log message.
/// @param userdata  The opaque pointer passed to portashot_set_log_callback.
typedef void (*portashot_log_callback_t)(PortaShotLogLevel level,
                                         const char* message,
                                         void* userdata);

/// Pixel format of image data.
typedef enum PortaShotPixelFormat {
  kPortaShotFormatBgra8 = 0,   ///< B8G8R8A8 (default, what captures produce)
  kPortaShotFormatRgba8 = 1,   ///< R8G8B8A8
} PortaShotPixelFormat;

/// Encoded image file format.
typedef enum PortaShotImageFormat {
  kPortaShotImageFormatPng = 0,   ///< Lossless
  kPortaShotImageFormatJpeg = 1,  ///< Lossy, quality 1-100
} PortaShotImageFormat;

/// Axis-aligned rectangle in virtual screen coordinates.
typedef struct PortaShotRect {
  int x;       ///< Left edge
  int y;       ///< Top edge
  int width;   ///< Width in pixels
  int height;  ///< Height in pixels
} PortaShotRect;

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

/// Create a new portashot context. The context initializes the platform
/// capture backend. The caller must destroy it with portashot_context_destroy().
///
/// @return A new context, or NULL on failure (e.g. no display).
PORTASHOT_API PortaShotContext* portashot_context_create(void);

/// Destroy a portashot context and release all associated resources.
///
/// @param ctx  Context to destroy. NULL is safely ignored.
PORTASHOT_API void portashot_context_destroy(PortaShotContext* ctx);

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

/// Get the error code from the last failed operation on this context.
PORTASHOT_API PortaShotError portashot_get_last_error(
    const PortaShotContext* ctx);

/// Get a human-readable error message for the last failed operation.
///
/// Lifetime: The returned string is valid until the next API call on the
/// same context.  Copy the string if you need it beyond that.
///
/// @return UTF-8 error message. Never returns NULL.
PORTASHOT_API const char* portashot_get_last_error_message(
    const PortaShotContext* ctx);

// ---------------------------------------------------------------------------
// Screen information
// ---------------------------------------------------------------------------

/// Get the bounding rectangle of the virtual screen (the union of all
/// monitors).
PORTASHOT_API PortaShotError portashot_get_virtual_screen(
    PortaShotContext* ctx, PortaShotRect* out_rect);

/// Resolve the frame rectangle of the currently focused top-level window.
///
/// The window may close or move at any time; the rectangle reflects the
/// moment of the call.
///
/// @return kPortaShotOk, or kPortaShotErrorNoActiveWindow if no focused
///         window could be resolved.
PORTASHOT_API PortaShotError portashot_get_active_window_rect(
    PortaShotContext* ctx, PortaShotRect* out_rect);

// ---------------------------------------------------------------------------
// Capture operations
// ---------------------------------------------------------------------------

/// Capture the whole virtual screen (all monitors) into one image.
///
/// @return Captured image, or NULL on failure. Caller must free with
///         portashot_image_destroy().
PORTASHOT_API PortaShotImage* portashot_capture_virtual_screen(
    PortaShotContext* ctx);

/// Capture a rectangular region in virtual screen coordinates.
///
/// The region is clipped to the virtual screen.
///
/// @return Captured image, or NULL on failure (including an empty region).
PORTASHOT_API PortaShotImage* portashot_capture_region(PortaShotContext* ctx,
                                                       int x, int y, int width,
                                                       int height);

// ---------------------------------------------------------------------------
// Image objects
// ---------------------------------------------------------------------------

/// Create an image from caller-provided pixel data (copied).
///
/// @param width   Width in pixels (> 0).
/// @param height  Height in pixels (> 0).
/// @param stride  Row stride in bytes (>= width * 4).
/// @param format  Pixel layout of `data`.
/// @param data    At least stride * height bytes.
/// @return New image, or NULL on invalid parameters.
PORTASHOT_API PortaShotImage* portashot_image_create(
    int width, int height, int stride, PortaShotPixelFormat format,
    const uint8_t* data);

/// Get image width in pixels.
PORTASHOT_API int portashot_image_get_width(const PortaShotImage* image);

/// Get image height in pixels.
PORTASHOT_API int portashot_image_get_height(const PortaShotImage* image);

/// Get image row stride in bytes.
PORTASHOT_API int portashot_image_get_stride(const PortaShotImage* image);

/// Get the pixel format of the image.
PORTASHOT_API PortaShotPixelFormat portashot_image_get_format(
    const PortaShotImage* image);

/// Get a pointer to the raw pixel data.
/// The returned pointer is valid for the lifetime of the PortaShotImage.
PORTASHOT_API const uint8_t* portashot_image_get_data(
    const PortaShotImage* image);

/// Get the total size of the pixel data in bytes.
PORTASHOT_API size_t portashot_image_get_data_size(
    const PortaShotImage* image);

/// Destroy an image. NULL is safely ignored.
PORTASHOT_API void portashot_image_destroy(PortaShotImage* image);

/// Encode an image and write it to `path`.
///
/// @param quality  JPEG quality, clamped to [1, 100]. Ignored for PNG.
/// @return kPortaShotOk, kPortaShotErrorInvalidParam or
///         kPortaShotErrorWriteFailed.
PORTASHOT_API PortaShotError portashot_image_export(
    const PortaShotImage* image, const char* path,
    PortaShotImageFormat format, int quality);

// ---------------------------------------------------------------------------
// Clipboard
// ---------------------------------------------------------------------------

/// Place an image on the system clipboard (as image data, not a file name).
///
/// @return kPortaShotOk, or kPortaShotErrorClipboardFailed.
PORTASHOT_API PortaShotError portashot_clipboard_set_image(
    PortaShotContext* ctx, const PortaShotImage* image);

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

/// Get the library version as a string (e.g. "1.0.0").
PORTASHOT_API const char* portashot_version_string(void);

/// Get the major version number.
PORTASHOT_API int portashot_version_major(void);

/// Get the minor version number.
PORTASHOT_API int portashot_version_minor(void);

/// Get the patch version number.
PORTASHOT_API int portashot_version_patch(void);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the minimum log level. Messages below this level are discarded.
/// Default: kPortaShotLogInfo.
PORTASHOT_API void portashot_set_log_level(PortaShotLogLevel level);

/// Enable or disable verbose diagnostics.
///
/// Non-zero lowers the level to kPortaShotLogDebug, prefixes every line with
/// a wall-clock timestamp and flushes after each message.  Zero restores the
/// defaults (info level, no timestamp, flush on warnings).
PORTASHOT_API void portashot_set_log_verbose(int verbose);

/// Set a user-defined log callback.
///
/// When a callback is registered, all log messages (at or above the current
/// level) are forwarded to it in addition to stderr.
/// Pass NULL to unregister.
PORTASHOT_API void portashot_set_log_callback(
    portashot_log_callback_t callback, void* userdata);

/// Emit a log message at the given level through the portashot logging
/// system.  Lets applications route their own diagnostics through the same
/// logging pipeline.
///
/// @param level    Severity level.
/// @param message  UTF-8 message. NULL is ignored.
PORTASHOT_API void portashot_log(PortaShotLogLevel level,
                                 const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // PORTASHOT_PORTASHOT_H_
