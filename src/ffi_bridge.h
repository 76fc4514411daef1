#ifndef FFI_BRIDGE_H
#define FFI_BRIDGE_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
#define DOCSCAN_EXPORT __declspec(dllexport)
#else
#define DOCSCAN_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

// Pixel formats: 0 BGRA, 1 BGR, 2 RGB, 3 RGBA.
// Corner arrays hold 8 floats: tl.x, tl.y, tr.x, tr.y, br.x, br.y, bl.x, bl.y.
// Strings returned as char* are released with docscan_free_string.

// Session lifetime
DOCSCAN_EXPORT void* docscan_session_create(int request_timeout_ms, int live_interval_ms);
DOCSCAN_EXPORT void docscan_session_destroy(void* session);
DOCSCAN_EXPORT char* docscan_session_status(void* session);
DOCSCAN_EXPORT int docscan_session_wait_ready(void* session, int timeout_ms);

// Live detection
DOCSCAN_EXPORT int docscan_push_frame(void* session, const uint8_t* image_data, size_t length,
                                      int width, int height, int format);
DOCSCAN_EXPORT int docscan_live_start(void* session);
DOCSCAN_EXPORT void docscan_live_stop(void* session);
DOCSCAN_EXPORT char* docscan_live_quad(void* session);

// One-shot requests, returning a handle for docscan_take_result.
// The session keeps each handle until it is taken or discarded.
DOCSCAN_EXPORT int64_t docscan_detect(void* session, const uint8_t* image_data, size_t length,
                                      int width, int height, int format);
DOCSCAN_EXPORT int64_t docscan_crop(void* session, const uint8_t* image_data, size_t length,
                                    int width, int height, int format, const float* corners);
DOCSCAN_EXPORT int64_t docscan_capture(void* session, const uint8_t* image_data, size_t length,
                                       int width, int height, int format);
DOCSCAN_EXPORT void docscan_manual_corners(void* session, int width, int height, float* corners_out);

// Null while the request is still pending after wait_ms, or for an unknown handle
DOCSCAN_EXPORT void* docscan_take_result(void* session, int64_t handle, int wait_ms);
// Returns 1 if the handle was known
DOCSCAN_EXPORT int docscan_discard_result(void* session, int64_t handle);

// Result accessors
DOCSCAN_EXPORT int docscan_result_detected(void* result);
DOCSCAN_EXPORT uint8_t* docscan_result_image_data(void* result);
DOCSCAN_EXPORT int docscan_result_width(void* result);
DOCSCAN_EXPORT int docscan_result_height(void* result);
DOCSCAN_EXPORT int docscan_result_channels(void* result);
DOCSCAN_EXPORT int docscan_result_stride(void* result);
DOCSCAN_EXPORT int docscan_result_error_code(void* result);
DOCSCAN_EXPORT const char* docscan_result_error(void* result);
DOCSCAN_EXPORT const char* docscan_result_json(void* result);
DOCSCAN_EXPORT int docscan_result_corners(void* result, float* corners_out);

// Page finishing; returns a new result to free separately
DOCSCAN_EXPORT void* docscan_apply_filter(void* result, int filter, int brightness, int contrast, int sharpness);

// JPEG bytes stay owned by the result; returns the byte count or 0
DOCSCAN_EXPORT int docscan_result_encode_jpeg(void* result, int quality);
DOCSCAN_EXPORT const uint8_t* docscan_result_jpeg_data(void* result);

DOCSCAN_EXPORT void docscan_free_result(void* result);
DOCSCAN_EXPORT void docscan_free_string(char* str);
DOCSCAN_EXPORT const char* docscan_get_version(void);

#ifdef __cplusplus
}
#endif

#endif // FFI_BRIDGE_H
