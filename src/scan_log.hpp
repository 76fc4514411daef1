#ifndef SCAN_LOG_HPP
#define SCAN_LOG_HPP

#include <cstdio>

#ifdef __ANDROID__
#include <android/log.h>
#define DOCSCAN_LOG_TAG "DocumentScanner"
#define DOCSCAN_LOGI(...) __android_log_print(ANDROID_LOG_INFO, DOCSCAN_LOG_TAG, __VA_ARGS__)
#define DOCSCAN_LOGW(...) __android_log_print(ANDROID_LOG_WARN, DOCSCAN_LOG_TAG, __VA_ARGS__)
#define DOCSCAN_LOGE(...) __android_log_print(ANDROID_LOG_ERROR, DOCSCAN_LOG_TAG, __VA_ARGS__)
#ifdef DOCSCAN_VERBOSE
#define DOCSCAN_LOGD(...) __android_log_print(ANDROID_LOG_DEBUG, DOCSCAN_LOG_TAG, __VA_ARGS__)
#else
#define DOCSCAN_LOGD(...) do {} while(0)
#endif
#else
// iOS/macOS/desktop: quiet unless DOCSCAN_VERBOSE, errors go to stderr
#define DOCSCAN_LOG_PRINT(level, ...) \
    do { \
        fprintf(stderr, "[DocumentScanner] %s ", level); \
        fprintf(stderr, __VA_ARGS__); \
        fputc('\n', stderr); \
    } while(0)
#define DOCSCAN_LOGE(...) DOCSCAN_LOG_PRINT("E", __VA_ARGS__)
#ifdef DOCSCAN_VERBOSE
#define DOCSCAN_LOGI(...) DOCSCAN_LOG_PRINT("I", __VA_ARGS__)
#define DOCSCAN_LOGW(...) DOCSCAN_LOG_PRINT("W", __VA_ARGS__)
#define DOCSCAN_LOGD(...) DOCSCAN_LOG_PRINT("D", __VA_ARGS__)
#else
#define DOCSCAN_LOGI(...) do {} while(0)
#define DOCSCAN_LOGW(...) do {} while(0)
#define DOCSCAN_LOGD(...) do {} while(0)
#endif
#endif

#endif // SCAN_LOG_HPP
