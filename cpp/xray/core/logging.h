#pragma once

#include <cstdio>

#ifndef XRAY_ENABLE_LOGGING
#define XRAY_ENABLE_LOGGING 0
#endif

#if XRAY_ENABLE_LOGGING
#define XRAY_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[xray] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define XRAY_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[xray][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define XRAY_LOG_DEBUG(...) do { } while (0)
#define XRAY_LOG_WARN(...) do { } while (0)
#endif
