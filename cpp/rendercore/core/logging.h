#pragma once

#include <cstdio>

#ifndef RENDERCORE_ENABLE_LOGGING
#define RENDERCORE_ENABLE_LOGGING 0
#endif

#if RENDERCORE_ENABLE_LOGGING
#define RENDERCORE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[rendercore] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define RENDERCORE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[rendercore][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define RENDERCORE_LOG_DEBUG(...) do { } while (0)
#define RENDERCORE_LOG_WARN(...) do { } while (0)
#endif
