#pragma once

#include <cstdio>

#ifndef BALLOON_ENABLE_LOGGING
#define BALLOON_ENABLE_LOGGING 0
#endif

#if BALLOON_ENABLE_LOGGING
#define BALLOON_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[balloon] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define BALLOON_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[balloon][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define BALLOON_LOG_DEBUG(...) do { } while (0)
#define BALLOON_LOG_WARN(...) do { } while (0)
#endif
