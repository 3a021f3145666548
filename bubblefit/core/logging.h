#pragma once

#include <cstdio>

#ifndef BUBBLEFIT_ENABLE_LOGGING
#define BUBBLEFIT_ENABLE_LOGGING 0
#endif

#if BUBBLEFIT_ENABLE_LOGGING
#define BUBBLEFIT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[bubblefit] debug: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define BUBBLEFIT_LOG_INFO(...) \
    do { \
        std::fprintf(stderr, "[bubblefit] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define BUBBLEFIT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[bubblefit] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define BUBBLEFIT_LOG_DEBUG(...) do { } while (0)
#define BUBBLEFIT_LOG_INFO(...) do { } while (0)
#define BUBBLEFIT_LOG_WARN(...) do { } while (0)
#endif
