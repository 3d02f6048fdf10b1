#pragma once

#include <cstdio>

#ifndef EDITCORE_ENABLE_LOGGING
#define EDITCORE_ENABLE_LOGGING 0
#endif

#if EDITCORE_ENABLE_LOGGING
#define EDITCORE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[editcore] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define EDITCORE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[editcore] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define EDITCORE_LOG_DEBUG(...) do { } while (0)
#define EDITCORE_LOG_WARN(...) do { } while (0)
#endif
