#pragma once

#include <cstdio>

#ifndef FOLIO_ENABLE_LOGGING
#define FOLIO_ENABLE_LOGGING 0
#endif

#if FOLIO_ENABLE_LOGGING
#define FOLIO_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[folio] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define FOLIO_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[folio][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define FOLIO_LOG_DEBUG(...) do { } while (0)
#define FOLIO_LOG_WARN(...) do { } while (0)
#endif
