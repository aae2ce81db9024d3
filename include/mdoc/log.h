#pragma once

/// Logging macros for the document engine.
/// All output goes to stderr; debug lines only when MDOC_DEBUG_LOG is defined.

#include <cstdio>

#ifdef MDOC_DEBUG_LOG
#define MDOC_LOGD(fmt, ...) fprintf(stderr, "[mdoc D] " fmt "\n", ##__VA_ARGS__)
#else
#define MDOC_LOGD(fmt, ...) ((void)0)
#endif

#define MDOC_LOGI(fmt, ...) fprintf(stderr, "[mdoc I] " fmt "\n", ##__VA_ARGS__)
#define MDOC_LOGW(fmt, ...) fprintf(stderr, "[mdoc W] " fmt "\n", ##__VA_ARGS__)
