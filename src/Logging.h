#ifndef DLNACAST_LOGGING_H
#define DLNACAST_LOGGING_H

#include <iostream>

// ============================================================================
// Logging system - g_verbose is switched on by --verbose
// ============================================================================
extern bool g_verbose;

#define DEBUG_LOG(x) do { \
    if (g_verbose) { \
        std::cout << x << std::endl; \
    } \
} while(0)

#endif // DLNACAST_LOGGING_H
