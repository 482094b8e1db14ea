#pragma once

// ============================================================================
// DirGen Core Header
// ============================================================================
// Included by every .cpp in the control plane. Provides:
// - Global process flags
// - Logging and debug tracing
// - Standard library headers used throughout the codebase
// ============================================================================

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <chrono>
#include <filesystem>

#include "logger.h"
#include "debug.h"

// ============================================================================
// Global System Flags
// ============================================================================
// Defined in main.cpp (stubbed in tests/test_stubs.cpp)

// Debug level (0=off, 1-9=increasing verbosity) - used by dprintf() macro
extern int g_debug_level;

// ============================================================================
// Common Utilities
// ============================================================================

#define DIRGEN_VERSION "0.4.0"

namespace dirgen {
    // Current Unix timestamp in seconds
    inline int64_t get_current_timestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    // ISO-8601 UTC rendering of a wall clock time point
    std::string format_iso_time(std::chrono::system_clock::time_point tp);

    // Random identifier: prefix followed by a v4-style UUID
    std::string generate_id(const std::string& prefix);

    // Lowercase copy of s
    std::string to_lower(const std::string& s);

    // Truncate for log lines
    std::string truncate(const std::string& s, size_t max_len);
}
