#pragma once

// ============================================================================
// mcpgroup Core Header
// ============================================================================
// Common includes and small utilities shared by the MCP supervisor sources.
// Include this in all .cpp files to get access to:
// - Common logging facilities
// - Standard library headers used throughout the codebase
// ============================================================================

// Standard library headers (used in 50%+ of source files)
#include <string>
#include <iostream>
#include <vector>
#include <map>
#include <memory>
#include <chrono>
#include <cstdlib>

// Core headers
#include "logger.h"

// ============================================================================
// Common Utilities
// ============================================================================

namespace mcpgroup {
    // Read an environment variable, empty string when unset
    inline std::string get_env(const std::string& name) {
        const char* value = getenv(name.c_str());
        return value ? std::string(value) : std::string();
    }

    // Milliseconds as text for log lines
    inline std::string format_ms(std::chrono::milliseconds ms) {
        return std::to_string(ms.count()) + "ms";
    }

    // Cap a string for debug output
    inline std::string truncate_for_log(const std::string& text, size_t max_len = 500) {
        if (text.length() <= max_len) {
            return text;
        }
        return text.substr(0, max_len) + "... [truncated " +
               std::to_string(text.length() - max_len) + " chars]";
    }
}
