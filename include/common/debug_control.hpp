#pragma once

#include "common/config.hpp"

#if SAORSA_LOGIC_HAS_STD && !SAORSA_LOGIC_IS_ZKVM
#include <cstdlib>
#include <cstdio>
#include <cstring>
#endif

namespace saorsa_logic {
namespace debug {

/**
 * Debug Control
 *
 * Environment variables:
 * - SAORSA_LOGIC_DEBUG: Enable/disable debug output (rejected inputs,
 *   digest library failures). Set to "1" or "true" to enable, "0" or
 *   "false" (or unset) to disable.
 *
 * Without a standard environment, or inside a zkVM guest, the environment is
 * never read and debug output is compiled out.
 */

#if SAORSA_LOGIC_HAS_STD && !SAORSA_LOGIC_IS_ZKVM

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static const bool enabled = []() {
        const char* env = std::getenv("SAORSA_LOGIC_DEBUG");
        return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
    }();
    return enabled;
}

#else

constexpr bool is_debug_enabled() { return false; }

#endif

} // namespace debug
} // namespace saorsa_logic

#define SAORSA_DEBUG_ENABLED() (saorsa_logic::debug::is_debug_enabled())

#if SAORSA_LOGIC_HAS_STD && !SAORSA_LOGIC_IS_ZKVM

#define SAORSA_DEBUG_PRINT(...) \
    do { \
        if (saorsa_logic::debug::is_debug_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define SAORSA_DEBUG_FPRINTF(stream, ...) \
    do { \
        if (saorsa_logic::debug::is_debug_enabled()) { \
            fprintf(stream, __VA_ARGS__); \
        } \
    } while(0)

#else

#define SAORSA_DEBUG_PRINT(...) do { } while(0)
#define SAORSA_DEBUG_FPRINTF(stream, ...) do { } while(0)

#endif
