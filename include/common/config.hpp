#pragma once

/**
 * Compile-time configuration axes
 *
 * The build selects these with compile definitions (see the SAORSA_LOGIC_*
 * CMake options):
 * - SAORSA_LOGIC_STD:   a standard runtime environment is present
 * - SAORSA_LOGIC_ALLOC: dynamic allocation is available
 * - SAORSA_LOGIC_ZKVM:  generic constrained executor (zkVM guest)
 * - SAORSA_LOGIC_SP1 / SAORSA_LOGIC_RISC0: vendor tuning, implies ZKVM
 *
 * Every combination produces bit-identical outputs; only internal strategy
 * changes.
 */

#if defined(SAORSA_LOGIC_SP1) && SAORSA_LOGIC_SP1 && defined(SAORSA_LOGIC_RISC0) && SAORSA_LOGIC_RISC0
#error "SAORSA_LOGIC_SP1 and SAORSA_LOGIC_RISC0 are mutually exclusive"
#endif

#if defined(SAORSA_LOGIC_SP1) && SAORSA_LOGIC_SP1
#define SAORSA_LOGIC_ZKVM_TARGET 1
#elif defined(SAORSA_LOGIC_RISC0) && SAORSA_LOGIC_RISC0
#define SAORSA_LOGIC_ZKVM_TARGET 2
#else
#define SAORSA_LOGIC_ZKVM_TARGET 0
#endif

#if SAORSA_LOGIC_ZKVM_TARGET != 0 || (defined(SAORSA_LOGIC_ZKVM) && SAORSA_LOGIC_ZKVM)
#define SAORSA_LOGIC_IS_ZKVM 1
#else
#define SAORSA_LOGIC_IS_ZKVM 0
#endif

#if defined(SAORSA_LOGIC_STD) && SAORSA_LOGIC_STD
#define SAORSA_LOGIC_HAS_STD 1
#else
#define SAORSA_LOGIC_HAS_STD 0
#endif

// std implies alloc
#if SAORSA_LOGIC_HAS_STD || (defined(SAORSA_LOGIC_ALLOC) && SAORSA_LOGIC_ALLOC)
#define SAORSA_LOGIC_HAS_ALLOC 1
#else
#define SAORSA_LOGIC_HAS_ALLOC 0
#endif

#if defined(_OPENMP) && !SAORSA_LOGIC_IS_ZKVM
#define SAORSA_LOGIC_PARALLEL 1
#else
#define SAORSA_LOGIC_PARALLEL 0
#endif

namespace saorsa_logic {

enum class ZkvmTarget {
    None,
    Sp1,
    Risc0,
};

struct BuildConfig {
    bool has_std;
    bool has_alloc;
    bool zkvm;
    bool parallel;
    ZkvmTarget target;
};

constexpr BuildConfig build_config() {
    return BuildConfig{
        SAORSA_LOGIC_HAS_STD != 0,
        SAORSA_LOGIC_HAS_ALLOC != 0,
        SAORSA_LOGIC_IS_ZKVM != 0,
        SAORSA_LOGIC_PARALLEL != 0,
#if SAORSA_LOGIC_ZKVM_TARGET == 1
        ZkvmTarget::Sp1,
#elif SAORSA_LOGIC_ZKVM_TARGET == 2
        ZkvmTarget::Risc0,
#else
        ZkvmTarget::None,
#endif
    };
}

inline const char* to_string(ZkvmTarget target) {
    switch (target) {
        case ZkvmTarget::Sp1: return "sp1";
        case ZkvmTarget::Risc0: return "risc0";
        case ZkvmTarget::None: break;
    }
    return "none";
}

} // namespace saorsa_logic
