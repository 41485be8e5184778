// config.hpp - comparison options and environment feature flags
#pragma once
#include "deepeq/divergence.hpp"
#include <cstdlib>

namespace deepeq {

// How two leaves of the same type are compared once NaN has been ruled out.
// Rendering compares canonical text (two leaves that render alike are equal);
// Typed compares payloads with ==.
enum class LeafMode { Rendering, Typed };

struct CompareOptions {
    LeafMode leaf_mode = LeafMode::Rendering;
    Wording wording;
    bool trace = false;     // [dbg] walker lines on stderr
    bool emit_json = false; // JSON diagnostics on stderr for each divergence

    // DEEPEQ_LEAF_COMPARE=typed|rendering, DEEPEQ_DEBUG_WALK=1, DEEPEQ_DIAG_JSON=1
    static CompareOptions from_env();
};

namespace detail {
    // Feature flags sourced from environment
    inline bool env_flag_enabled(const char* name){
        const char* v = std::getenv(name);
        return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
    }
}

} // namespace deepeq
