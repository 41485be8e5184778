// diagnostics_json.hpp - JSON serialization for CompareResult diagnostics
#pragma once
#include "deepeq/compare.hpp"
#include <string>

namespace deepeq {

// Escape a string for safe JSON output (quotes included).
std::string json_escape(const std::string& s);

// Serialize a comparison result to a compact JSON string.
std::string divergence_to_json(const CompareResult& r);

// If opts.emit_json (DEEPEQ_DIAG_JSON=1) and r diverged, print its JSON to stderr.
void maybe_print_json(const CompareResult& r, const CompareOptions& opts);

} // namespace deepeq
