// diagnostics_json.hpp - JSON serialization for DecodeResult
#pragma once
#include "paramdec/env.hpp"
#include "paramdec/errors.hpp"
#include <string>

namespace paramdec {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const DecodeResult& r);

// If env.diag_json is set and r failed, print diagnostics JSON to stderr.
void maybe_print_json(const DecodeResult& r, const DecodeEnv& env);

} // namespace paramdec
