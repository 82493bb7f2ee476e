#pragma once

namespace paramdec {

// Decoder configuration sourced from the process environment.
struct DecodeEnv {
    bool trace = false;       // PARAMDEC_TRACE
    bool suggest = true;      // PARAMDEC_SUGGEST (0 disables)
    bool diag_json = false;   // PARAMDEC_DIAG_JSON
};

// True when the variable is set and starts with 1/t/T/y/Y.
bool env_flag_enabled(const char* name);

// Read all PARAMDEC_* variables. Called once per Decoder; later changes to the
// environment only affect Decoders constructed afterwards.
DecodeEnv detect_env();

} // namespace paramdec
