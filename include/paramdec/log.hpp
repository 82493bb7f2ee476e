#pragma once

#include <cstdarg>

namespace paramdec::log {
void trace(const char* area, const char* fmt, ...);
void error(const char* area, const char* fmt, ...);
}  // namespace paramdec::log

// Trace lines are emitted only when the decoder's DecodeEnv has trace enabled.
#define PARAMDEC_LOG_TRACE(env, area, fmt, ...) \
    do { if ((env).trace) ::paramdec::log::trace(area, fmt, ##__VA_ARGS__); } while (0)
#define PARAMDEC_LOG_ERROR(area, fmt, ...) ::paramdec::log::error(area, fmt, ##__VA_ARGS__)
