#include "paramdec/log.hpp"
#include <cstdio>

static void vprint(FILE* f, const char* area, const char* level, const char* fmt, va_list args) {
    std::fprintf(f, "[paramdec][%s]%s ", area, level);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}

namespace paramdec::log {
void trace(const char* area, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, area, "", fmt, args);
    va_end(args);
}

void error(const char* area, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, area, "[error]", fmt, args);
    va_end(args);
}
}  // namespace paramdec::log
