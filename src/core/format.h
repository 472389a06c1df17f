#pragma once

#include <cstdarg>
#include <cstdio>
#include <string>

namespace auctionsim {

/// printf-style append. The first pass measures, so no output is truncated.
inline void appendf(std::string& out, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list measure;
    va_copy(measure, args);
    const int n = std::vsnprintf(nullptr, 0, fmt, measure);
    va_end(measure);
    if (n > 0) {
        const size_t old = out.size();
        out.resize(old + static_cast<size_t>(n) + 1);
        std::vsnprintf(&out[old], static_cast<size_t>(n) + 1, fmt, args);
        out.resize(old + static_cast<size_t>(n));
    }
    va_end(args);
}

}  // namespace auctionsim
