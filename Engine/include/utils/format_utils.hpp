#pragma once

#include <cstdio>
#include <string>

namespace Glossa {

// Fixed-point formatting shared by the renderers ("0.95", "87").

inline std::string format_fixed(double value, int precision) {
    char buf[64];
    int n = std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    if (n < 0) return std::string();
    return std::string(buf, static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n) : sizeof(buf) - 1);
}

inline std::string format_percent(double fraction) {
    return format_fixed(fraction * 100.0, 0) + "%";
}

} // namespace Glossa
