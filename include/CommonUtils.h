#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Splits "a, b,,c" into {"a","b","c"}; empty tokens are dropped.
inline std::vector<std::string> splitList(std::string_view s, char sep = ',') {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        const size_t pos = s.find(sep, start);
        const std::string token = trim(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (!token.empty()) out.push_back(token);
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return out;
}

inline std::string joinList(const std::vector<std::string>& items, std::string_view sep = ", ") {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

inline std::string toFixed(double v, int prec = 3) {
    if (!std::isfinite(v)) return "NA";
    std::ostringstream os;
    os << std::fixed << std::setprecision(prec) << v;
    return os.str();
}

inline std::string formatPValue(double p) {
    if (!std::isfinite(p)) return "NA";
    if (p < 0.001) return "<.001";
    return toFixed(p, 3);
}

// Linear-interpolated quantile (R type 7); values is taken by copy and partially reordered.
inline double quantileByNth(std::vector<double> values, double q) {
    if (values.empty()) return 0.0;
    q = std::min(1.0, std::max(0.0, q));
    const double pos = q * static_cast<double>(values.size() - 1);
    const size_t lo = static_cast<size_t>(pos);
    const double frac = pos - static_cast<double>(lo);

    const auto loIt = values.begin() + static_cast<std::ptrdiff_t>(lo);
    std::nth_element(values.begin(), loIt, values.end());
    if (frac <= 0.0 || lo + 1 >= values.size()) return *loIt;
    // After nth_element the next order statistic is the minimum of the upper part.
    const double next = *std::min_element(loIt + 1, values.end());
    return *loIt + frac * (next - *loIt);
}

} // namespace CommonUtils
