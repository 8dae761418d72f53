/**
 * Spotiflow - Utility Functions
 */

#ifndef SPOTIFLOW_UTILS_H
#define SPOTIFLOW_UTILS_H

#include <string>
#include <vector>
#include <cmath>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <algorithm>

namespace spotiflow {
namespace utils {

/* ============================================================================
 * Vector Math
 * ============================================================================ */

/**
 * L2 norm of the component-wise difference. Callers check that both vectors
 * have the same length.
 */
inline float euclidean_distance(const std::vector<float>& a, const std::vector<float>& b) {
    float sum = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        float diff = a[i] - b[i];
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

/* ============================================================================
 * String Utilities
 * ============================================================================ */

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

inline std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

inline std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

/* ============================================================================
 * Time Utilities
 * ============================================================================ */

inline int64_t current_timestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace utils
} // namespace spotiflow

#endif // SPOTIFLOW_UTILS_H
