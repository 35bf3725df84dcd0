#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pyhazard {

enum class Severity : uint8_t {
    Low      = 0,
    Medium   = 1,
    High     = 2,
    Critical = 3,
};

inline constexpr Severity kAllSeverities[] = {
    Severity::Critical, Severity::High, Severity::Medium, Severity::Low,
};

constexpr std::string_view severityToString(Severity s) {
    switch (s) {
        case Severity::Low:      return "LOW";
        case Severity::Medium:   return "MEDIUM";
        case Severity::High:     return "HIGH";
        case Severity::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

// Accepts the upper-case spelling used in configuration and reports,
// plus the capitalized form the CLI has always taken.
std::optional<Severity> parseSeverity(std::string_view s);

constexpr bool operator>=(Severity a, Severity b) {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b);
}

enum class Category : uint8_t {
    Runtime,
    Performance,
    Complexity,
    Security,
    Organization,
    Resource,
    Gotcha,
};

constexpr std::string_view categoryToString(Category c) {
    switch (c) {
        case Category::Runtime:      return "Runtime";
        case Category::Performance:  return "Performance";
        case Category::Complexity:   return "Complexity";
        case Category::Security:     return "Security";
        case Category::Organization: return "Organization";
        case Category::Resource:     return "Resource";
        case Category::Gotcha:       return "Gotcha";
    }
    return "Unknown";
}

} // namespace pyhazard
