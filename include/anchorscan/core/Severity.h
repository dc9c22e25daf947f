#pragma once

#include <llvm/ADT/StringRef.h>

#include <cstdint>
#include <optional>
#include <string_view>

namespace anchorscan {

enum class Severity : uint8_t {
    Low      = 0,
    Medium   = 1,
    High     = 2,
    Critical = 3,
};

constexpr std::string_view severityToString(Severity s) {
    switch (s) {
        case Severity::Low:      return "Low";
        case Severity::Medium:   return "Medium";
        case Severity::High:     return "High";
        case Severity::Critical: return "Critical";
    }
    return "Unknown";
}

constexpr bool operator>=(Severity a, Severity b) {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b);
}

// Case-insensitive; nullopt for anything outside the four levels.
inline std::optional<Severity> parseSeverity(llvm::StringRef s) {
    s = s.trim();
    if (s.equals_insensitive("critical")) return Severity::Critical;
    if (s.equals_insensitive("high"))     return Severity::High;
    if (s.equals_insensitive("medium"))   return Severity::Medium;
    if (s.equals_insensitive("low"))      return Severity::Low;
    return std::nullopt;
}

} // namespace anchorscan
