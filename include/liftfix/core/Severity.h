#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace liftfix {

enum class Severity : uint8_t {
    Info    = 0,
    Warning = 1,
    Error   = 2,
};

constexpr std::string_view severityToString(Severity s) {
    switch (s) {
        case Severity::Info:    return "INFO";
        case Severity::Warning: return "WARNING";
        case Severity::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

constexpr std::optional<Severity> parseSeverity(std::string_view s) {
    if (s == "INFO")    return Severity::Info;
    if (s == "WARNING") return Severity::Warning;
    if (s == "ERROR")   return Severity::Error;
    return std::nullopt;
}

constexpr bool operator>=(Severity a, Severity b) {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b);
}

} // namespace liftfix
