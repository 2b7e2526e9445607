#pragma once

#include <cstdlib>
#include <optional>
#include <string>

namespace facet::core {

// Environment lookup wrapper.
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
}

// True when the variable is set, non-empty and does not start with '0'.
inline bool env_flag(const char* name) noexcept {
    auto v = safe_getenv(name);
    return v && !v->empty() && ((*v)[0] != '0');
}

// Diagnostic logging gate for the "[POOL]", "[PROFILE]", ... stderr lines.
inline bool debug_enabled() noexcept {
    return env_flag("FACET_DEBUG");
}

} // namespace facet::core
