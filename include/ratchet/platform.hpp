#pragma once

#include "ratchet/export.hpp"

#include <optional>
#include <string>

namespace ratchet {

// ============================================================================
// Platform Detection
// ============================================================================

// Platform whose path grammar a path is validated under. A name can be a
// single segment under one grammar and a drive-prefixed path under another,
// so callers validate with the platform the path will be used on.
enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

// Host platform, detected at compile time
RATCHET_API Platform get_current_platform();

// True when the platform parses drive prefixes and backslash separators.
// Linux, macOS and Unknown all use the POSIX grammar.
RATCHET_API bool uses_windows_paths(Platform platform);

// True when the host's std::filesystem grammar matches the platform's
RATCHET_API bool is_native_grammar(Platform platform);

// "linux", "macos", "windows" or "unknown"
RATCHET_API std::string platform_name(Platform platform);

// Case-insensitive inverse of platform_name(). Also accepts "posix" (Linux)
// and "native" (the host platform).
RATCHET_API std::optional<Platform> parse_platform(const std::string& name);

} // namespace ratchet
