#include "ratchet/platform.hpp"

#include <algorithm>
#include <cctype>

namespace ratchet {

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

bool uses_windows_paths(Platform platform) {
    return platform == Platform::Windows;
}

bool is_native_grammar(Platform platform) {
    return uses_windows_paths(platform) == uses_windows_paths(get_current_platform());
}

std::string platform_name(Platform platform) {
    switch (platform) {
        case Platform::Linux: return "linux";
        case Platform::macOS: return "macos";
        case Platform::Windows: return "windows";
        case Platform::Unknown: break;
    }
    return "unknown";
}

std::optional<Platform> parse_platform(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "linux" || lower == "posix") return Platform::Linux;
    if (lower == "macos") return Platform::macOS;
    if (lower == "windows") return Platform::Windows;
    if (lower == "unknown") return Platform::Unknown;
    if (lower == "native") return get_current_platform();
    return std::nullopt;
}

} // namespace ratchet
