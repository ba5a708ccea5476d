#include "ratchet/sanitize.hpp"
#include "ratchet/validate.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace ratchet {

namespace {

constexpr char REPLACEMENT = '_';

bool is_windows_reserved_char(unsigned char c) {
    static constexpr std::string_view reserved = "<>:\"|?*";
    return c < 0x20 || reserved.find(static_cast<char>(c)) != std::string_view::npos;
}

// CON, PRN, AUX, NUL, COM1-9 and LPT1-9 name devices on Windows, with or
// without an extension
bool is_windows_device_name(const std::string& name) {
    static const std::array<const char*, 4> plain = {"CON", "PRN", "AUX", "NUL"};

    std::string stem = name.substr(0, name.find('.'));
    // Trailing spaces before the extension are ignored by Windows too
    while (!stem.empty() && stem.back() == ' ') {
        stem.pop_back();
    }
    std::transform(stem.begin(), stem.end(), stem.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (const char* device : plain) {
        if (stem == device) return true;
    }
    if (stem.size() == 4 && (stem.compare(0, 3, "COM") == 0 || stem.compare(0, 3, "LPT") == 0)) {
        return stem[3] >= '1' && stem[3] <= '9';
    }
    return false;
}

} // namespace

std::string sanitize_component_text(std::string_view input, Platform target) {
    const bool windows = uses_windows_paths(target);

    std::string name;
    name.reserve(input.size());
    for (char ch : input) {
        unsigned char c = static_cast<unsigned char>(ch);
        bool replace = c == '/' || c == '\0' ||
                       (windows && (c == '\\' || is_windows_reserved_char(c)));
        name += replace ? REPLACEMENT : ch;
    }

    if (windows) {
        while (!name.empty() && (name.back() == '.' || name.back() == ' ')) {
            name.pop_back();
        }
        if (is_windows_device_name(name)) {
            name.insert(name.begin(), REPLACEMENT);
        }
    }

    if (name.empty()) {
        return std::string(1, REPLACEMENT);
    }
    if (std::all_of(name.begin(), name.end(), [](char c) { return c == '.'; })) {
        return std::string(name.size(), REPLACEMENT);
    }
    return name;
}

SingleComponentPathBuf sanitize_component(std::string_view input, Platform target) {
    std::string name = sanitize_component_text(input, target);

    auto component = SingleComponentPathBuf::create(std::filesystem::u8path(name), target);
    if (!component) {
        throw std::logic_error("sanitize_component produced an invalid component: " + name);
    }
    return *component;
}

} // namespace ratchet
