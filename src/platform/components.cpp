#include "ratchet/components.hpp"

#include <cctype>
#include <utility>

namespace ratchet {

namespace {

Component classify_segment(std::string segment) {
    if (segment == ".") {
        return {ComponentKind::CurDir, std::move(segment)};
    }
    if (segment == "..") {
        return {ComponentKind::ParentDir, std::move(segment)};
    }
    return {ComponentKind::Normal, std::move(segment)};
}

bool is_separator(char c, Platform target) {
    return c == '/' || (c == '\\' && uses_windows_paths(target));
}

// End of the segment starting at pos (index of the next separator or size)
size_t segment_end(std::string_view text, size_t pos, Platform target) {
    while (pos < text.size() && !is_separator(text[pos], target)) {
        ++pos;
    }
    return pos;
}

// Step over one separator, if any
size_t skip_separator(std::string_view text, size_t pos, Platform target) {
    return (pos < text.size() && is_separator(text[pos], target)) ? pos + 1 : pos;
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Length of the Windows prefix at the start of text, 0 when there is none
size_t windows_prefix_length(std::string_view text) {
    constexpr Platform win = Platform::Windows;

    if (text.size() >= 2 && is_separator(text[0], win) && is_separator(text[1], win)) {
        size_t pos = 2;
        size_t end = segment_end(text, pos, win);
        std::string_view marker = text.substr(pos, end - pos);

        if (marker == "?" || marker == ".") {
            // \\?\C:, \\?\UNC\server\share, \\.\device
            pos = skip_separator(text, end, win);
            end = segment_end(text, pos, win);
            if (marker == "?" && equals_ignore_case(text.substr(pos, end - pos), "UNC")) {
                pos = skip_separator(text, end, win);
                end = segment_end(text, pos, win);
                pos = skip_separator(text, end, win);
                end = segment_end(text, pos, win);
            }
            return end;
        }

        // \\server\share
        pos = skip_separator(text, end, win);
        return segment_end(text, pos, win);
    }

    if (text.size() >= 2 && std::isalpha(static_cast<unsigned char>(text[0])) && text[1] == ':') {
        return 2;
    }

    return 0;
}

std::vector<Component> decompose_native(const std::filesystem::path& path) {
    std::vector<Component> components;

    auto it = path.begin();
    if (path.has_root_name() && it != path.end()) {
        components.push_back({ComponentKind::Prefix, it->u8string()});
        ++it;
    }
    if (path.has_root_directory() && it != path.end()) {
        components.push_back({ComponentKind::RootDir, it->u8string()});
        ++it;
    }

    for (; it != path.end(); ++it) {
        std::string segment = it->u8string();
        // A trailing separator shows up as an empty element
        if (segment.empty()) continue;
        components.push_back(classify_segment(std::move(segment)));
    }

    return components;
}

} // namespace

std::string component_kind_name(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Prefix: return "prefix";
        case ComponentKind::RootDir: return "root";
        case ComponentKind::CurDir: return "cur_dir";
        case ComponentKind::ParentDir: return "parent_dir";
        case ComponentKind::Normal: return "normal";
    }
    return "normal";
}

std::vector<Component> decompose_lexically(std::string_view text, Platform target) {
    std::vector<Component> components;
    size_t pos = 0;

    if (uses_windows_paths(target)) {
        size_t prefix = windows_prefix_length(text);
        if (prefix > 0) {
            components.push_back({ComponentKind::Prefix, std::string(text.substr(0, prefix))});
            pos = prefix;
        }
    }

    if (pos < text.size() && is_separator(text[pos], target)) {
        components.push_back({ComponentKind::RootDir, std::string(1, text[pos])});
    }

    while (pos < text.size()) {
        while (pos < text.size() && is_separator(text[pos], target)) {
            ++pos;
        }
        if (pos >= text.size()) break;

        size_t end = segment_end(text, pos, target);
        components.push_back(classify_segment(std::string(text.substr(pos, end - pos))));
        pos = end;
    }

    return components;
}

std::vector<Component> decompose(const std::filesystem::path& path, Platform target) {
    if (is_native_grammar(target)) {
        return decompose_native(path);
    }
    return decompose_lexically(path.u8string(), target);
}

} // namespace ratchet
