#include "ratchet/validate.hpp"

#include <algorithm>
#include <string>

namespace ratchet {

bool is_single_component(const std::vector<Component>& components) {
    const Component* only = nullptr;
    for (const auto& component : components) {
        if (component.kind == ComponentKind::CurDir) continue;
        if (only != nullptr) return false;
        only = &component;
    }
    return only != nullptr && only->kind == ComponentKind::Normal;
}

bool is_single_component(const std::filesystem::path& path, Platform target) {
    return is_single_component(decompose(path, target));
}

bool is_multi_component(const std::vector<Component>& components) {
    return std::all_of(components.begin(), components.end(), [](const Component& c) {
        return c.kind == ComponentKind::Normal || c.kind == ComponentKind::CurDir;
    });
}

bool is_multi_component(const std::filesystem::path& path, Platform target) {
    return is_multi_component(decompose(path, target));
}

std::filesystem::path effective_path(const std::vector<Component>& components) {
    // Joined with '/' so the result splits the same way under either grammar
    std::string joined;
    for (const auto& component : components) {
        if (component.kind != ComponentKind::Normal) continue;
        if (!joined.empty()) joined += '/';
        joined += component.text;
    }
    return std::filesystem::u8path(joined);
}

} // namespace ratchet
