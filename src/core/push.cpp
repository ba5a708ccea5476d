#include "ratchet/push.hpp"

namespace ratchet {

void push_component(std::filesystem::path& dest, const SingleComponentPath& component) {
    dest /= component.effective_path();
}

void push_components(std::filesystem::path& dest, const MultiComponentPath& components) {
    // Appending an empty path would add a trailing separator
    for (const auto& segment : components.segments()) {
        dest /= segment;
    }
}

std::filesystem::path joined(std::filesystem::path base, const SingleComponentPath& component) {
    push_component(base, component);
    return base;
}

std::filesystem::path joined(std::filesystem::path base, const MultiComponentPath& components) {
    push_components(base, components);
    return base;
}

} // namespace ratchet
