#include "ratchet/multi_component.hpp"
#include "ratchet/components.hpp"
#include "ratchet/validate.hpp"

namespace ratchet {

std::optional<MultiComponentPath> MultiComponentPath::create(const std::filesystem::path& path,
                                                             Platform target) {
    if (!is_multi_component(path, target)) {
        return std::nullopt;
    }
    return MultiComponentPath(path, target);
}

std::filesystem::path MultiComponentPath::effective_path() const {
    return ratchet::effective_path(decompose(*path_, platform_));
}

std::vector<std::string> MultiComponentPath::segments() const {
    std::vector<std::string> names;
    for (auto& component : decompose(*path_, platform_)) {
        if (component.kind == ComponentKind::Normal) {
            names.push_back(std::move(component.text));
        }
    }
    return names;
}

bool MultiComponentPath::empty() const {
    return segments().empty();
}

MultiComponentPathBuf MultiComponentPath::to_owned() const {
    return MultiComponentPathBuf(effective_path(), platform_);
}

std::optional<MultiComponentPathBuf> MultiComponentPathBuf::create(std::filesystem::path path,
                                                                   Platform target) {
    auto components = decompose(path, target);
    if (!is_multi_component(components)) {
        return std::nullopt;
    }
    return MultiComponentPathBuf(ratchet::effective_path(components), target);
}

int compare(const MultiComponentPath& a, const MultiComponentPath& b) {
    return a.effective_path().compare(b.effective_path());
}

std::size_t hash_value(const MultiComponentPath& p) {
    return std::filesystem::hash_value(p.effective_path());
}

std::ostream& operator<<(std::ostream& os, const MultiComponentPath& p) {
    return os << p.effective_path().u8string();
}

} // namespace ratchet
