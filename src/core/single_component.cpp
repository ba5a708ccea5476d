#include "ratchet/single_component.hpp"
#include "ratchet/components.hpp"
#include "ratchet/validate.hpp"

namespace ratchet {

std::optional<SingleComponentPath> SingleComponentPath::create(const std::filesystem::path& path,
                                                               Platform target) {
    if (!is_single_component(path, target)) {
        return std::nullopt;
    }
    return SingleComponentPath(path, target);
}

std::filesystem::path SingleComponentPath::effective_path() const {
    return ratchet::effective_path(decompose(*path_, platform_));
}

SingleComponentPathBuf SingleComponentPath::to_owned() const {
    return SingleComponentPathBuf(effective_path(), platform_);
}

std::optional<SingleComponentPathBuf> SingleComponentPathBuf::create(std::filesystem::path path,
                                                                     Platform target) {
    auto components = decompose(path, target);
    if (!is_single_component(components)) {
        return std::nullopt;
    }
    return SingleComponentPathBuf(ratchet::effective_path(components), target);
}

int compare(const SingleComponentPath& a, const SingleComponentPath& b) {
    return a.effective_path().compare(b.effective_path());
}

std::size_t hash_value(const SingleComponentPath& p) {
    return std::filesystem::hash_value(p.effective_path());
}

std::ostream& operator<<(std::ostream& os, const SingleComponentPath& p) {
    return os << p.effective_path().u8string();
}

} // namespace ratchet
