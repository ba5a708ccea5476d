#pragma once

/**
 * @file multi_component.hpp
 * @brief Relative paths made only of names and "." markers
 *
 * A MultiComponentPath(Buf) accepts "a/b/c" or "./a/./b" but never "..",
 * a root or a prefix anywhere in the path. The empty path is accepted and
 * appends nothing.
 *
 * Every name accepted by SingleComponentPath is accepted here as well; the
 * reverse does not hold, and neither direction converts implicitly.
 */

#include "ratchet/export.hpp"
#include "ratchet/platform.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace ratchet {

class MultiComponentPathBuf;

/**
 * @brief Borrowed, validated view of a traversal-free relative path
 *
 * The referenced path must outlive the view and must not be modified while
 * the view is in use, as with std::string_view. Use to_owned() otherwise.
 */
class RATCHET_API MultiComponentPath {
public:
    static std::optional<MultiComponentPath> create(const std::filesystem::path& path,
                                                    Platform target = get_current_platform());
    static std::optional<MultiComponentPath> create(std::filesystem::path&& path,
                                                    Platform target = get_current_platform()) = delete;

    const std::filesystem::path& path() const { return *path_; }

    /// Names joined in order, without "." markers
    std::filesystem::path effective_path() const;

    /// The names in order
    std::vector<std::string> segments() const;

    /// True when there is no name to append ("", ".", "./.")
    bool empty() const;

    Platform platform() const { return platform_; }

    MultiComponentPathBuf to_owned() const;

private:
    friend class MultiComponentPathBuf;

    MultiComponentPath(const std::filesystem::path& path, Platform platform)
        : path_(&path), platform_(platform) {}

    const std::filesystem::path* path_;
    Platform platform_;
};

/**
 * @brief Owned, validated traversal-free relative path
 *
 * Stores the effective path ("./a/./b/." is held as "a/b").
 */
class RATCHET_API MultiComponentPathBuf {
public:
    static std::optional<MultiComponentPathBuf> create(std::filesystem::path path,
                                                       Platform target = get_current_platform());

    const std::filesystem::path& path() const { return path_; }

    const std::filesystem::path& effective_path() const { return path_; }

    std::vector<std::string> segments() const { return view().segments(); }

    bool empty() const { return path_.empty(); }

    Platform platform() const { return platform_; }

    MultiComponentPath view() const { return MultiComponentPath(path_, platform_); }

    operator MultiComponentPath() const { return view(); }

private:
    friend class MultiComponentPath;

    MultiComponentPathBuf(std::filesystem::path path, Platform platform)
        : path_(std::move(path)), platform_(platform) {}

    std::filesystem::path path_;
    Platform platform_;
};

RATCHET_API int compare(const MultiComponentPath& a, const MultiComponentPath& b);

inline bool operator==(const MultiComponentPath& a, const MultiComponentPath& b) { return compare(a, b) == 0; }
inline bool operator!=(const MultiComponentPath& a, const MultiComponentPath& b) { return compare(a, b) != 0; }
inline bool operator<(const MultiComponentPath& a, const MultiComponentPath& b) { return compare(a, b) < 0; }
inline bool operator<=(const MultiComponentPath& a, const MultiComponentPath& b) { return compare(a, b) <= 0; }
inline bool operator>(const MultiComponentPath& a, const MultiComponentPath& b) { return compare(a, b) > 0; }
inline bool operator>=(const MultiComponentPath& a, const MultiComponentPath& b) { return compare(a, b) >= 0; }

RATCHET_API std::size_t hash_value(const MultiComponentPath& p);

RATCHET_API std::ostream& operator<<(std::ostream& os, const MultiComponentPath& p);

} // namespace ratchet

namespace std {

template <>
struct hash<ratchet::MultiComponentPath> {
    size_t operator()(const ratchet::MultiComponentPath& p) const {
        return ratchet::hash_value(p);
    }
};

template <>
struct hash<ratchet::MultiComponentPathBuf> {
    size_t operator()(const ratchet::MultiComponentPathBuf& p) const {
        return ratchet::hash_value(p.view());
    }
};

} // namespace std
