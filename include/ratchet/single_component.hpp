#pragma once

/**
 * @file single_component.hpp
 * @brief Paths holding exactly one name
 *
 * std::filesystem::path::operator/= allows any form of traversal:
 *
 * ```cpp
 * std::filesystem::path file = "/tmp";
 * file /= "/etc/shadow";   // file == "/etc/shadow"
 * ```
 *
 * A SingleComponentPath(Buf) can only be created from a path that, with its
 * "." markers dropped, is one Normal component: no parent, no root, no
 * prefix like "C:". Appending one with push_component() cannot leave the
 * destination directory.
 *
 * @example
 * ```cpp
 * auto name = ratchet::SingleComponentPathBuf::create(user_input);
 * if (!name) {
 *     return error("invalid file name");
 * }
 * std::filesystem::path file = "/srv/uploads";
 * ratchet::push_component(file, *name);
 * ```
 */

#include "ratchet/export.hpp"
#include "ratchet/platform.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <utility>

namespace ratchet {

class SingleComponentPathBuf;

/**
 * @brief Borrowed, validated view of a path with a single component
 *
 * Refers to a path owned elsewhere, like std::string_view refers to a
 * string. The referenced path must outlive the view and must not be
 * modified while the view is in use: the view is only as valid as the path
 * it was created from. Creating a view from a temporary is rejected at
 * compile time. Use to_owned() to keep the name past those limits.
 */
class RATCHET_API SingleComponentPath {
public:
    /**
     * @brief Validate path under the target grammar and view it
     * @return The view, or nullopt if path is not a single component
     */
    static std::optional<SingleComponentPath> create(const std::filesystem::path& path,
                                                     Platform target = get_current_platform());
    static std::optional<SingleComponentPath> create(std::filesystem::path&& path,
                                                     Platform target = get_current_platform()) = delete;

    /// The viewed path, exactly as passed to create()
    const std::filesystem::path& path() const { return *path_; }

    /// The one name alone ("./bar.txt" -> "bar.txt")
    std::filesystem::path effective_path() const;

    Platform platform() const { return platform_; }

    /// Copy into an owned value
    SingleComponentPathBuf to_owned() const;

private:
    friend class SingleComponentPathBuf;

    SingleComponentPath(const std::filesystem::path& path, Platform platform)
        : path_(&path), platform_(platform) {}

    const std::filesystem::path* path_;
    Platform platform_;
};

/**
 * @brief Owned, validated path with a single component
 *
 * Stores the effective name, so "./file/." is held as "file". Immutable
 * after creation; copies are deep.
 */
class RATCHET_API SingleComponentPathBuf {
public:
    /**
     * @brief Validate anything convertible to a path and take ownership
     * @return The wrapper, or nullopt if path is not a single component
     */
    static std::optional<SingleComponentPathBuf> create(std::filesystem::path path,
                                                        Platform target = get_current_platform());

    const std::filesystem::path& path() const { return path_; }

    const std::filesystem::path& effective_path() const { return path_; }

    Platform platform() const { return platform_; }

    /// Zero-copy borrowed view; no revalidation
    SingleComponentPath view() const { return SingleComponentPath(path_, platform_); }

    operator SingleComponentPath() const { return view(); }

private:
    friend class SingleComponentPath;

    SingleComponentPathBuf(std::filesystem::path path, Platform platform)
        : path_(std::move(path)), platform_(platform) {}

    std::filesystem::path path_;
    Platform platform_;
};

// Comparison and hashing use the effective path, so a view and an owned
// value of the same name are equal. Owned values convert to views.
RATCHET_API int compare(const SingleComponentPath& a, const SingleComponentPath& b);

inline bool operator==(const SingleComponentPath& a, const SingleComponentPath& b) { return compare(a, b) == 0; }
inline bool operator!=(const SingleComponentPath& a, const SingleComponentPath& b) { return compare(a, b) != 0; }
inline bool operator<(const SingleComponentPath& a, const SingleComponentPath& b) { return compare(a, b) < 0; }
inline bool operator<=(const SingleComponentPath& a, const SingleComponentPath& b) { return compare(a, b) <= 0; }
inline bool operator>(const SingleComponentPath& a, const SingleComponentPath& b) { return compare(a, b) > 0; }
inline bool operator>=(const SingleComponentPath& a, const SingleComponentPath& b) { return compare(a, b) >= 0; }

RATCHET_API std::size_t hash_value(const SingleComponentPath& p);

/// Prints the effective path as UTF-8
RATCHET_API std::ostream& operator<<(std::ostream& os, const SingleComponentPath& p);

} // namespace ratchet

namespace std {

template <>
struct hash<ratchet::SingleComponentPath> {
    size_t operator()(const ratchet::SingleComponentPath& p) const {
        return ratchet::hash_value(p);
    }
};

template <>
struct hash<ratchet::SingleComponentPathBuf> {
    size_t operator()(const ratchet::SingleComponentPathBuf& p) const {
        return ratchet::hash_value(p.view());
    }
};

} // namespace std
