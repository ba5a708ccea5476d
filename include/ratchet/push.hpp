#pragma once

/**
 * @file push.hpp
 * @brief Append validated components to a destination path
 *
 * These are the only operations that grow a path from ratchet values. They
 * take no raw strings: the argument was proven traversal-free when it was
 * created, so nothing is revalidated here. Owned values convert to their
 * views and can be passed directly.
 *
 * @example
 * ```cpp
 * std::filesystem::path dest = "/srv/data";
 * auto sub = ratchet::MultiComponentPathBuf::create("./folder/./file/.");
 * ratchet::push_components(dest, *sub);   // "/srv/data/folder/file"
 * ```
 */

#include "ratchet/export.hpp"
#include "ratchet/multi_component.hpp"
#include "ratchet/single_component.hpp"

#include <filesystem>

namespace ratchet {

/// Append exactly one name to dest, in place
RATCHET_API void push_component(std::filesystem::path& dest, const SingleComponentPath& component);

/// Append a run of names to dest, in place. An empty run leaves dest as is.
RATCHET_API void push_components(std::filesystem::path& dest, const MultiComponentPath& components);

/// base with component appended
RATCHET_API std::filesystem::path joined(std::filesystem::path base, const SingleComponentPath& component);

/// base with components appended
RATCHET_API std::filesystem::path joined(std::filesystem::path base, const MultiComponentPath& components);

} // namespace ratchet
