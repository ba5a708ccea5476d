#pragma once

/**
 * @file validate.hpp
 * @brief Component validity predicates
 *
 * Both predicates are pure yes/no decisions over the target platform's
 * decomposition of a path. Their outcome depends on the target: "C:x" is a
 * single name under POSIX rules and a drive-relative path under Windows
 * rules, so validate with the platform the path will be used on.
 */

#include "ratchet/components.hpp"
#include "ratchet/export.hpp"
#include "ratchet/platform.hpp"

#include <filesystem>
#include <vector>

namespace ratchet {

/**
 * @brief True when exactly one Normal component remains after dropping
 *        every "." marker
 *
 * Empty paths and paths made only of "." markers are rejected.
 */
RATCHET_API bool is_single_component(const std::vector<Component>& components);

RATCHET_API bool is_single_component(const std::filesystem::path& path,
                                     Platform target = get_current_platform());

/**
 * @brief True when every component is Normal or "."
 *
 * The empty path is accepted: there is nothing to append.
 */
RATCHET_API bool is_multi_component(const std::vector<Component>& components);

RATCHET_API bool is_multi_component(const std::filesystem::path& path,
                                    Platform target = get_current_platform());

/// The Normal components joined in order; "." markers and redundant
/// separators disappear. Empty when there is no Normal component.
RATCHET_API std::filesystem::path effective_path(const std::vector<Component>& components);

} // namespace ratchet
