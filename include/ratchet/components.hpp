#pragma once

/**
 * @file components.hpp
 * @brief Decomposition of a path into classified components
 *
 * A path is split the way the target platform's path grammar splits it.
 * When the target shares the host's grammar the host std::filesystem
 * iterator is the ground truth; for a foreign target the path text is split
 * lexically under that target's rules.
 *
 * @example
 * ```cpp
 * auto parts = ratchet::decompose("./a/../b", ratchet::Platform::Linux);
 * // CurDir ".", Normal "a", ParentDir "..", Normal "b"
 * ```
 */

#include "ratchet/export.hpp"
#include "ratchet/platform.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ratchet {

enum class ComponentKind {
    Prefix,     ///< Drive designator, UNC share or verbatim/device prefix
    RootDir,    ///< Separator anchoring the path at a root
    CurDir,     ///< "."
    ParentDir,  ///< ".."
    Normal      ///< A file or directory name
};

struct Component {
    ComponentKind kind;
    std::string text;  ///< UTF-8
};

inline bool operator==(const Component& a, const Component& b) {
    return a.kind == b.kind && a.text == b.text;
}

inline bool operator!=(const Component& a, const Component& b) {
    return !(a == b);
}

/// "prefix", "root", "cur_dir", "parent_dir" or "normal"
RATCHET_API std::string component_kind_name(ComponentKind kind);

/**
 * @brief Split a path into components under the target's grammar
 *
 * Empty segments produced by repeated or trailing separators are dropped.
 * Pure and total; the filesystem is never touched.
 */
RATCHET_API std::vector<Component> decompose(const std::filesystem::path& path,
                                             Platform target = get_current_platform());

/**
 * @brief Split path text lexically under the target's grammar
 *
 * POSIX: '/' separates, a leading '/' is the root.
 * Windows: '/' and '\\' separate; "X:", "\\\\server\\share", "\\\\?\\..."
 * and "\\\\.\\..." are prefixes; a separator after the prefix (or at the
 * start) is the root.
 */
RATCHET_API std::vector<Component> decompose_lexically(std::string_view text, Platform target);

} // namespace ratchet
