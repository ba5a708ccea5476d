#pragma once

/**
 * @file sanitize.hpp
 * @brief Rewrite arbitrary text into a single path component
 *
 * Prefer rejecting bad names with SingleComponentPathBuf::create(). This is
 * for callers that must always produce some name. The exact rewriting is not
 * stable between versions and must not be relied on.
 *
 * Only available when ratchet is built with RATCHET_ENABLE_SANITIZE.
 */

#include "ratchet/export.hpp"
#include "ratchet/platform.hpp"
#include "ratchet/single_component.hpp"

#include <string>
#include <string_view>

namespace ratchet {

/**
 * @brief Replace whatever keeps input from being one name on the target
 *
 * Separators and NUL become '_'. For Windows targets reserved characters and
 * control characters also become '_', trailing dots and spaces are trimmed
 * and reserved device names get a leading '_'. Empty or all-dot results are
 * replaced by underscores.
 *
 * @throws std::logic_error if the rewritten name is still not a single
 *         component (a bug in the sanitizer, not bad input)
 */
RATCHET_API SingleComponentPathBuf sanitize_component(std::string_view input,
                                                      Platform target = get_current_platform());

/// The rewritten text on its own, without validation
RATCHET_API std::string sanitize_component_text(std::string_view input, Platform target);

} // namespace ratchet
