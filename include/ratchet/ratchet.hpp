#pragma once

/**
 * @file ratchet.hpp
 * @brief Everything needed to build paths from untrusted names
 *
 * ```cpp
 * #include <ratchet/ratchet.hpp>
 *
 * std::filesystem::path dest = "/tmp";
 * auto name = ratchet::SingleComponentPathBuf::create("/etc/shadow");
 * // name == std::nullopt
 * ```
 */

#include "ratchet/components.hpp"
#include "ratchet/multi_component.hpp"
#include "ratchet/platform.hpp"
#include "ratchet/push.hpp"
#include "ratchet/single_component.hpp"
#include "ratchet/validate.hpp"

#ifdef RATCHET_ENABLE_SANITIZE
#include "ratchet/sanitize.hpp"
#endif
