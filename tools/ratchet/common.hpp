/**
 * ratchet CLI - Common utilities and types
 */

#pragma once

#include <ratchet/ratchet.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace ratchet::cli {

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string platform;          // --platform
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the platform whose grammar inputs are validated under.
 * Priority: --platform flag > RATCHET_PLATFORM env > host platform.
 * Returns nullopt when the chosen name is not a known platform.
 */
inline std::optional<Platform> resolve_platform(const std::string& flag_value,
                                                const std::string& env_value) {
    if (!flag_value.empty()) {
        return parse_platform(flag_value);
    }
    if (!env_value.empty()) {
        return parse_platform(env_value);
    }
    return get_current_platform();
}

inline std::optional<Platform> resolve_platform(const GlobalOptions& opts) {
    return resolve_platform(opts.platform, safe_getenv("RATCHET_PLATFORM"));
}

/**
 * Resolve the log level.
 * Priority: --verbose / --quiet > RATCHET_LOG_LEVEL env > info.
 */
inline spdlog::level::level_enum resolve_log_level(const GlobalOptions& opts,
                                                   const std::string& env_value) {
    if (opts.verbose) return spdlog::level::debug;
    if (opts.quiet) return spdlog::level::err;

    std::string level = env_value;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

/**
 * Route logging to stderr so stdout stays parseable in --json mode.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("ratchet");
    if (!logger) {
        logger = spdlog::stderr_color_mt("ratchet");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%l] %v");
    spdlog::set_level(resolve_log_level(opts, safe_getenv("RATCHET_LOG_LEVEL")));
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline nlohmann::json components_to_json(const std::vector<Component>& components) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : components) {
        arr.push_back({{"kind", component_kind_name(c.kind)}, {"text", c.text}});
    }
    return arr;
}

inline std::string describe_components(const std::vector<Component>& components) {
    std::string out;
    for (const auto& c : components) {
        if (!out.empty()) out += ", ";
        out += component_kind_name(c.kind) + "(" + c.text + ")";
    }
    return out.empty() ? "<none>" : out;
}

/**
 * Resolve the platform or report why it could not be resolved.
 */
inline std::optional<Platform> platform_or_error(const GlobalOptions& opts) {
    auto platform = resolve_platform(opts);
    if (!platform) {
        std::string name = opts.platform.empty() ? safe_getenv("RATCHET_PLATFORM") : opts.platform;
        print_error("Unknown platform: " + name, opts.json);
        return std::nullopt;
    }
    spdlog::debug("Validating under {} rules", platform_name(*platform));
    return platform;
}

} // namespace ratchet::cli
