/**
 * ratchet CLI - sanitize command
 *
 * Rewrite a name into a single component. Output may change between versions.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <stdexcept>

namespace ratchet::cli::commands {

namespace {

struct SanitizeOptions {
    std::string input;
};

int cmd_sanitize(const GlobalOptions& opts, const SanitizeOptions& sanitize_opts) {
    init_logging(opts);

    auto platform = platform_or_error(opts);
    if (!platform) {
        return 1;
    }

    std::string name;
    try {
        name = sanitize_component(sanitize_opts.input, *platform).path().u8string();
    } catch (const std::logic_error& e) {
        spdlog::critical("{}", e.what());
        print_error(e.what(), opts.json);
        return 2;
    }

    if (name != sanitize_opts.input) {
        spdlog::warn("Rewrote '{}' to '{}'", sanitize_opts.input, name);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["platform"] = platform_name(*platform);
        j["input"] = sanitize_opts.input;
        j["name"] = name;
        output_json(j);
    } else {
        std::cout << name << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_sanitize(CLI::App* app, GlobalOptions& opts) {
    static SanitizeOptions sanitize_opts;

    app->add_option("input", sanitize_opts.input, "Name to rewrite")->required();

    app->callback([&opts]() {
        std::exit(cmd_sanitize(opts, sanitize_opts));
    });
}

} // namespace ratchet::cli::commands
