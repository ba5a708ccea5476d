/**
 * ratchet CLI - Entry Point
 *
 * Validate untrusted path components and join them onto trusted paths.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace ratchet::cli::commands {
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_join(CLI::App* app, GlobalOptions& opts);
#ifdef RATCHET_ENABLE_SANITIZE
    void setup_sanitize(CLI::App* app, GlobalOptions& opts);
#endif
}

int main(int argc, char** argv) {
    using namespace ratchet::cli;

    CLI::App app{"ratchet - traversal-safe path components"};
    app.set_version_flag("-V,--version", RATCHET_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--platform", opts.platform, "Path grammar: linux, macos, windows, posix, native");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* check_cmd = app.add_subcommand("check", "Validate path components");
    commands::setup_check(check_cmd, opts);

    auto* join_cmd = app.add_subcommand("join", "Append validated paths to a base");
    commands::setup_join(join_cmd, opts);

#ifdef RATCHET_ENABLE_SANITIZE
    auto* sanitize_cmd = app.add_subcommand("sanitize", "Rewrite a name into a single component");
    commands::setup_sanitize(sanitize_cmd, opts);
#endif

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
