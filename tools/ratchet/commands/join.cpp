/**
 * ratchet CLI - join command
 *
 * Append validated relative paths to a base directory.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace ratchet::cli::commands {

namespace {

struct JoinOptions {
    std::string base;
    std::vector<std::string> inputs;
};

int cmd_join(const GlobalOptions& opts, const JoinOptions& join_opts) {
    init_logging(opts);

    auto platform = platform_or_error(opts);
    if (!platform) {
        return 1;
    }

    // Validate everything before touching the destination
    std::vector<MultiComponentPathBuf> parts;
    for (const auto& input : join_opts.inputs) {
        auto part = MultiComponentPathBuf::create(input, *platform);
        if (!part) {
            spdlog::debug("{}: {}", input, describe_components(decompose(input, *platform)));
            print_error("Rejected path: " + input, opts.json);
            return 1;
        }
        parts.push_back(std::move(*part));
    }

    std::filesystem::path dest(join_opts.base);
    for (const auto& part : parts) {
        spdlog::debug("Appending {} to {}", part.path().generic_u8string(), dest.generic_u8string());
        push_components(dest, part);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["platform"] = platform_name(*platform);
        j["base"] = join_opts.base;
        j["path"] = dest.u8string();
        output_json(j);
    } else {
        std::cout << dest.u8string() << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_join(CLI::App* app, GlobalOptions& opts) {
    static JoinOptions join_opts;

    app->add_option("base", join_opts.base, "Trusted base directory")->required();
    app->add_option("inputs", join_opts.inputs, "Untrusted relative paths to append")->required();

    app->callback([&opts]() {
        std::exit(cmd_join(opts, join_opts));
    });
}

} // namespace ratchet::cli::commands
