/**
 * ratchet CLI - check command
 *
 * Report whether inputs are single (or multi) component paths.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace ratchet::cli::commands {

namespace {

struct CheckOptions {
    std::vector<std::string> inputs;
    bool multi = false;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    init_logging(opts);

    auto platform = platform_or_error(opts);
    if (!platform) {
        return 1;
    }

    nlohmann::json results = nlohmann::json::array();
    bool all_valid = true;

    for (const auto& input : check_opts.inputs) {
        std::filesystem::path path(input);
        auto components = decompose(path, *platform);
        spdlog::debug("{}: {}", input, describe_components(components));

        bool valid = check_opts.multi ? is_multi_component(components)
                                      : is_single_component(components);
        all_valid = all_valid && valid;

        nlohmann::json entry;
        entry["input"] = input;
        entry["valid"] = valid;
        entry["components"] = components_to_json(components);
        if (valid) {
            entry["effective"] = effective_path(components).generic_u8string();
        }
        results.push_back(entry);

        if (!opts.json) {
            if (valid) {
                if (!opts.quiet) {
                    std::cout << "ok " << input << " -> " << entry["effective"].get<std::string>() << std::endl;
                }
            } else {
                std::cout << "rejected " << input << std::endl;
            }
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = all_valid;
        j["platform"] = platform_name(*platform);
        j["kind"] = check_opts.multi ? "multi" : "single";
        j["results"] = results;
        output_json(j);
    }

    return all_valid ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("inputs", check_opts.inputs, "Paths to validate")->required();
    app->add_flag("--multi", check_opts.multi, "Allow several names (no '..', root or prefix)");

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace ratchet::cli::commands
