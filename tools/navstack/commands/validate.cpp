/**
 * navstack CLI - validate command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace navstack::cli::commands {

namespace {

struct ValidateOptions {
    std::string script;
};

int cmd_validate(const GlobalOptions& opts, const ValidateOptions& validate_opts) {
    auto config = load_effective_config(opts);
    if (!config.ok) {
        print_error(config.error, opts.json);
        return 1;
    }

    auto content = read_file(validate_opts.script);
    if (!content) {
        print_error("cannot read script: " + validate_opts.script, opts.json);
        return 1;
    }

    auto script = json::parse_nav_script(*content, validate_opts.script);
    if (!script.ok) {
        print_error(script.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["events"] = script.value.size();
        j["warnings"] = script.warnings;
        output_json(j);
    } else {
        for (const auto& w : script.warnings) {
            std::cerr << "Warning: " << w << std::endl;
        }
        std::cout << validate_opts.script << ": " << script.value.size() << " event(s)" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_validate(CLI::App* app, GlobalOptions& opts) {
    static ValidateOptions validate_opts;

    app->add_option("script", validate_opts.script, "Navigation script (JSON)")->required();

    app->callback([&opts]() {
        int rc = 1;
        try {
            rc = cmd_validate(opts, validate_opts);
        } catch (const std::exception& e) {
            print_error(e.what(), opts.json);
        }
        std::exit(rc);
    });
}

} // namespace navstack::cli::commands
