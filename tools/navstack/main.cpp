/**
 * navstack CLI - Entry Point
 *
 * Replays navigation scripts against a back stack.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace navstack::cli::commands {
    void setup_replay(CLI::App* app, GlobalOptions& opts);
    void setup_validate(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace navstack::cli;

    CLI::App app{"navstack - navigation back stack driver"};
    app.set_version_flag("-V,--version", NAVSTACK_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Config file (default: $NAVSTACK_CONFIG)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* replay_cmd = app.add_subcommand("replay", "Run a navigation script and print the stack");
    commands::setup_replay(replay_cmd, opts);

    auto* validate_cmd = app.add_subcommand("validate", "Check a navigation script");
    commands::setup_validate(validate_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
