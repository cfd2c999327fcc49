/**
 * navstack CLI - replay command
 *
 * Run a navigation script through a Navigator and print the resulting stack.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace navstack::cli::commands {

namespace {

struct ReplayOptions {
    std::string script;
    bool show_keys = false;
};

void print_stack(const ScreenBackStack& stack, bool show_keys) {
    std::cout << "Stack: " << stack.size() << " record(s), version " << stack.version() << std::endl;

    std::size_t depth = 0;
    for (const auto& record : stack) {
        std::cout << (depth == 0 ? "  > " : "    ") << to_string(record.destination());
        if (depth + 1 == stack.size()) {
            std::cout << " (root)";
        }
        if (show_keys) {
            std::cout << "  [" << record.key() << "]";
        }
        std::cout << std::endl;
        ++depth;
    }
}

int cmd_replay(const GlobalOptions& opts, const ReplayOptions& replay_opts) {
    auto config = load_effective_config(opts);
    if (!config.ok) {
        print_error(config.error, opts.json);
        return 1;
    }

    auto content = read_file(replay_opts.script);
    if (!content) {
        print_error("cannot read script: " + replay_opts.script, opts.json);
        return 1;
    }

    auto script = json::parse_nav_script(*content, replay_opts.script);
    if (!script.ok) {
        print_error(script.error, opts.json);
        return 1;
    }
    for (const auto& w : script.warnings) {
        spdlog::warn("{}", w);
    }

    WarningCollector collector(config.config.warnings);
    ScreenBackStack stack;
    stack.set_key_audit(&collector);
    stack.subscribe([](const ScreenBackStack& s, const StackChange& change) {
        spdlog::debug("change {} v{} size={} +{} -{}", change_kind_to_string(change.kind),
                      change.version, s.size(), change.pushed, change.popped);
    });

    Navigator<Screen> navigator(stack, &collector);
    std::size_t root_pops = 0;
    navigator.set_on_root_pop([&root_pops]() { ++root_pops; });

    std::size_t rejected = 0;
    for (const auto& event : script.value) {
        if (!navigator.on_nav_event(event)) {
            ++rejected;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = !collector.has_errors() && rejected == 0;
        j["events"] = script.value.size();
        j["root_pops"] = root_pops;
        j["rejected"] = rejected;
        j["stack"] = json::stack_to_json(stack);
        j["duplicate_keys"] = find_duplicate_keys(stack);
        j["warnings"] = warnings_to_json(collector.get_warnings());
        output_json(j);
    } else {
        print_stack(stack, replay_opts.show_keys);
        if (root_pops > 0) {
            std::cout << "Pops at root: " << root_pops << std::endl;
        }
        if (rejected > 0) {
            std::cout << "Rejected events: " << rejected << std::endl;
        }
    }

    return (collector.has_errors() || rejected > 0) ? 1 : 0;
}

} // anonymous namespace

void setup_replay(CLI::App* app, GlobalOptions& opts) {
    static ReplayOptions replay_opts;

    app->add_option("script", replay_opts.script, "Navigation script (JSON)")->required();
    app->add_flag("--keys", replay_opts.show_keys, "Print record keys");

    app->callback([&opts]() {
        int rc = 1;
        try {
            rc = cmd_replay(opts, replay_opts);
        } catch (const std::exception& e) {
            print_error(e.what(), opts.json);
        }
        std::exit(rc);
    });
}

} // namespace navstack::cli::commands
