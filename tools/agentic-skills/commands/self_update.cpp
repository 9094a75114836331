/**
 * agentic-skills CLI - self-update command
 *
 * Update an installation from an explicitly named source bundle.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace askills::cli::commands {

namespace {

struct SelfUpdateOptions {
    std::string source;
    std::string path;
    bool yes = false;
    bool force = false;
};

int cmd_self_update(const GlobalOptions& opts, const SelfUpdateOptions& self_opts) {
    init_warning_collector(opts.json, opts.quiet);
    init_logging(opts);

    auto root = resolve_installed_root(self_opts.path);
    if (root.isErr()) {
        print_error(root.error(), opts.json);
        return exit_code_for(root.error());
    }

    SelfUpdateRequest request;
    request.source = self_opts.source.empty() ? resolve_bundle_root(opts.bundle) : self_opts.source;
    request.root = root.value();
    request.yes = self_opts.yes || opts.json;
    request.force = self_opts.force;

    TerminalConfirmer confirmer;
    Orchestrator orchestrator(confirmer);
    auto result = orchestrator.selfUpdate(request);
    if (result.isErr()) {
        if (result.error().code() == ErrorCode::ABORTED) {
            print_success("Self-update cancelled; nothing was changed.", opts.json);
            return kExitOk;
        }
        print_error(result.error(), opts.json);
        return exit_code_for(result.error());
    }

    return report_operation("Updated", result.value(), opts);
}

} // namespace

void setup_self_update(CLI::App* app, GlobalOptions& opts) {
    static SelfUpdateOptions self_opts;

    app->add_option("--source", self_opts.source, "New source bundle directory");
    app->add_option("--path", self_opts.path, "Target root of the installation");
    app->add_flag("-y,--yes", self_opts.yes, "Do not ask for confirmation");
    app->add_flag("--force", self_opts.force, "Overwrite files this tool does not own");

    app->callback([&opts]() {
        std::exit(cmd_self_update(opts, self_opts));
    });
}

} // namespace askills::cli::commands
