/**
 * agentic-skills CLI - update command
 *
 * Re-deploy the recorded scope from the current bundle.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace askills::cli::commands {

namespace {

struct UpdateOptions {
    std::string path;
    bool force = false;
    bool dry_run = false;
};

int cmd_update(const GlobalOptions& opts, const UpdateOptions& update_opts) {
    init_warning_collector(opts.json, opts.quiet);
    init_logging(opts);

    auto root = resolve_installed_root(update_opts.path);
    if (root.isErr()) {
        print_error(root.error(), opts.json);
        return exit_code_for(root.error());
    }

    UpdateRequest request;
    request.root = root.value();
    request.force = update_opts.force;
    request.dry_run = update_opts.dry_run;

    // An unreadable manifest is reported by the orchestrator itself
    std::optional<std::string> recorded_source;
    auto existing = read_manifest(request.root);
    if (existing.isOk()) recorded_source = existing.value().source;
    request.bundle_root = resolve_bundle_root(opts.bundle, recorded_source);

    TerminalConfirmer confirmer;
    Orchestrator orchestrator(confirmer);
    auto result = orchestrator.update(request);
    if (result.isErr()) {
        if (result.error().code() == ErrorCode::ABORTED) {
            print_success("Update cancelled; nothing was changed.", opts.json);
            return kExitOk;
        }
        print_error(result.error(), opts.json);
        return exit_code_for(result.error());
    }

    return report_operation("Updated", result.value(), opts);
}

} // namespace

void setup_update(CLI::App* app, GlobalOptions& opts) {
    static UpdateOptions update_opts;

    app->add_option("--path", update_opts.path, "Target root of the installation");
    app->add_flag("--force", update_opts.force, "Overwrite files this tool does not own");
    app->add_flag("--dry-run", update_opts.dry_run, "Show the plan without writing");

    app->callback([&opts]() {
        std::exit(cmd_update(opts, update_opts));
    });
}

} // namespace askills::cli::commands
