/**
 * agentic-skills CLI - uninstall command
 *
 * Remove exactly what an installation recorded.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace askills::cli::commands {

namespace {

struct UninstallOptions {
    std::string path;
    bool force = false;
};

int cmd_uninstall(const GlobalOptions& opts, const UninstallOptions& uninstall_opts) {
    init_warning_collector(opts.json, opts.quiet);
    init_logging(opts);

    auto root = resolve_installed_root(uninstall_opts.path);
    if (root.isErr()) {
        print_error(root.error(), opts.json);
        return exit_code_for(root.error());
    }

    TerminalConfirmer confirmer;
    Orchestrator orchestrator(confirmer);
    auto result = orchestrator.uninstall(root.value(), uninstall_opts.force || opts.json);
    if (result.isErr()) {
        if (result.error().code() == ErrorCode::ABORTED) {
            print_success("Uninstall cancelled; nothing was removed.", opts.json);
            return kExitOk;
        }
        print_error(result.error(), opts.json);
        return exit_code_for(result.error());
    }

    const UninstallReport& report = result.value();
    for (const auto& w : report.warnings) print_warning(w, opts.json);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = report.root;
        j["removed"] = report.removed;
        j["missing"] = report.missing;
        j["settings_changed"] = report.settings_changed;
        j["settings_removed"] = report.settings_removed;
        output_json(j);
        return kExitOk;
    }

    print_success("Uninstalled from " + report.root, opts.json);
    if (!opts.quiet) {
        std::cout << "  Files removed: " << report.removed << std::endl;
        if (!report.missing.empty()) {
            std::cout << "  Already missing: " << join(report.missing) << std::endl;
        }
        if (report.settings_removed) {
            std::cout << "  Settings: removed (created by install)" << std::endl;
        } else if (report.settings_changed) {
            std::cout << "  Settings: hook entries removed" << std::endl;
        }
    }
    return kExitOk;
}

} // namespace

void setup_uninstall(CLI::App* app, GlobalOptions& opts) {
    static UninstallOptions uninstall_opts;

    app->add_option("--path", uninstall_opts.path, "Target root of the installation");
    app->add_flag("-f,--force", uninstall_opts.force, "Do not ask for confirmation");

    app->callback([&opts]() {
        std::exit(cmd_uninstall(opts, uninstall_opts));
    });
}

} // namespace askills::cli::commands
