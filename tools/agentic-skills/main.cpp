/**
 * agentic-skills CLI - Entry Point
 *
 * Installs a bundle of skills, agents and hooks into an agent host's
 * project directory and keeps it in sync.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace askills::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_update(CLI::App* app, GlobalOptions& opts);
    void setup_self_update(CLI::App* app, GlobalOptions& opts);
    void setup_uninstall(CLI::App* app, GlobalOptions& opts);
    void setup_doctor(CLI::App* app, GlobalOptions& opts);
    void setup_status(CLI::App* app, GlobalOptions& opts);
    void setup_version(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace askills::cli;

    CLI::App app{"agentic-skills - Skills, agents and hooks for agent hosts"};
    app.set_version_flag("-V,--version", ASKILLS_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--bundle", opts.bundle, "Source bundle directory");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Install the bundle into a host directory");
    commands::setup_install(install_cmd, opts);

    auto* update_cmd = app.add_subcommand("update", "Re-deploy an installation from its bundle");
    commands::setup_update(update_cmd, opts);

    auto* self_update_cmd = app.add_subcommand("self-update", "Update an installation from a new source");
    commands::setup_self_update(self_update_cmd, opts);

    auto* uninstall_cmd = app.add_subcommand("uninstall", "Remove everything an installation deployed");
    commands::setup_uninstall(uninstall_cmd, opts);

    auto* doctor_cmd = app.add_subcommand("doctor", "Check an installation for consistency");
    commands::setup_doctor(doctor_cmd, opts);

    auto* status_cmd = app.add_subcommand("status", "Summarize an installation");
    commands::setup_status(status_cmd, opts);

    auto* version_cmd = app.add_subcommand("version", "Print the tool version");
    commands::setup_version(version_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
