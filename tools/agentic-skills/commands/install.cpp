/**
 * agentic-skills CLI - install command
 *
 * Deploy the bundle into a host directory.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace askills::cli::commands {

namespace {

struct InstallOptions {
    bool claude = false;
    bool opencode = false;
    bool codex = false;
    bool codex_md = false;
    bool skills_only = false;
    bool hooks_only = false;
    bool force = false;
    bool dry_run = false;
    std::string path;
};

TargetKind selected_target(const InstallOptions& o) {
    if (o.opencode) return TargetKind::OpenCode;
    if (o.codex) return TargetKind::Codex;
    if (o.codex_md) return TargetKind::CodexMd;
    return TargetKind::Claude;
}

Scope selected_scope(const InstallOptions& o) {
    if (o.skills_only) return Scope::SkillsOnly;
    if (o.hooks_only) return Scope::HooksOnly;
    return Scope::Full;
}

int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts) {
    init_warning_collector(opts.json, opts.quiet);
    init_logging(opts);

    InstallRequest request;
    request.target = selected_target(install_opts);
    request.scope = selected_scope(install_opts);
    request.root = install_opts.path.empty()
                       ? layout_for(request.target).default_root
                       : install_opts.path;
    request.bundle_root = resolve_bundle_root(opts.bundle);
    request.force = install_opts.force;
    request.dry_run = install_opts.dry_run;

    spdlog::debug("installing {} ({}) from {} into {}", target_to_string(request.target),
                  scope_to_string(request.scope), request.bundle_root, request.root);

    TerminalConfirmer confirmer;
    Orchestrator orchestrator(confirmer);
    auto result = orchestrator.install(request);
    if (result.isErr()) {
        if (result.error().code() == ErrorCode::ABORTED) {
            print_success("Install cancelled; nothing was changed.", opts.json);
            return kExitOk;
        }
        print_error(result.error(), opts.json);
        return exit_code_for(result.error());
    }

    return report_operation("Installed", result.value(), opts);
}

} // namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;

    auto* claude = app->add_flag("--claude", install_opts.claude, "Claude Code layout (default)");
    auto* opencode = app->add_flag("--opencode", install_opts.opencode, "OpenCode layout");
    auto* codex = app->add_flag("--codex", install_opts.codex, "Codex layout");
    auto* codex_md = app->add_flag("--codex-md", install_opts.codex_md, "Single codex.md document");
    claude->excludes(opencode)->excludes(codex)->excludes(codex_md);
    opencode->excludes(codex)->excludes(codex_md);
    codex->excludes(codex_md);

    auto* skills_only = app->add_flag("--skills-only", install_opts.skills_only, "Install skills only");
    auto* hooks_only = app->add_flag("--hooks-only", install_opts.hooks_only, "Install hooks only");
    skills_only->excludes(hooks_only);

    app->add_flag("--force", install_opts.force, "Overwrite files this tool does not own");
    app->add_option("--path", install_opts.path, "Target root (default: the host's directory)");
    app->add_flag("--dry-run", install_opts.dry_run, "Show the plan without writing");

    app->callback([&opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace askills::cli::commands
