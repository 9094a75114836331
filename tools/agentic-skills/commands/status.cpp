/**
 * agentic-skills CLI - status command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace askills::cli::commands {

namespace {

struct StatusOptions {
    std::string path;
};

int cmd_status(const GlobalOptions& opts, const StatusOptions& status_opts) {
    init_warning_collector(opts.json, opts.quiet);
    init_logging(opts);

    auto root = resolve_installed_root(status_opts.path);
    if (root.isErr() && root.error().code() != ErrorCode::NOT_INSTALLED) {
        print_error(root.error(), opts.json);
        return exit_code_for(root.error());
    }

    StatusReport report;
    if (root.isOk()) {
        TerminalConfirmer confirmer;
        Orchestrator orchestrator(confirmer);
        auto result = orchestrator.status(root.value());
        if (result.isErr()) {
            print_error(result.error(), opts.json);
            return exit_code_for(result.error());
        }
        report = result.value();
    }

    if (opts.json) {
        nlohmann::json j;
        j["installed"] = report.installed;
        if (report.installed) {
            const Manifest& m = report.manifest;
            j["path"] = report.root;
            j["target"] = target_to_string(m.target);
            j["scope"] = scope_to_string(m.scope);
            j["version"] = m.version;
            j["installed_at"] = m.installed_at;
            j["source"] = m.source;
            j["skills"] = m.skills;
            j["agents"] = m.agents;
            j["hooks"] = m.hooks;
        }
        output_json(j);
        return kExitOk;
    }

    if (!report.installed) {
        std::cout << "Not installed" << std::endl;
        return kExitOk;
    }

    const Manifest& m = report.manifest;
    std::cout << "Target:       " << target_to_string(m.target) << std::endl;
    std::cout << "Path:         " << report.root << std::endl;
    std::cout << "Version:      " << m.version << std::endl;
    std::cout << "Installed at: " << m.installed_at << std::endl;
    std::cout << "Components: skills=" << m.skills.size() << " agents=" << m.agents.size()
              << " hooks=" << (m.hooks ? "true" : "false") << std::endl;
    if (opts.verbose) {
        std::cout << "Source:       " << m.source << std::endl;
        if (!m.skills.empty()) std::cout << "Skills:       " << join(m.skills) << std::endl;
        if (!m.agents.empty()) std::cout << "Agents:       " << join(m.agents) << std::endl;
    }
    return kExitOk;
}

} // namespace

void setup_status(CLI::App* app, GlobalOptions& opts) {
    static StatusOptions status_opts;

    app->add_option("--path", status_opts.path, "Target root of the installation");

    app->callback([&opts]() {
        std::exit(cmd_status(opts, status_opts));
    });
}

} // namespace askills::cli::commands
