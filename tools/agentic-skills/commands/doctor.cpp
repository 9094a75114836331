/**
 * agentic-skills CLI - doctor command
 *
 * Read-only consistency checks for an installation.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace askills::cli::commands {

namespace {

struct DoctorOptions {
    std::string path;
};

const char* status_marker(CheckStatus status) {
    switch (status) {
        case CheckStatus::Pass: return "[ok]  ";
        case CheckStatus::Fail: return "[FAIL]";
        case CheckStatus::Warn: return "[warn]";
        default: return "[?]   ";
    }
}

int cmd_doctor(const GlobalOptions& opts, const DoctorOptions& doctor_opts) {
    init_warning_collector(opts.json, opts.quiet);
    init_logging(opts);

    auto root = resolve_installed_root(doctor_opts.path);
    if (root.isErr()) {
        print_error(root.error(), opts.json);
        return exit_code_for(root.error());
    }

    TerminalConfirmer confirmer;
    Orchestrator orchestrator(confirmer);
    DoctorReport report = orchestrator.doctor(root.value());

    int code = !report.installed ? kExitNotInstalled
                                 : (report.healthy() ? kExitOk : kExitFailure);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = report.healthy();
        j["installed"] = report.installed;
        j["path"] = report.root;
        if (report.manifest) j["target"] = target_to_string(report.manifest->target);

        nlohmann::json checks = nlohmann::json::array();
        for (const auto& c : report.checks) {
            nlohmann::json check;
            check["name"] = c.name;
            check["status"] = check_status_to_string(c.status);
            if (!c.detail.empty()) check["detail"] = c.detail;
            checks.push_back(check);
        }
        j["checks"] = checks;
        j["summary"] = {{"passed", report.tally.passed},
                        {"failed", report.tally.failed},
                        {"warnings", report.tally.warned}};
        output_json(j);
        return code;
    }

    if (!report.installed) {
        std::cout << "Not installed: " << report.root << std::endl;
        return code;
    }

    std::cout << "Checking " << report.root;
    if (report.manifest) std::cout << " (" << target_to_string(report.manifest->target) << ")";
    std::cout << std::endl;

    for (const auto& c : report.checks) {
        if (opts.quiet && c.status == CheckStatus::Pass) continue;
        std::cout << "  " << status_marker(c.status) << " " << c.name;
        if (!c.detail.empty()) std::cout << ": " << c.detail;
        std::cout << std::endl;
    }

    std::cout << std::endl;
    std::cout << report.tally.passed << " passed, " << report.tally.failed << " failed, "
              << report.tally.warned << " warning(s)" << std::endl;
    return code;
}

} // namespace

void setup_doctor(CLI::App* app, GlobalOptions& opts) {
    static DoctorOptions doctor_opts;

    app->add_option("--path", doctor_opts.path, "Target root of the installation");

    app->callback([&opts]() {
        std::exit(cmd_doctor(opts, doctor_opts));
    });
}

} // namespace askills::cli::commands
