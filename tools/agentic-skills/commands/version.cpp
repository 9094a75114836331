/**
 * agentic-skills CLI - version command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace askills::cli::commands {

void setup_version(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        if (opts.json) {
            output_json({{"version", Orchestrator::version()}});
        } else {
            std::cout << Orchestrator::version() << std::endl;
        }
        std::exit(kExitOk);
    });
}

} // namespace askills::cli::commands
