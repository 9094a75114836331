/**
 * agentic-hooks - Runtime hook bridge
 *
 * Invoked by the host for every hook it dispatches. Reads the host's
 * payload on stdin and answers on stdout. A hook must never break the
 * host: malformed input produces no output and exit 0.
 */

#include <CLI/CLI.hpp>
#include <askills/hook_bridge.hpp>
#include <askills/platform.hpp>
#include <askills/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <iterator>
#include <optional>
#include <string>

namespace {

using askills::hooks::BridgeConfig;
using askills::hooks::HookBridge;
using askills::hooks::SessionClient;

struct HookOptions {
    std::string host = "opencode";
    std::string directory;
    std::string event_type;
};

void init_logging() {
    spdlog::set_default_logger(spdlog::stderr_color_mt("agentic-hooks"));
    spdlog::set_pattern("[agentic-hooks] %l: %v");
    auto debug = askills::get_env("ASKILLS_HOOKS_DEBUG");
    spdlog::set_level(debug && *debug == "1" ? spdlog::level::debug : spdlog::level::off);
}

std::optional<nlohmann::json> read_payload() {
    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    if (input.empty()) return nlohmann::json::object();
    try {
        return nlohmann::json::parse(input);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("ignoring malformed payload: {}", e.what());
        return std::nullopt;
    }
}

std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return {};
}

// opencode: the plugin shim forwards each request to session.prompt
class OpenCodeClient : public SessionClient {
public:
    void prompt(const std::string& session_id, const std::string& text) override {
        nlohmann::json out;
        out["prompt"] = askills::hooks::opencode_prompt_request(session_id, text);
        std::cout << out.dump() << std::endl;
    }
};

// claude: context is returned as the hook's additionalContext
class ClaudeClient : public SessionClient {
public:
    void prompt(const std::string& /* session_id */, const std::string& text) override {
        std::cout << askills::hooks::claude_context_output("SessionStart", text).dump()
                  << std::endl;
    }
};

std::string resolve_directory(const HookOptions& o, const nlohmann::json& payload) {
    if (!o.directory.empty()) return o.directory;
    std::string from_payload = string_field(payload, "cwd");
    if (from_payload.empty()) from_payload = string_field(payload, "directory");
    if (!from_payload.empty()) return from_payload;
    if (o.host == "claude") {
        auto project = askills::get_env("CLAUDE_PROJECT_DIR");
        if (project && !project->empty()) return *project;
    }
    return ".";
}

BridgeConfig make_config(const HookOptions& o, const nlohmann::json& payload) {
    BridgeConfig config;
    config.directory = resolve_directory(o, payload);
    config.host_dir = o.host == "claude" ? ".claude" : ".opencode";
    return config;
}

int cmd_tool_before(const HookOptions& o) {
    auto payload = read_payload();
    if (!payload || !payload->is_object()) return 0;

    if (o.host == "claude") {
        // PreToolUse: {"tool_name": ..., "tool_input": {...}}
        std::string tool = string_field(*payload, "tool_name");
        if (!payload->contains("tool_input")) return 0;
        nlohmann::json input = (*payload)["tool_input"];

        ClaudeClient client;
        HookBridge bridge(make_config(o, *payload), client);
        auto decision = bridge.onToolBefore(tool, input);
        if (decision.blocked()) {
            spdlog::debug("{} blocked by {}", tool, decision.rule);
            std::cout << askills::hooks::claude_tool_output(input, decision.reason).dump()
                      << std::endl;
        }
        return 0;
    }

    // opencode: {"tool": ..., "args": {...}}; answer with the (possibly rewritten) args
    std::string tool = string_field(*payload, "tool");
    nlohmann::json args = payload->contains("args") ? (*payload)["args"] : nlohmann::json::object();

    OpenCodeClient client;
    HookBridge bridge(make_config(o, *payload), client);
    auto decision = bridge.onToolBefore(tool, args);

    nlohmann::json out;
    out["args"] = args;
    out["blocked"] = decision.blocked();
    if (decision.blocked()) {
        spdlog::debug("{} blocked by {}", tool, decision.rule);
        out["reason"] = decision.reason;
    }
    std::cout << out.dump() << std::endl;
    return 0;
}

int cmd_event(const HookOptions& o) {
    auto payload = read_payload();
    if (!payload || !payload->is_object()) return 0;

    nlohmann::json event = *payload;
    if (!o.event_type.empty()) event["type"] = o.event_type;

    if (o.host == "claude") {
        ClaudeClient client;
        HookBridge bridge(make_config(o, *payload), client);
        bridge.onEvent(event);
    } else {
        OpenCodeClient client;
        HookBridge bridge(make_config(o, *payload), client);
        bridge.onEvent(event);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    init_logging();

    CLI::App app{"agentic-hooks - Runtime hook bridge"};
    app.set_version_flag("-V,--version", ASKILLS_VERSION);
    app.require_subcommand(1);

    HookOptions opts;

    auto* tool_cmd = app.add_subcommand("tool-before", "Guard a tool invocation");
    tool_cmd->add_option("--host", opts.host, "Host dispatching the hook")
        ->check(CLI::IsMember({"opencode", "claude"}));
    tool_cmd->add_option("--directory", opts.directory, "Project directory");
    tool_cmd->callback([&opts]() { std::exit(cmd_tool_before(opts)); });

    auto* event_cmd = app.add_subcommand("event", "Handle a session lifecycle event");
    event_cmd->add_option("type", opts.event_type,
                          "session.created, session.compacted or session.error");
    event_cmd->add_option("--host", opts.host, "Host dispatching the hook")
        ->check(CLI::IsMember({"opencode", "claude"}));
    event_cmd->add_option("--directory", opts.directory, "Project directory");
    event_cmd->callback([&opts]() { std::exit(cmd_event(opts)); });

    CLI11_PARSE(app, argc, argv);
    return 0;
}
