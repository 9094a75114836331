#include <doctest/doctest.h>
#include <askills/hook_bridge.hpp>
#include <askills/platform.hpp>
#include "support/test_bundle.hpp"

#include <utility>
#include <vector>

using namespace askills::hooks;
using askills::test::TempDir;

namespace {

class RecordingClient : public SessionClient {
public:
    void prompt(const std::string& session_id, const std::string& text) override {
        calls.emplace_back(session_id, text);
    }

    std::vector<std::pair<std::string, std::string>> calls;
};

BridgeConfig test_config(const std::string& directory) {
    BridgeConfig config;
    config.directory = directory;
    config.git = [](const std::string&) -> std::optional<GitSnapshot> { return std::nullopt; };
    config.today = [] { return std::string("2026-01-02"); };
    return config;
}

} // namespace

TEST_CASE("HookBridge injects session context") {
    TempDir temp;
    RecordingClient client;
    HookBridge bridge(test_config(temp.path()), client);

    bridge.onEvent(nlohmann::json::parse(
        R"({"type": "session.created", "properties": {"info": {"id": "s1"}}})"));
    REQUIRE(client.calls.size() == 1);
    CHECK(client.calls[0].first == "s1");
    CHECK(client.calls[0].second == "Date: 2026-01-02");

    bridge.onEvent(nlohmann::json::parse(
        R"({"type": "session.compacted", "properties": {"sessionID": "s1"}})"));
    REQUIRE(client.calls.size() == 2);
    CHECK(client.calls[1].second.rfind("CRITICAL CONTEXT TO PRESERVE AFTER COMPACTION:", 0) == 0);
}

TEST_CASE("HookBridge skips injection without a session id") {
    TempDir temp;
    RecordingClient client;
    HookBridge bridge(test_config(temp.path()), client);

    bridge.onEvent(nlohmann::json::parse(R"({"type": "session.created"})"));
    bridge.onEvent(nlohmann::json::parse(R"({"type": "message.updated", "session_id": "s"})"));
    bridge.onEvent(nlohmann::json(42));
    CHECK(client.calls.empty());
}

TEST_CASE("HookBridge logs session errors under the host directory") {
    TempDir temp;
    RecordingClient client;
    BridgeConfig config = test_config(temp.path());
    config.host_dir = ".claude";
    HookBridge bridge(config, client);

    bridge.onEvent(nlohmann::json::parse(R"({"type": "session.error", "properties": {}})"));
    CHECK(client.calls.empty());
    CHECK(askills::is_regular_file(temp.sub(".claude/hooks/logs/tool_failures.jsonl")));
}

TEST_CASE("HookBridge guards shell tools") {
    TempDir temp;
    RecordingClient client;
    HookBridge bridge(test_config(temp.path()), client);

    nlohmann::json args = {{"command", "cat .env"}};
    auto decision = bridge.onToolBefore("bash", args);
    CHECK(decision.verdict == GuardVerdict::SecretFileRead);
    CHECK(args["command"] == decision.rewritten);
}

TEST_CASE("host wire formats") {
    auto request = opencode_prompt_request("s1", "hello");
    CHECK(request == nlohmann::json::parse(R"({
        "path": {"id": "s1"},
        "body": {"noReply": true, "parts": [{"type": "text", "text": "hello", "synthetic": true}]}
    })"));

    auto context = claude_context_output("SessionStart", "ctx");
    CHECK(context["hookSpecificOutput"]["hookEventName"] == "SessionStart");
    CHECK(context["hookSpecificOutput"]["additionalContext"] == "ctx");

    auto tool = claude_tool_output({{"command", "true"}}, "blocked");
    CHECK(tool["hookSpecificOutput"]["hookEventName"] == "PreToolUse");
    CHECK(tool["hookSpecificOutput"]["permissionDecision"] == "allow");
    CHECK(tool["hookSpecificOutput"]["permissionDecisionReason"] == "blocked");
    CHECK(tool["hookSpecificOutput"]["updatedInput"]["command"] == "true");
}
