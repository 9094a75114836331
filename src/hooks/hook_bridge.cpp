#include "askills/hook_bridge.hpp"

#include "askills/platform.hpp"

#include <spdlog/spdlog.h>

namespace askills::hooks {

// ============================================================================
// Wire formats
// ============================================================================

nlohmann::json opencode_prompt_request(const std::string& session_id, const std::string& text) {
    nlohmann::json part;
    part["type"] = "text";
    part["text"] = text;
    part["synthetic"] = true;

    nlohmann::json request;
    request["path"] = {{"id", session_id}};
    request["body"] = {{"noReply", true}, {"parts", nlohmann::json::array({part})}};
    return request;
}

nlohmann::json claude_context_output(const std::string& hook_event, const std::string& text) {
    nlohmann::json out;
    out["hookSpecificOutput"] = {
        {"hookEventName", hook_event},
        {"additionalContext", text},
    };
    return out;
}

nlohmann::json claude_tool_output(const nlohmann::json& updated_input, const std::string& reason) {
    nlohmann::json out;
    out["hookSpecificOutput"] = {
        {"hookEventName", "PreToolUse"},
        {"permissionDecision", "allow"},
        {"permissionDecisionReason", reason},
        {"updatedInput", updated_input},
    };
    return out;
}

// ============================================================================
// HookBridge
// ============================================================================

HookBridge::HookBridge(BridgeConfig config, SessionClient& client)
    : config_(std::move(config)), client_(client) {
    if (!config_.today) config_.today = get_current_date;
}

GuardDecision HookBridge::onToolBefore(const std::string& tool, nlohmann::json& args) const {
    return guard_.guard(tool, args);
}

void HookBridge::inject(const nlohmann::json& event, const std::string& text) {
    auto session_id = session_id_of(event);
    if (!session_id) {
        spdlog::debug("no session id; context not injected");
        return;
    }
    if (text.empty()) return;
    client_.prompt(*session_id, text);
}

void HookBridge::onEvent(const nlohmann::json& event) noexcept {
    try {
        std::string type;
        if (event.is_object() && event.contains("type") && event["type"].is_string()) {
            type = event["type"].get<std::string>();
        }

        if (type == "session.created") {
            inject(event, build_session_context(config_.directory, config_.today(), config_.git));
        } else if (type == "session.compacted") {
            inject(event, build_compact_context(config_.directory));
        } else if (type == "session.error") {
            append_failure_log(config_.directory, config_.host_dir, event);
        } else {
            spdlog::debug("ignoring event '{}'", type);
        }
    } catch (const std::exception& e) {
        spdlog::debug("event handler failed: {}", e.what());
    }
}

} // namespace askills::hooks
