#pragma once

#include "askills/command_guard.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace askills::hooks {

// ============================================================================
// Session Context
// ============================================================================

constexpr std::size_t kContextHeadLimit = 500;

struct GitSnapshot {
    std::string branch;        // Empty when detached
    std::size_t uncommitted_files = 0;
};

using GitProbe = std::function<std::optional<GitSnapshot>(const std::string& directory)>;

// `git branch --show-current` + `git status --porcelain`; nullopt outside a repo
std::optional<GitSnapshot> probe_git(const std::string& directory);

// First `limit` bytes (never splitting a UTF-8 sequence), trimmed.
// nullopt when unreadable or empty.
std::optional<std::string> read_head(const std::string& path, std::size_t limit = kContextHeadLimit);

std::string build_session_context(const std::string& directory, const std::string& date,
                                  const GitProbe& git);

std::string build_compact_context(const std::string& directory);

// properties.info.id, properties.sessionID, session.id, session_id
std::optional<std::string> session_id_of(const nlohmann::json& event);

// ============================================================================
// Failure Log
// ============================================================================

std::string failure_log_path(const std::string& directory, const std::string& host_dir);

// Append {"timestamp","type","properties"} as one JSON line. Never throws.
void append_failure_log(const std::string& directory, const std::string& host_dir,
                        const nlohmann::json& event) noexcept;

// ============================================================================
// Host Delivery
// ============================================================================

class SessionClient {
public:
    virtual ~SessionClient() = default;

    /// Deliver a synthetic, no-reply message to a session
    virtual void prompt(const std::string& session_id, const std::string& text) = 0;
};

// opencode session.prompt request
nlohmann::json opencode_prompt_request(const std::string& session_id, const std::string& text);

// claude hookSpecificOutput carrying additionalContext
nlohmann::json claude_context_output(const std::string& hook_event, const std::string& text);

// claude PreToolUse output replacing the tool input
nlohmann::json claude_tool_output(const nlohmann::json& updated_input, const std::string& reason);

// ============================================================================
// Hook Bridge
// ============================================================================

struct BridgeConfig {
    std::string directory;                 // Project directory
    std::string host_dir = ".opencode";    // Where the failure log lives
    GitProbe git = probe_git;
    std::function<std::string()> today;    // Defaults to the current UTC date
};

class HookBridge {
public:
    HookBridge(BridgeConfig config, SessionClient& client);

    /// tool.execute.before: guard shell commands, rewriting args in place
    GuardDecision onToolBefore(const std::string& tool, nlohmann::json& args) const;

    /// Lifecycle events: session.created, session.compacted, session.error.
    /// Never throws; failures are logged at debug level.
    void onEvent(const nlohmann::json& event) noexcept;

    const BridgeConfig& config() const { return config_; }

private:
    void inject(const nlohmann::json& event, const std::string& text);

    BridgeConfig config_;
    SessionClient& client_;
    CommandGuard guard_;
};

} // namespace askills::hooks
