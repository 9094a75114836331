#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace askills::hooks {

// ============================================================================
// Command Guard
// ============================================================================

enum class GuardVerdict {
    Allow,
    DestructiveDelete,
    SecretFileRead
};

enum class RuleAction {
    Block
};

struct HookRule {
    std::string name;
    std::regex pattern;
    RuleAction action = RuleAction::Block;
    std::string reason;
    GuardVerdict verdict = GuardVerdict::Allow;
};

struct GuardDecision {
    GuardVerdict verdict = GuardVerdict::Allow;
    std::string rule;          // Which detector fired
    std::string reason;
    std::string rewritten;     // Replacement command when blocked

    bool blocked() const { return verdict != GuardVerdict::Allow; }
};

// Where a command string was found inside tool arguments
struct CommandSlot {
    std::string wrapper;       // "", "input" or "payload"
    std::string key;           // "command", "cmd" or "script"
    std::string command;
};

// Collapse whitespace runs to single spaces and trim
std::string normalize_command(const std::string& command);

// printf '%s\n' '<reason>' >&2; exit 2
std::string block_command(const std::string& reason);

std::optional<CommandSlot> extract_command(const nlohmann::json& args);

// Replace the command at the slot it was read from
void set_command(nlohmann::json& args, const CommandSlot& slot, const std::string& command);

class CommandGuard {
public:
    CommandGuard();

    /// Classify a raw command line
    GuardDecision evaluate(const std::string& command) const;

    /// Guard a tool invocation, rewriting args in place when blocked
    GuardDecision guard(const std::string& tool, nlohmann::json& args) const;

    const std::vector<HookRule>& rules() const { return rules_; }

private:
    std::optional<std::string> match_rules(const std::string& normalized,
                                           GuardVerdict verdict) const;

    std::vector<HookRule> rules_;
    std::regex allowed_env_;
};

// Tokenizing detectors, usable on their own
bool is_destructive_delete(const std::string& command);
bool is_secret_file_read(const std::string& command);

// File name (no directory) is a dotenv file outside the allowed templates
bool is_protected_env_name(const std::string& filename);

} // namespace askills::hooks
