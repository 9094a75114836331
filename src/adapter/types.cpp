#include "askills/types.hpp"

#include <algorithm>
#include <cctype>

namespace askills {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::optional<Scope> parse_scope(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "full") return Scope::Full;
    if (lower == "skills-only") return Scope::SkillsOnly;
    if (lower == "hooks-only") return Scope::HooksOnly;
    return std::nullopt;
}

std::optional<TargetKind> parse_target_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "claude" || lower == "claude-project") return TargetKind::Claude;
    if (lower == "opencode" || lower == "opencode-project") return TargetKind::OpenCode;
    if (lower == "codex" || lower == "codex-project") return TargetKind::Codex;
    if (lower == "codex-md") return TargetKind::CodexMd;
    return std::nullopt;
}

TargetSchema schema_for(TargetKind kind) {
    switch (kind) {
        case TargetKind::Claude: return ClaudeSchema{};
        case TargetKind::OpenCode: return OpenCodeSchema{};
        case TargetKind::Codex: return CodexSchema{};
        case TargetKind::CodexMd: return CodexMdSchema{};
    }
    return ClaudeSchema{};
}

TargetKind kind_of(const TargetSchema& schema) {
    return static_cast<TargetKind>(schema.index());
}

TargetLayout layout_for(TargetKind kind) {
    TargetLayout layout;
    switch (kind) {
        case TargetKind::Claude:
            layout.default_root = ".claude";
            layout.skills_dir = "skills";
            layout.agents_dir = "agents";
            layout.plugin_dir = "hooks";
            layout.settings_file = "settings.local.json";
            break;
        case TargetKind::OpenCode:
            layout.default_root = ".opencode";
            layout.skills_dir = "skills";
            layout.agents_dir = "agents";
            layout.plugin_dir = "plugins";
            layout.settings_file = "opencode.json";
            layout.loads_plugin_shims = true;
            break;
        case TargetKind::Codex:
            layout.default_root = ".codex";
            layout.skills_dir = "skills";
            layout.agents_dir = "agents";
            break;
        case TargetKind::CodexMd:
            layout.default_root = ".";
            layout.single_document = "codex.md";
            break;
    }
    return layout;
}

} // namespace askills
