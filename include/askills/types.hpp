#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace askills {

// ============================================================================
// Bundle Units
// ============================================================================

// A skill directory. Content is opaque and copied verbatim.
struct SkillUnit {
    std::string name;
    std::string source_directory;          // Absolute path to skills/<name>
    std::vector<std::string> files;        // Relative to source_directory, sorted
    std::string description;               // From SKILL.md frontmatter (may be empty)
};

struct AgentFrontmatter {
    std::string name;
    std::string description;               // Unfolded, as written
    std::string model;
    std::vector<std::string> tools;        // Host tool names in source order
};

// An agent definition (agents/<name>.md)
struct AgentUnit {
    std::string name;                      // File stem
    std::string source_path;
    AgentFrontmatter frontmatter;
    std::string body;                      // Text after the closing frontmatter marker
    std::string raw;                       // Full source text
};

// Runtime hook bridge artifact (hooks/<file>)
struct HookArtifact {
    std::string name;
    std::string source_path;
    bool executable = false;
};

// ============================================================================
// Scope
// ============================================================================

enum class Scope {
    Full,
    SkillsOnly,
    HooksOnly
};

inline const char* scope_to_string(Scope s) {
    switch (s) {
        case Scope::Full: return "full";
        case Scope::SkillsOnly: return "skills-only";
        case Scope::HooksOnly: return "hooks-only";
        default: return "full";
    }
}

std::optional<Scope> parse_scope(const std::string& s);

inline bool scope_includes_skills(Scope s) { return s != Scope::HooksOnly; }
inline bool scope_includes_agents(Scope s) { return s == Scope::Full; }
inline bool scope_includes_hooks(Scope s) { return s != Scope::SkillsOnly; }

// ============================================================================
// Target Schemas
// ============================================================================
//
// The set of host layouts is closed. Each variant gets one pure conversion
// function per unit kind in adapter.cpp; adding a host means adding a variant
// here and its functions there.

struct ClaudeSchema {};

struct OpenCodeSchema {};

struct CodexSchema {
    static constexpr std::size_t kDescriptionCeiling = 1024;
};

struct CodexMdSchema {};

using TargetSchema = std::variant<ClaudeSchema, OpenCodeSchema, CodexSchema, CodexMdSchema>;

enum class TargetKind {
    Claude,
    OpenCode,
    Codex,
    CodexMd
};

inline const char* target_to_string(TargetKind t) {
    switch (t) {
        case TargetKind::Claude: return "claude";
        case TargetKind::OpenCode: return "opencode";
        case TargetKind::Codex: return "codex";
        case TargetKind::CodexMd: return "codex-md";
        default: return "claude";
    }
}

// Accepts the canonical names and the legacy manifest names
// (claude-project, opencode-project, codex-project, codex)
std::optional<TargetKind> parse_target_kind(const std::string& s);

TargetSchema schema_for(TargetKind kind);
TargetKind kind_of(const TargetSchema& schema);

// Directory conventions of a target root. Empty strings mean "not supported".
struct TargetLayout {
    std::string default_root;      // Relative to the working directory
    std::string skills_dir;
    std::string agents_dir;
    std::string plugin_dir;        // Where hook bridge artifacts land
    bool loads_plugin_shims = false;   // Host loads .js/.mjs/.ts shims from plugin_dir
    std::string settings_file;     // Governed host JSON document
    std::string single_document;   // Single-document targets only

    bool supports_hooks() const { return !plugin_dir.empty(); }
    bool is_single_document() const { return !single_document.empty(); }
};

TargetLayout layout_for(TargetKind kind);

} // namespace askills
