#include "askills/adapter.hpp"

#include "askills/frontmatter.hpp"
#include "askills/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <variant>

namespace askills {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const char* const kOpenCodeTools[] = {
    "bash", "edit", "glob", "grep", "list", "patch",
    "read", "todoread", "todowrite", "webfetch", "write",
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Conversion violation(const std::string& unit, const std::string& constraint) {
    return Conversion::err(SchemaViolation{unit, constraint});
}

std::string skill_id(const SkillUnit& s) { return "skill:" + s.name; }
std::string agent_id(const AgentUnit& a) { return "agent:" + a.name; }

// Code points, not bytes; continuation bytes are not counted
size_t utf8_length(const std::string& s) {
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

// Description rules shared by every codex artifact
std::optional<std::string> check_codex_description(const std::string& description,
                                                   std::string& folded) {
    folded = fold_whitespace(description);
    if (folded.empty()) return std::string("description is required");
    size_t length = utf8_length(folded);
    if (length > CodexSchema::kDescriptionCeiling) {
        return "description exceeds " + std::to_string(CodexSchema::kDescriptionCeiling) +
               " characters (" + std::to_string(length) + ")";
    }
    return std::nullopt;
}

Conversion copy_skill_directory(const SkillUnit& skill, const std::string& skills_dir) {
    std::vector<HostFile> files;
    for (const auto& rel : skill.files) {
        std::string src = join_path(skill.source_directory, rel);
        auto content = read_file(src);
        if (!content) return violation(skill_id(skill), "unreadable source file: " + rel);

        HostFile f;
        f.rel_path = skills_dir + "/" + skill.name + "/" + rel;
        f.content = std::move(*content);
        f.executable = is_executable(src);
        files.push_back(std::move(f));
    }
    return Conversion::ok(std::move(files));
}

std::string document_section(const char* kind, const std::string& name, const std::string& text) {
    return "---\n\n## " + std::string(kind) + ": " + name + "\n\n" + text + "\n";
}

// ----------------------------------------------------------------------------
// Skills
// ----------------------------------------------------------------------------

Conversion convert_claude(const SkillUnit& skill) {
    return copy_skill_directory(skill, layout_for(TargetKind::Claude).skills_dir);
}

Conversion convert_opencode(const SkillUnit& skill) {
    return copy_skill_directory(skill, layout_for(TargetKind::OpenCode).skills_dir);
}

Conversion convert_codex(const SkillUnit& skill) {
    std::string folded;
    if (auto problem = check_codex_description(skill.description, folded)) {
        return violation(skill_id(skill), "SKILL.md " + *problem);
    }
    return copy_skill_directory(skill, layout_for(TargetKind::Codex).skills_dir);
}

Conversion convert_codex_md(const SkillUnit& skill) {
    auto content = read_file(join_path(skill.source_directory, "SKILL.md"));
    if (!content) return violation(skill_id(skill), "unreadable source file: SKILL.md");

    HostFile f;
    f.rel_path = layout_for(TargetKind::CodexMd).single_document;
    f.content = document_section("Skill", skill.name, *content);
    return Conversion::ok({f});
}

// ----------------------------------------------------------------------------
// Agents
// ----------------------------------------------------------------------------

std::string agent_rel_path(TargetKind target, const AgentUnit& agent) {
    return layout_for(target).agents_dir + "/" + agent.name + ".md";
}

Conversion convert_claude(const AgentUnit& agent) {
    HostFile f;
    f.rel_path = agent_rel_path(TargetKind::Claude, agent);
    f.content = agent.raw;
    return Conversion::ok({f});
}

Conversion convert_opencode(const AgentUnit& agent) {
    std::string description = fold_whitespace(agent.frontmatter.description);
    if (description.empty()) return violation(agent_id(agent), "description is required");

    std::string out = "---\n";
    out += "description: " + yaml_quote(description) + "\n";
    out += "mode: subagent\n";
    if (agent.frontmatter.model.find('/') != std::string::npos) {
        out += "model: " + agent.frontmatter.model + "\n";
    }
    out += "tools:\n";
    for (const auto& [tool, allowed] : opencode_tool_map(agent.frontmatter.tools)) {
        out += "  " + tool + ": " + (allowed ? "true" : "false") + "\n";
    }
    out += "---\n";
    out += agent.body;

    HostFile f;
    f.rel_path = agent_rel_path(TargetKind::OpenCode, agent);
    f.content = std::move(out);
    return Conversion::ok({f});
}

Conversion convert_codex(const AgentUnit& agent) {
    std::string folded;
    if (auto problem = check_codex_description(agent.frontmatter.description, folded)) {
        return violation(agent_id(agent), *problem);
    }

    std::string name = agent.frontmatter.name.empty() ? agent.name : agent.frontmatter.name;
    std::string out = "---\n";
    out += "name: " + name + "\n";
    out += "description: " + yaml_quote(folded) + "\n";
    if (!agent.frontmatter.model.empty()) {
        out += "model: " + agent.frontmatter.model + "\n";
    }
    if (!agent.frontmatter.tools.empty()) {
        std::string joined;
        for (const auto& t : agent.frontmatter.tools) {
            if (!joined.empty()) joined += ", ";
            joined += t;
        }
        out += "tools: " + joined + "\n";
    }
    out += "---\n";
    out += agent.body;

    HostFile f;
    f.rel_path = agent_rel_path(TargetKind::Codex, agent);
    f.content = std::move(out);
    return Conversion::ok({f});
}

Conversion convert_codex_md(const AgentUnit& agent) {
    HostFile f;
    f.rel_path = layout_for(TargetKind::CodexMd).single_document;
    f.content = document_section("Agent", agent.name, agent.raw);
    return Conversion::ok({f});
}

} // namespace

// ============================================================================
// Public conversion API
// ============================================================================

Conversion convert(const SkillUnit& skill, const TargetSchema& schema) {
    return std::visit(overloaded{
        [&](const ClaudeSchema&) { return convert_claude(skill); },
        [&](const OpenCodeSchema&) { return convert_opencode(skill); },
        [&](const CodexSchema&) { return convert_codex(skill); },
        [&](const CodexMdSchema&) { return convert_codex_md(skill); },
    }, schema);
}

Conversion convert(const AgentUnit& agent, const TargetSchema& schema) {
    return std::visit(overloaded{
        [&](const ClaudeSchema&) { return convert_claude(agent); },
        [&](const OpenCodeSchema&) { return convert_opencode(agent); },
        [&](const CodexSchema&) { return convert_codex(agent); },
        [&](const CodexMdSchema&) { return convert_codex_md(agent); },
    }, schema);
}

std::vector<std::pair<std::string, bool>> opencode_tool_map(const std::vector<std::string>& tools) {
    std::map<std::string, bool> granted;
    for (const char* t : kOpenCodeTools) granted[t] = tools.empty();

    for (const auto& raw : tools) {
        std::string name = to_lower(trim(raw));
        if (name == "multiedit") name = "edit";
        if (name == "ls") name = "list";
        auto it = granted.find(name);
        if (it != granted.end()) it->second = true;
    }

    return {granted.begin(), granted.end()};
}

std::string roster_line(size_t skills, size_t agents) {
    return "> " + std::to_string(skills) + " expert-level domain skills + " +
           std::to_string(agents) + " specialized agents.";
}

// ============================================================================
// Deployment Plan
// ============================================================================

Result<DeploymentPlan> plan_deployment(const SourceBundle& bundle, TargetKind target, Scope scope,
                                       const std::string& root) {
    TargetLayout layout = layout_for(target);
    TargetSchema schema = schema_for(target);

    DeploymentPlan plan;
    plan.target = target;
    plan.scope = scope;
    plan.root = root;

    bool want_hooks = scope_includes_hooks(scope);
    if (want_hooks && !layout.supports_hooks()) {
        if (scope == Scope::HooksOnly) {
            return Result<DeploymentPlan>::err(Error(
                ErrorCode::INVALID_ARGUMENT,
                std::string("hooks are not supported for target ") + target_to_string(target)));
        }
        plan.warnings.push_back(std::string("hooks are not supported for target ") +
                                target_to_string(target) + "; skipped");
        want_hooks = false;
    }
    if (want_hooks && !bundle.has_hooks()) {
        if (scope == Scope::HooksOnly) {
            return Result<DeploymentPlan>::err(
                Error(ErrorCode::BUNDLE_INVALID, "bundle has no hook artifacts: " + bundle.root));
        }
        plan.warnings.push_back("bundle has no hook artifacts; hooks skipped");
        want_hooks = false;
    }

    // Shims alone would register hooks that can never run
    std::vector<const HookArtifact*> artifacts;
    if (want_hooks) {
        bool bridge = false;
        for (const auto& artifact : bundle.hook_artifacts) {
            if (artifact.name == kHookToken && artifact.executable) bridge = true;
            if (is_plugin_shim(artifact.name) && !layout.loads_plugin_shims) continue;
            artifacts.push_back(&artifact);
        }
        if (!bridge) {
            return Result<DeploymentPlan>::err(Error(
                ErrorCode::BUNDLE_INVALID, std::string("bundle has no executable ") + kHookToken +
                                               " in " + join_path(bundle.root, "hooks")));
        }
    }

    std::vector<HostFile> sections;
    auto collect = [&](Conversion&& conv, const std::string& name,
                       std::vector<std::string>& names) {
        if (conv.isErr()) {
            spdlog::debug("conversion failed: {}", conv.error().toString());
            plan.violations.push_back(conv.error());
            return;
        }
        names.push_back(name);
        for (auto& f : conv.value()) {
            if (layout.is_single_document()) {
                sections.push_back(std::move(f));
            } else {
                plan.files.push_back(std::move(f));
            }
        }
    };

    if (scope_includes_skills(scope)) {
        for (const auto& skill : bundle.skills) collect(convert(skill, schema), skill.name, plan.skills);
    }
    if (scope_includes_agents(scope)) {
        for (const auto& agent : bundle.agents) collect(convert(agent, schema), agent.name, plan.agents);
    }

    if (layout.is_single_document() && (!plan.skills.empty() || !plan.agents.empty())) {
        HostFile doc;
        doc.rel_path = layout.single_document;
        doc.content = "# Agentic Skills\n\n" + roster_line(plan.skills.size(), plan.agents.size()) +
                      "\n\n";
        for (const auto& s : sections) doc.content += s.content;
        plan.files.push_back(std::move(doc));
    }

    if (want_hooks) {
        for (const HookArtifact* artifact : artifacts) {
            auto content = read_file(artifact->source_path);
            if (!content) {
                return Result<DeploymentPlan>::err(
                    Error(ErrorCode::IO_ERROR, "failed to read hook artifact: " +
                                                   artifact->source_path));
            }
            HostFile f;
            f.rel_path = layout.plugin_dir + "/" + artifact->name;
            f.content = std::move(*content);
            f.executable = artifact->executable;
            plan.plugin_files.push_back(f.rel_path);
            plan.files.push_back(std::move(f));
        }
        plan.hooks = true;

        SettingsJson fragment = governed_fragment(target, root, plan.plugin_files);
        if (!fragment.is_null()) {
            plan.settings = PlannedSettings{layout.settings_file, std::move(fragment)};
        }
    }

    std::sort(plan.files.begin(), plan.files.end(),
              [](const HostFile& a, const HostFile& b) { return a.rel_path < b.rel_path; });

    return Result<DeploymentPlan>::ok(std::move(plan));
}

} // namespace askills
