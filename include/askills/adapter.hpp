#pragma once

#include "askills/bundle.hpp"
#include "askills/result.hpp"
#include "askills/settings_merge.hpp"
#include "askills/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace askills {

// ============================================================================
// Host Files
// ============================================================================

struct HostFile {
    std::string rel_path;      // Relative to the target root, forward slashes
    std::string content;
    bool executable = false;
};

struct SchemaViolation {
    std::string unit;          // "skill:<name>" or "agent:<name>"
    std::string constraint;

    std::string toString() const { return unit + ": " + constraint; }
};

using Conversion = Result<std::vector<HostFile>, SchemaViolation>;

// ============================================================================
// Conversion
// ============================================================================
//
// Pure per-schema conversion. For codex-md the returned file is a section of
// the single document; plan_deployment assembles the sections.

Conversion convert(const SkillUnit& skill, const TargetSchema& schema);
Conversion convert(const AgentUnit& agent, const TargetSchema& schema);

// opencode tool permissions, sorted by tool name
std::vector<std::pair<std::string, bool>> opencode_tool_map(const std::vector<std::string>& tools);

// "> S expert-level domain skills + A specialized agents."
std::string roster_line(size_t skills, size_t agents);

// ============================================================================
// Deployment Plan
// ============================================================================

struct PlannedSettings {
    std::string rel_path;
    SettingsJson fragment;
};

struct DeploymentPlan {
    TargetKind target = TargetKind::Claude;
    Scope scope = Scope::Full;
    std::string root;                        // Absolute target root

    std::vector<HostFile> files;             // Sorted by rel_path
    std::vector<std::string> skills;         // Converted units only
    std::vector<std::string> agents;
    std::vector<std::string> plugin_files;
    bool hooks = false;
    std::optional<PlannedSettings> settings;

    std::vector<SchemaViolation> violations;
    std::vector<std::string> warnings;
};

// Validate the scope against target and bundle, then convert every unit in
// scope. Validation problems are errors; unit failures are collected in
// `violations` and leave the remaining units planned.
Result<DeploymentPlan> plan_deployment(const SourceBundle& bundle, TargetKind target, Scope scope,
                                       const std::string& root);

} // namespace askills
