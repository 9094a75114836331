#pragma once

#include "askills/result.hpp"
#include "askills/types.hpp"

#include <string>
#include <vector>

namespace askills {

// ============================================================================
// Source Bundle
// ============================================================================
//
// <bundle>/skills/<name>/SKILL.md (+ further files)
// <bundle>/agents/<name>.md
// <bundle>/hooks/<artifact>       optional

struct SourceBundle {
    std::string root;                       // Absolute
    std::vector<SkillUnit> skills;          // Sorted by name
    std::vector<AgentUnit> agents;          // Sorted by name
    std::vector<HookArtifact> hook_artifacts;

    bool has_hooks() const { return !hook_artifacts.empty(); }
};

// Check that skills/ and agents/ exist below root
Result<void> validate_bundle_root(const std::string& root);

// Read the whole catalog. Unreadable agent files fail with IO_ERROR.
Result<SourceBundle> load_bundle(const std::string& root);

// Parse an agent file body into an AgentUnit
AgentUnit parse_agent(const std::string& name, const std::string& content);

} // namespace askills
