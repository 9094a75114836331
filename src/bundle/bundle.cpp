#include "askills/bundle.hpp"

#include "askills/frontmatter.hpp"
#include "askills/platform.hpp"

#include <spdlog/spdlog.h>

namespace askills {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Result<void> validate_bundle_root(const std::string& root) {
    if (root.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT, "bundle path is empty"));
    }
    if (!is_directory(root)) {
        return Result<void>::err(
            Error(ErrorCode::BUNDLE_INVALID, "bundle directory not found: " + root));
    }
    for (const char* sub : {"skills", "agents"}) {
        if (!is_directory(join_path(root, sub))) {
            return Result<void>::err(Error(ErrorCode::BUNDLE_INVALID,
                                           "bundle is missing " + std::string(sub) +
                                               "/: " + root));
        }
    }
    return Result<void>::ok();
}

AgentUnit parse_agent(const std::string& name, const std::string& content) {
    AgentUnit agent;
    agent.name = name;
    agent.raw = content;

    auto doc = parse_frontmatter(content);
    agent.body = doc.body;
    if (!doc.has_frontmatter) return agent;

    agent.frontmatter.name = doc.get("name").value_or(name);
    agent.frontmatter.description = doc.get("description").value_or("");
    agent.frontmatter.model = trim(doc.get("model").value_or(""));
    agent.frontmatter.tools = frontmatter_list(doc, "tools");
    return agent;
}

Result<SourceBundle> load_bundle(const std::string& root) {
    auto valid = validate_bundle_root(root);
    if (valid.isErr()) return Result<SourceBundle>::err(valid.error());

    SourceBundle bundle;
    bundle.root = absolute_path(root);

    // Skills: immediate subdirectories holding a SKILL.md
    std::string skills_dir = join_path(bundle.root, "skills");
    for (const auto& entry : list_directory(skills_dir)) {
        std::string dir = join_path(skills_dir, entry);
        if (!is_directory(dir)) continue;

        std::string skill_md = join_path(dir, "SKILL.md");
        auto content = read_file(skill_md);
        if (!content) {
            spdlog::debug("skipping {}: no readable SKILL.md", dir);
            continue;
        }

        SkillUnit skill;
        skill.name = entry;
        skill.source_directory = dir;
        for (const auto& rel : list_files_recursive(dir)) {
            if (is_temp_artifact(get_filename(rel))) continue;
            skill.files.push_back(rel);
        }
        skill.description = parse_frontmatter(*content).get("description").value_or("");
        bundle.skills.push_back(std::move(skill));
    }

    // Agents: *.md directly under agents/
    std::string agents_dir = join_path(bundle.root, "agents");
    for (const auto& entry : list_directory(agents_dir)) {
        std::string path = join_path(agents_dir, entry);
        if (!ends_with(entry, ".md") || !is_regular_file(path)) continue;

        auto content = read_file(path);
        if (!content) {
            return Result<SourceBundle>::err(
                Error(ErrorCode::IO_ERROR, "failed to read agent: " + path));
        }

        auto agent = parse_agent(entry.substr(0, entry.size() - 3), *content);
        agent.source_path = path;
        bundle.agents.push_back(std::move(agent));
    }

    // Hook bridge artifacts
    std::string hooks_dir = join_path(bundle.root, "hooks");
    for (const auto& entry : list_directory(hooks_dir)) {
        std::string path = join_path(hooks_dir, entry);
        if (!is_regular_file(path) || is_temp_artifact(entry)) continue;

        HookArtifact artifact;
        artifact.name = entry;
        artifact.source_path = path;
        artifact.executable = is_executable(path);
        bundle.hook_artifacts.push_back(std::move(artifact));
    }

    spdlog::debug("bundle {}: {} skills, {} agents, {} hook artifacts", bundle.root,
                  bundle.skills.size(), bundle.agents.size(), bundle.hook_artifacts.size());
    return Result<SourceBundle>::ok(std::move(bundle));
}

} // namespace askills
