#include <doctest/doctest.h>
#include <askills/manifest.hpp>
#include "support/test_bundle.hpp"

using namespace askills;
using askills::test::TempDir;

namespace {

Manifest sample_manifest() {
    Manifest m;
    m.version = "1.3.0";
    m.installed_at = "2026-01-02T03:04:05Z";
    m.source = "/opt/bundle";
    m.target = TargetKind::OpenCode;
    m.target_path = "/work/.opencode";
    m.scope = Scope::Full;
    m.skills = {"alpha"};
    m.agents = {"reviewer"};
    m.hooks = true;
    m.plugin_files = {"plugins/agentic-hooks.js"};
    m.files = {"agents/reviewer.md", "plugins/agentic-hooks.js", "skills/alpha/SKILL.md"};
    m.checksums["skills/alpha/SKILL.md"] = "sha256:00";
    m.settings = SettingsRecord{"opencode.json", true};
    return m;
}

} // namespace

TEST_CASE("parse_manifest requires a known target") {
    SUBCASE("missing") {
        auto r = parse_manifest(R"({"skills": []})");
        CHECK_FALSE(r.ok);
        CHECK(r.is_critical_error);
    }
    SUBCASE("unknown") {
        auto r = parse_manifest(R"({"target": "vim"})");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("vim") != std::string::npos);
    }
    SUBCASE("invalid json") {
        auto r = parse_manifest("{not json");
        CHECK_FALSE(r.ok);
        CHECK(r.is_critical_error);
    }
    SUBCASE("not an object") {
        CHECK_FALSE(parse_manifest("[1, 2]").ok);
    }
}

TEST_CASE("parse_manifest reads older manifests") {
    auto r = parse_manifest(R"({
        "version": "1.0.0",
        "target": "claude-project",
        "skills": ["beta", "alpha", "alpha"],
        "agents": ["reviewer.md"],
        "hooks": true,
        "hook_scripts": ["agentic-hooks"]
    })");
    REQUIRE(r.ok);
    const Manifest& m = r.manifest;
    CHECK(m.target == TargetKind::Claude);
    CHECK(m.skills == std::vector<std::string>{"alpha", "beta"});
    CHECK(m.agents == std::vector<std::string>{"reviewer"});
    CHECK(m.plugin_files == std::vector<std::string>{"hooks/agentic-hooks"});
    CHECK(m.scope == Scope::Full);
    CHECK(m.files.empty());
    CHECK(r.warnings.size() == 1);
}

TEST_CASE("parse_manifest maps the legacy codex target to codex-md") {
    auto legacy = parse_manifest(R"({"target": "codex", "skills": ["a"]})");
    REQUIRE(legacy.ok);
    CHECK(legacy.manifest.target == TargetKind::CodexMd);

    auto project = parse_manifest(R"({"target": "codex-project", "skills": ["a"]})");
    REQUIRE(project.ok);
    CHECK(project.manifest.target == TargetKind::Codex);

    auto current = parse_manifest(R"({"target": "codex", "skills": ["a"], "files": []})");
    REQUIRE(current.ok);
    CHECK(current.manifest.target == TargetKind::Codex);
}

TEST_CASE("parse_manifest infers scope when absent") {
    auto hooks_only = parse_manifest(R"({"target": "opencode", "hooks": true, "files": []})");
    REQUIRE(hooks_only.ok);
    CHECK(hooks_only.manifest.scope == Scope::HooksOnly);

    auto skills_only = parse_manifest(R"({"target": "codex", "skills": ["a"], "files": []})");
    REQUIRE(skills_only.ok);
    CHECK(skills_only.manifest.scope == Scope::SkillsOnly);
}

TEST_CASE("serialize_manifest is stable and readable back") {
    Manifest m = sample_manifest();
    std::string text = serialize_manifest(m);
    CHECK(serialize_manifest(m) == text);
    CHECK(text.back() == '\n');

    auto r = parse_manifest(text);
    REQUIRE(r.ok);
    CHECK(r.warnings.empty());
    CHECK(r.manifest.target == TargetKind::OpenCode);
    CHECK(r.manifest.scope == Scope::Full);
    CHECK(r.manifest.files == m.files);
    CHECK(r.manifest.checksums == m.checksums);
    REQUIRE(r.manifest.settings.has_value());
    CHECK(r.manifest.settings->path == "opencode.json");
    CHECK(r.manifest.settings->created);
    CHECK(serialize_manifest(r.manifest) == text);
}

TEST_CASE("read and write manifest files") {
    TempDir temp;

    auto absent = read_manifest(temp.path());
    REQUIRE(absent.isErr());
    CHECK(absent.error().code() == ErrorCode::NOT_INSTALLED);

    auto first = write_manifest(temp.path(), sample_manifest());
    REQUIRE(first.isOk());
    CHECK(first.value());

    auto second = write_manifest(temp.path(), sample_manifest());
    REQUIRE(second.isOk());
    CHECK_FALSE(second.value());

    auto read = read_manifest(temp.path());
    REQUIRE(read.isOk());
    CHECK(read.value().skills == std::vector<std::string>{"alpha"});

    REQUIRE(remove_manifest(temp.path()).isOk());
    CHECK(read_manifest(temp.path()).error().code() == ErrorCode::NOT_INSTALLED);
}

TEST_CASE("read_manifest rejects garbage") {
    TempDir temp;
    askills::test::write_text(manifest_path(temp.path()), "garbage");
    auto r = read_manifest(temp.path());
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::MANIFEST_INVALID);
}

TEST_CASE("diff_manifests") {
    Manifest next = sample_manifest();

    auto fresh = diff_manifests(std::nullopt, next);
    CHECK(fresh.to_add == next.files);
    CHECK(fresh.to_remove.empty());

    Manifest old = next;
    old.files = {"agents/old.md", "skills/alpha/SKILL.md"};
    auto diff = diff_manifests(old, next);
    CHECK(diff.to_add == std::vector<std::string>{"agents/reviewer.md", "plugins/agentic-hooks.js"});
    CHECK(diff.to_remove == std::vector<std::string>{"agents/old.md"});
}
