#include <doctest/doctest.h>
#include <askills/orchestrator.hpp>
#include <askills/platform.hpp>
#include <askills/settings_merge.hpp>
#include <askills/version.hpp>
#include "support/test_bundle.hpp"

#include <algorithm>

using namespace askills;
using askills::test::TempDir;
using askills::test::read_text;
using askills::test::write_text;

namespace {

// Answers prompts from a script instead of a terminal
class ScriptedConfirmer : public Confirmer {
public:
    explicit ScriptedConfirmer(bool interactive = false, bool answer = false)
        : interactive_(interactive), answer_(answer) {}

    bool interactive() const override { return interactive_; }

    bool confirm(const std::string& question, bool /* default_yes */) override {
        questions.push_back(question);
        return answer_;
    }

    std::vector<std::string> questions;

private:
    bool interactive_;
    bool answer_;
};

struct Fixture {
    TempDir bundle;
    TempDir work;

    Fixture() { askills::test::write_sample_bundle(bundle.path()); }

    std::string root(const char* rel = ".claude") const { return work.sub(rel); }

    InstallRequest request(TargetKind target = TargetKind::Claude, Scope scope = Scope::Full,
                           const char* rel = ".claude") const {
        InstallRequest r;
        r.bundle_root = bundle.path();
        r.root = root(rel);
        r.target = target;
        r.scope = scope;
        return r;
    }
};

bool exists(const std::string& root, const std::string& rel) {
    return path_exists(join_path(root, rel));
}

SettingsJson read_json(const std::string& path) {
    return SettingsJson::parse(read_text(path));
}

} // namespace

TEST_CASE("install deploys the bundle and records every file") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    auto r = orch.install(fx.request());
    REQUIRE(r.isOk());
    const OperationReport& report = r.value();
    CHECK_FALSE(report.has_failures());
    CHECK(report.manifest_written);
    CHECK(report.settings_changed);

    std::string root = fx.root();
    CHECK(read_text(join_path(root, "skills/alpha/SKILL.md")) == askills::test::kAlphaSkill);
    CHECK(exists(root, "skills/alpha/references/notes.md"));
    CHECK(exists(root, "skills/beta/SKILL.md"));
    CHECK(read_text(join_path(root, "agents/reviewer.md")) == askills::test::kReviewerAgent);
    CHECK(is_executable(join_path(root, "hooks/agentic-hooks")));

    auto manifest = read_manifest(root);
    REQUIRE(manifest.isOk());
    const Manifest& m = manifest.value();
    CHECK(m.target == TargetKind::Claude);
    CHECK(m.scope == Scope::Full);
    CHECK(m.source == absolute_path(fx.bundle.path()));
    CHECK(m.skills == std::vector<std::string>{"alpha", "beta"});
    CHECK(m.agents == std::vector<std::string>{"planner", "reviewer"});
    CHECK(m.hooks);
    CHECK(m.files.size() == 6);
    CHECK(m.checksums.size() == 6);
    REQUIRE(m.settings.has_value());
    CHECK(m.settings->path == "settings.local.json");
    CHECK(m.settings->created);

    // Every recorded file is on disk
    for (const auto& rel : m.files) {
        CAPTURE(rel);
        CHECK(is_regular_file(join_path(root, rel)));
    }

    auto settings = read_json(join_path(root, "settings.local.json"));
    CHECK(settings["hooks"]["PreToolUse"][0]["hooks"][0]["command"] ==
          "\"" + absolute_path(root) + "/hooks/agentic-hooks\" tool-before --host claude");
}

TEST_CASE("install twice is a no-op on disk") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    REQUIRE(orch.install(fx.request()).isOk());
    std::string manifest_before = read_text(manifest_path(fx.root()));

    auto again = orch.install(fx.request());
    REQUIRE(again.isOk());
    CHECK(again.value().written == 0);
    CHECK(again.value().unchanged == 6);
    CHECK(again.value().removed == 0);
    CHECK_FALSE(again.value().settings_changed);
    CHECK_FALSE(again.value().manifest_written);
    CHECK(read_text(manifest_path(fx.root())) == manifest_before);
}

TEST_CASE("update follows the bundle") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);
    REQUIRE(orch.install(fx.request()).isOk());

    askills::test::fs::remove(fx.bundle.sub("agents/planner.md"));
    askills::test::fs::remove_all(fx.bundle.sub("skills/alpha"));
    write_text(fx.bundle.sub("skills/gamma/SKILL.md"), "---\ndescription: Gamma\n---\n");
    write_text(fx.bundle.sub("agents/reviewer.md"), "---\ndescription: Changed\n---\nNew\n");

    UpdateRequest update;
    update.root = fx.root();
    auto r = orch.update(update);
    REQUIRE(r.isOk());

    std::string root = fx.root();
    CHECK_FALSE(exists(root, "agents/planner.md"));
    CHECK_FALSE(exists(root, "skills/alpha"));
    CHECK(exists(root, "skills/gamma/SKILL.md"));
    CHECK(read_text(join_path(root, "agents/reviewer.md")) == "---\ndescription: Changed\n---\nNew\n");
    CHECK(r.value().removed == 3);

    auto m = read_manifest(root);
    REQUIRE(m.isOk());
    CHECK(m.value().skills == std::vector<std::string>{"beta", "gamma"});
    CHECK(m.value().agents == std::vector<std::string>{"reviewer"});
}

TEST_CASE("update requires an installation") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    UpdateRequest update;
    update.root = fx.root();
    auto r = orch.update(update);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::NOT_INSTALLED);
}

TEST_CASE("uninstall removes exactly what was installed") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    std::string root = fx.root();
    write_text(join_path(root, "skills/mine/SKILL.md"), "user skill");
    write_text(join_path(root, "agents/mine.md"), "user agent");
    write_text(join_path(root, "notes.txt"), "user notes");

    REQUIRE(orch.install(fx.request()).isOk());
    auto r = orch.uninstall(root, true);
    REQUIRE(r.isOk());
    CHECK(r.value().removed == 6);
    CHECK(r.value().missing.empty());
    CHECK(r.value().settings_removed);

    CHECK(read_text(join_path(root, "skills/mine/SKILL.md")) == "user skill");
    CHECK(read_text(join_path(root, "agents/mine.md")) == "user agent");
    CHECK(read_text(join_path(root, "notes.txt")) == "user notes");
    CHECK_FALSE(exists(root, "skills/alpha"));
    CHECK_FALSE(exists(root, "hooks"));
    CHECK_FALSE(exists(root, "settings.local.json"));
    CHECK_FALSE(exists(root, kManifestFileName));
    CHECK(is_directory(root));
}

TEST_CASE("uninstall reports files that were already removed") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);
    REQUIRE(orch.install(fx.request()).isOk());

    askills::test::fs::remove(join_path(fx.root(), "agents/planner.md"));
    auto r = orch.uninstall(fx.root(), true);
    REQUIRE(r.isOk());
    CHECK(r.value().missing == std::vector<std::string>{"agents/planner.md"});
    CHECK(r.value().removed == 5);
}

TEST_CASE("uninstall without an installation") {
    TempDir temp;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);
    auto r = orch.uninstall(temp.path(), true);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::NOT_INSTALLED);
}

TEST_CASE("uninstall asks before removing") {
    Fixture fx;
    ScriptedConfirmer installer;
    REQUIRE(Orchestrator(installer).install(fx.request()).isOk());

    ScriptedConfirmer declining(true, false);
    Orchestrator orch(declining);
    auto r = orch.uninstall(fx.root(), false);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::ABORTED);
    CHECK(declining.questions.size() == 1);
    CHECK(exists(fx.root(), kManifestFileName));
    CHECK(exists(fx.root(), "agents/reviewer.md"));
}

TEST_CASE("settings merge is non-destructive") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    std::string root = fx.root();
    std::string settings_path = join_path(root, "settings.local.json");
    write_text(settings_path, R"({"permissions": {"allow": ["Bash(echo:*)"]}})");
    auto original = read_json(settings_path);

    REQUIRE(orch.install(fx.request()).isOk());
    auto merged = read_json(settings_path);
    CHECK(merged["permissions"] == original["permissions"]);
    CHECK(merged.contains("hooks"));

    auto m = read_manifest(root);
    REQUIRE(m.isOk());
    CHECK_FALSE(m.value().settings->created);

    auto r = orch.uninstall(root, true);
    REQUIRE(r.isOk());
    CHECK(r.value().settings_changed);
    CHECK_FALSE(r.value().settings_removed);
    REQUIRE(is_regular_file(settings_path));
    CHECK(read_json(settings_path) == original);
}

TEST_CASE("invalid settings abort before any write") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    std::string settings_path = join_path(fx.root(), "settings.local.json");
    write_text(settings_path, "{ not json");

    auto r = orch.install(fx.request());
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::SETTINGS_INVALID);
    CHECK(read_text(settings_path) == "{ not json");
    CHECK_FALSE(exists(fx.root(), "skills"));
    CHECK_FALSE(exists(fx.root(), kManifestFileName));
}

TEST_CASE("scope changes add and remove components") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);
    std::string root = fx.root();

    auto skills_only = orch.install(fx.request(TargetKind::Claude, Scope::SkillsOnly));
    REQUIRE(skills_only.isOk());
    CHECK(exists(root, "skills/alpha/SKILL.md"));
    CHECK_FALSE(exists(root, "agents"));
    CHECK_FALSE(exists(root, "hooks"));
    CHECK_FALSE(exists(root, "settings.local.json"));

    REQUIRE(orch.install(fx.request(TargetKind::Claude, Scope::Full)).isOk());
    CHECK(exists(root, "agents/reviewer.md"));
    CHECK(exists(root, "hooks/agentic-hooks"));
    CHECK(exists(root, "settings.local.json"));

    auto back = orch.install(fx.request(TargetKind::Claude, Scope::SkillsOnly));
    REQUIRE(back.isOk());
    CHECK_FALSE(exists(root, "agents/reviewer.md"));
    CHECK_FALSE(exists(root, "hooks/agentic-hooks"));
    CHECK_FALSE(exists(root, "settings.local.json"));
    CHECK(exists(root, "skills/beta/SKILL.md"));

    auto m = read_manifest(root);
    REQUIRE(m.isOk());
    CHECK(m.value().scope == Scope::SkillsOnly);
    CHECK(m.value().agents.empty());
    CHECK_FALSE(m.value().hooks);
    CHECK_FALSE(m.value().settings.has_value());
}

TEST_CASE("hooks-only install for opencode") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    auto r = orch.install(fx.request(TargetKind::OpenCode, Scope::HooksOnly, ".opencode"));
    REQUIRE(r.isOk());

    std::string root = fx.root(".opencode");
    CHECK(exists(root, "plugins/agentic-hooks"));
    CHECK(exists(root, "plugins/agentic-hooks.js"));
    CHECK_FALSE(exists(root, "skills"));
    CHECK_FALSE(exists(root, "agents"));

    auto config = read_json(join_path(root, "opencode.json"));
    REQUIRE(config["plugin"].size() == 1);
    CHECK(config["plugin"][0] == "file://" + absolute_path(root) + "/plugins/agentic-hooks.js");
}

TEST_CASE("opencode agents are converted") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    REQUIRE(orch.install(fx.request(TargetKind::OpenCode, Scope::Full, ".opencode")).isOk());
    std::string agent = read_text(join_path(fx.root(".opencode"), "agents/reviewer.md"));
    CHECK(agent.rfind("---\ndescription: \"Reviews code changes\"\nmode: subagent\n", 0) == 0);
    CHECK(agent.find("model: anthropic/claude-sonnet-4\n") != std::string::npos);
}

TEST_CASE("codex-md writes one document with the roster") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    auto r = orch.install(fx.request(TargetKind::CodexMd, Scope::Full, "."));
    REQUIRE(r.isOk());
    CHECK(r.value().warnings.size() == 1);

    std::string doc = read_text(fx.work.sub("codex.md"));
    CHECK(doc.rfind("# Agentic Skills\n\n> 2 expert-level domain skills + 2 specialized agents.", 0) ==
          0);

    auto m = read_manifest(fx.work.path());
    REQUIRE(m.isOk());
    CHECK(m.value().files == std::vector<std::string>{"codex.md"});
}

TEST_CASE("codex schema violations skip the unit and report failure") {
    Fixture fx;
    write_text(fx.bundle.sub("skills/nodesc/SKILL.md"), "# Missing frontmatter\n");
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    auto r = orch.install(fx.request(TargetKind::Codex, Scope::Full, ".codex"));
    REQUIRE(r.isOk());
    CHECK(r.value().has_failures());
    REQUIRE(r.value().violations.size() == 1);
    CHECK(r.value().violations[0].unit == "skill:nodesc");

    std::string root = fx.root(".codex");
    CHECK_FALSE(exists(root, "skills/nodesc"));
    CHECK(exists(root, "skills/alpha/SKILL.md"));
    auto m = read_manifest(root);
    REQUIRE(m.isOk());
    CHECK(std::find(m.value().skills.begin(), m.value().skills.end(), "nodesc") ==
          m.value().skills.end());
}

TEST_CASE("foreign files are not overwritten without consent") {
    Fixture fx;
    std::string root = fx.root();
    std::string foreign = join_path(root, "agents/reviewer.md");
    write_text(foreign, "hand written\n");

    SUBCASE("non-interactive") {
        ScriptedConfirmer confirmer(false);
        auto r = Orchestrator(confirmer).install(fx.request());
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::CONFLICT);
        CHECK(read_text(foreign) == "hand written\n");
        CHECK_FALSE(exists(root, kManifestFileName));
        CHECK_FALSE(exists(root, "skills"));
    }
    SUBCASE("declined") {
        ScriptedConfirmer confirmer(true, false);
        auto r = Orchestrator(confirmer).install(fx.request());
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::ABORTED);
        CHECK(read_text(foreign) == "hand written\n");
    }
    SUBCASE("accepted") {
        ScriptedConfirmer confirmer(true, true);
        REQUIRE(Orchestrator(confirmer).install(fx.request()).isOk());
        CHECK(read_text(foreign) == askills::test::kReviewerAgent);
    }
    SUBCASE("forced") {
        ScriptedConfirmer confirmer(false);
        InstallRequest request = fx.request();
        request.force = true;
        REQUIRE(Orchestrator(confirmer).install(request).isOk());
        CHECK(read_text(foreign) == askills::test::kReviewerAgent);
    }
}

TEST_CASE("dry run plans without writing") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    InstallRequest request = fx.request();
    request.dry_run = true;
    auto r = orch.install(request);
    REQUIRE(r.isOk());
    CHECK(r.value().dry_run);
    CHECK(r.value().actions.size() == 6);
    CHECK(std::all_of(r.value().actions.begin(), r.value().actions.end(),
                      [](const PlannedAction& a) { return a.action == FileAction::Write; }));
    CHECK_FALSE(exists(fx.root(), "skills"));
    CHECK_FALSE(exists(fx.root(), kManifestFileName));
}

TEST_CASE("install refuses to switch targets in place") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);
    REQUIRE(orch.install(fx.request(TargetKind::Claude, Scope::Full, "shared")).isOk());

    auto r = orch.install(fx.request(TargetKind::Codex, Scope::Full, "shared"));
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE("install rejects an invalid bundle") {
    TempDir empty;
    TempDir work;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    InstallRequest request;
    request.bundle_root = empty.path();
    request.root = work.sub(".claude");
    auto r = orch.install(request);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::BUNDLE_INVALID);
    CHECK_FALSE(exists(work.path(), ".claude"));
}

TEST_CASE("an unreadable manifest blocks install unless forced") {
    Fixture fx;
    write_text(manifest_path(fx.root()), "{ broken");
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    auto r = orch.install(fx.request());
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::MANIFEST_INVALID);

    InstallRequest forced = fx.request();
    forced.force = true;
    REQUIRE(orch.install(forced).isOk());
    CHECK(read_manifest(fx.root()).isOk());
}

TEST_CASE("self-update reads from the new source") {
    Fixture fx;
    ScriptedConfirmer installer;
    REQUIRE(Orchestrator(installer).install(fx.request()).isOk());

    TempDir next;
    askills::test::write_sample_bundle(next.path());
    write_text(next.sub("skills/delta/SKILL.md"), "---\ndescription: Delta\n---\n");

    SUBCASE("confirmed") {
        ScriptedConfirmer confirmer(true, true);
        SelfUpdateRequest request;
        request.source = next.path();
        request.root = fx.root();
        auto r = Orchestrator(confirmer).selfUpdate(request);
        REQUIRE(r.isOk());
        CHECK(confirmer.questions.size() == 1);
        CHECK(exists(fx.root(), "skills/delta/SKILL.md"));
        CHECK(read_manifest(fx.root()).value().source == absolute_path(next.path()));
    }
    SUBCASE("declined") {
        ScriptedConfirmer confirmer(true, false);
        SelfUpdateRequest request;
        request.source = next.path();
        request.root = fx.root();
        auto r = Orchestrator(confirmer).selfUpdate(request);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::ABORTED);
        CHECK_FALSE(exists(fx.root(), "skills/delta"));
    }
    SUBCASE("--yes skips the prompt") {
        ScriptedConfirmer confirmer(true, false);
        SelfUpdateRequest request;
        request.source = next.path();
        request.root = fx.root();
        request.yes = true;
        REQUIRE(Orchestrator(confirmer).selfUpdate(request).isOk());
        CHECK(confirmer.questions.empty());
    }
    SUBCASE("invalid source") {
        ScriptedConfirmer confirmer(true, true);
        SelfUpdateRequest request;
        request.source = fx.work.sub("nowhere");
        request.root = fx.root();
        auto r = Orchestrator(confirmer).selfUpdate(request);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::BUNDLE_INVALID);
        CHECK(confirmer.questions.empty());
    }
}

TEST_CASE("update never unwires an installed hook bridge") {
    Fixture fx;
    ScriptedConfirmer installer;
    REQUIRE(Orchestrator(installer).install(fx.request()).isOk());
    std::string manifest_before = read_text(manifest_path(fx.root()));
    std::string settings_before = read_text(join_path(fx.root(), "settings.local.json"));

    TempDir next;
    askills::test::write_sample_bundle(next.path(), false);
    SUBCASE("source without hook artifacts") {}
    SUBCASE("source with only the plugin shim") {
        write_text(next.sub("hooks/agentic-hooks.js"), "export default {};\n");
    }

    ScriptedConfirmer confirmer;
    SelfUpdateRequest request;
    request.source = next.path();
    request.root = fx.root();
    request.yes = true;
    auto r = Orchestrator(confirmer).selfUpdate(request);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::BUNDLE_INVALID);

    CHECK(is_executable(join_path(fx.root(), "hooks/agentic-hooks")));
    CHECK(read_text(manifest_path(fx.root())) == manifest_before);
    CHECK(read_text(join_path(fx.root(), "settings.local.json")) == settings_before);
}

TEST_CASE("status and discovery") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);

    auto before = orch.status(fx.root());
    REQUIRE(before.isOk());
    CHECK_FALSE(before.value().installed);
    CHECK(discover_installations(fx.work.path()).empty());

    REQUIRE(orch.install(fx.request()).isOk());
    REQUIRE(orch.install(fx.request(TargetKind::OpenCode, Scope::SkillsOnly, ".opencode")).isOk());

    auto after = orch.status(fx.root());
    REQUIRE(after.isOk());
    CHECK(after.value().installed);
    CHECK(after.value().manifest.target == TargetKind::Claude);

    auto roots = discover_installations(fx.work.path());
    CHECK(roots == std::vector<std::string>{absolute_path(fx.root()),
                                            absolute_path(fx.root(".opencode"))});
    CHECK(std::string(Orchestrator::version()) == ASKILLS_VERSION);
}

TEST_CASE("older manifests without a file list are upgraded") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);
    REQUIRE(orch.install(fx.request()).isOk());

    // Rewrite the manifest the way older releases did
    write_text(manifest_path(fx.root()), R"({
        "version": "1.0.0",
        "target": "claude-project",
        "skills": ["alpha", "beta"],
        "agents": ["planner.md", "reviewer.md"],
        "hooks": true,
        "hook_scripts": ["agentic-hooks", "agentic-hooks.js"],
        "settings": {"path": "settings.local.json", "created": true}
    })");

    auto files = expand_legacy_files(fx.root(), read_manifest(fx.root()).value());
    CHECK(files.size() == 6);

    // No recorded source, so the bundle comes from the request
    UpdateRequest update;
    update.root = fx.root();
    update.bundle_root = fx.bundle.path();
    REQUIRE(orch.update(update).isOk());
    auto m = read_manifest(fx.root());
    REQUIRE(m.isOk());
    CHECK(m.value().files.size() == 6);
    CHECK(m.value().version == ASKILLS_VERSION);
}

TEST_CASE("older codex manifests mean the single codex.md document") {
    Fixture fx;
    ScriptedConfirmer confirmer;
    Orchestrator orch(confirmer);
    std::string root = fx.root("home");
    REQUIRE(orch.install(fx.request(TargetKind::CodexMd, Scope::Full, "home")).isOk());
    REQUIRE(exists(root, "codex.md"));

    write_text(manifest_path(root), R"({
        "version": "1.0.0",
        "target": "codex",
        "skills": ["alpha", "beta"],
        "agents": ["planner.md", "reviewer.md"]
    })");

    auto status = orch.status(root);
    REQUIRE(status.isOk());
    CHECK(status.value().manifest.target == TargetKind::CodexMd);
    CHECK(expand_legacy_files(root, status.value().manifest) ==
          std::vector<std::string>{"codex.md"});

    auto r = orch.uninstall(root, true);
    REQUIRE(r.isOk());
    CHECK(r.value().removed == 1);
    CHECK_FALSE(exists(root, "codex.md"));
    CHECK_FALSE(exists(root, kManifestFileName));
}
