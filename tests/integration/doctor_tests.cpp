#include <doctest/doctest.h>
#include <askills/orchestrator.hpp>
#include <askills/platform.hpp>
#include "support/test_bundle.hpp"

#include <algorithm>

using namespace askills;
using askills::test::TempDir;
using askills::test::write_text;

namespace {

class NonInteractive : public Confirmer {
public:
    bool interactive() const override { return false; }
    bool confirm(const std::string&, bool) override { return false; }
};

struct Installed {
    TempDir bundle;
    TempDir work;
    NonInteractive confirmer;
    Orchestrator orch{confirmer};

    explicit Installed(TargetKind target = TargetKind::Claude, const char* rel = ".claude") {
        askills::test::write_sample_bundle(bundle.path());
        InstallRequest request;
        request.bundle_root = bundle.path();
        request.root = work.sub(rel);
        request.target = target;
        auto r = orch.install(request);
        REQUIRE(r.isOk());
        root = absolute_path(request.root);
    }

    std::string at(const std::string& rel) const { return join_path(root, rel); }

    std::string root;
};

const DoctorCheck* find_check(const DoctorReport& report, const std::string& name,
                              CheckStatus status) {
    auto it = std::find_if(report.checks.begin(), report.checks.end(), [&](const DoctorCheck& c) {
        return c.name == name && c.status == status;
    });
    return it == report.checks.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("doctor on a fresh install") {
    Installed inst;
    DoctorReport report = inst.orch.doctor(inst.root);

    CHECK(report.installed);
    CHECK(report.healthy());
    CHECK(report.tally.failed == 0);
    CHECK(report.tally.warned == 0);
    REQUIRE(report.manifest.has_value());
    CHECK(report.manifest->target == TargetKind::Claude);
    CHECK(find_check(report, "manifest", CheckStatus::Pass) != nullptr);
    CHECK(find_check(report, "recorded files", CheckStatus::Pass) != nullptr);
    CHECK(find_check(report, "unrecorded files", CheckStatus::Pass) != nullptr);
    CHECK(find_check(report, "temp artifacts", CheckStatus::Pass) != nullptr);
    CHECK(find_check(report, "settings fragment", CheckStatus::Pass) != nullptr);
    CHECK(find_check(report, "checksums", CheckStatus::Pass) != nullptr);
}

TEST_CASE("doctor without an installation") {
    TempDir temp;
    NonInteractive confirmer;
    Orchestrator orch(confirmer);

    DoctorReport report = orch.doctor(temp.path());
    CHECK_FALSE(report.installed);
    CHECK_FALSE(report.healthy());
    CHECK(report.checks.empty());
}

TEST_CASE("doctor reports an unreadable manifest") {
    TempDir temp;
    write_text(join_path(temp.path(), kManifestFileName), "not json");
    NonInteractive confirmer;
    Orchestrator orch(confirmer);

    DoctorReport report = orch.doctor(temp.path());
    CHECK(report.installed);
    CHECK_FALSE(report.healthy());
    CHECK(find_check(report, "manifest", CheckStatus::Fail) != nullptr);
}

TEST_CASE("doctor finds a missing recorded file") {
    Installed inst;
    askills::test::fs::remove(inst.at("skills/alpha/references/notes.md"));

    DoctorReport report = inst.orch.doctor(inst.root);
    CHECK_FALSE(report.healthy());
    const DoctorCheck* check = find_check(report, "recorded file", CheckStatus::Fail);
    REQUIRE(check != nullptr);
    CHECK(check->detail == "missing: skills/alpha/references/notes.md");
}

TEST_CASE("doctor finds unrecorded files") {
    Installed inst;

    SUBCASE("inside a managed skill") {
        write_text(inst.at("skills/alpha/extra.md"), "stray\n");
        DoctorReport report = inst.orch.doctor(inst.root);
        CHECK_FALSE(report.healthy());
        const DoctorCheck* check = find_check(report, "unrecorded file", CheckStatus::Fail);
        REQUIRE(check != nullptr);
        CHECK(check->detail == "skills/alpha/extra.md");
    }
    SUBCASE("a bridge copy in the plugin directory") {
        write_text(inst.at("hooks/agentic-hooks.old"), "stale\n");
        DoctorReport report = inst.orch.doctor(inst.root);
        CHECK_FALSE(report.healthy());
        CHECK(find_check(report, "unrecorded file", CheckStatus::Fail) != nullptr);
    }
    SUBCASE("user files elsewhere are not ours") {
        write_text(inst.at("skills/mine/SKILL.md"), "user\n");
        write_text(inst.at("hooks/user-hook.sh"), "user\n");
        DoctorReport report = inst.orch.doctor(inst.root);
        CHECK(report.healthy());
    }
}

TEST_CASE("doctor finds atomic-write leftovers") {
    Installed inst;
    write_text(inst.at("agents/reviewer.md.tmp.0a1b2c3d"), "partial");

    DoctorReport report = inst.orch.doctor(inst.root);
    CHECK_FALSE(report.healthy());
    const DoctorCheck* check = find_check(report, "temp artifact", CheckStatus::Fail);
    REQUIRE(check != nullptr);
    CHECK(check->detail == "leftover: agents/reviewer.md.tmp.0a1b2c3d");
}

TEST_CASE("doctor finds a removed hook registration") {
    Installed inst;
    write_text(inst.at("settings.local.json"), R"({"permissions": {}})");

    DoctorReport report = inst.orch.doctor(inst.root);
    CHECK_FALSE(report.healthy());
    CHECK(find_check(report, "settings fragment", CheckStatus::Fail) != nullptr);
}

TEST_CASE("doctor fails a hooks install without a registered bridge") {
    Installed inst;
    write_text(join_path(inst.root, kManifestFileName), R"({
        "version": "1.0.0",
        "target": "claude",
        "scope": "full",
        "skills": [],
        "agents": [],
        "hooks": true,
        "plugin_files": ["hooks/agentic-hooks.js"],
        "files": []
    })");

    DoctorReport report = inst.orch.doctor(inst.root);
    CHECK_FALSE(report.healthy());
    const DoctorCheck* check = find_check(report, "settings fragment", CheckStatus::Fail);
    REQUIRE(check != nullptr);
    CHECK(check->detail.find("hook bridge not registered") != std::string::npos);
}

TEST_CASE("doctor checks the opencode plugin registration") {
    Installed inst(TargetKind::OpenCode, ".opencode");
    CHECK(inst.orch.doctor(inst.root).healthy());

    askills::test::fs::remove(inst.at("opencode.json"));
    DoctorReport report = inst.orch.doctor(inst.root);
    const DoctorCheck* check = find_check(report, "settings fragment", CheckStatus::Fail);
    REQUIRE(check != nullptr);
    CHECK(check->detail == "missing: opencode.json");
}

TEST_CASE("local edits are a warning only") {
    Installed inst;
    write_text(inst.at("skills/beta/SKILL.md"), "edited locally\n");

    DoctorReport report = inst.orch.doctor(inst.root);
    CHECK(report.healthy());
    CHECK(report.tally.warned == 1);
    const DoctorCheck* check = find_check(report, "checksum", CheckStatus::Warn);
    REQUIRE(check != nullptr);
    CHECK(check->detail == "modified since install: skills/beta/SKILL.md");
}

TEST_CASE("check_status_to_string") {
    CHECK(std::string(check_status_to_string(CheckStatus::Pass)) == "pass");
    CHECK(std::string(check_status_to_string(CheckStatus::Fail)) == "fail");
    CHECK(std::string(check_status_to_string(CheckStatus::Warn)) == "warn");
}
