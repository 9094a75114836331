#include <doctest/doctest.h>
#include <askills/settings_merge.hpp>

using namespace askills;

namespace {

SettingsJson parse(const char* text) {
    return SettingsJson::parse(text);
}

SettingsJson claude_fragment() {
    return governed_fragment(TargetKind::Claude, "/p/.claude",
                             {"hooks/agentic-hooks", "hooks/agentic-hooks.js"});
}

} // namespace

TEST_CASE("parse_settings") {
    SUBCASE("empty text is an empty object") {
        auto r = parse_settings("  \n");
        REQUIRE(r.isOk());
        CHECK(r.value() == SettingsJson::object());
    }
    SUBCASE("non-object root") {
        auto r = parse_settings("[]", "settings.json");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::SETTINGS_INVALID);
    }
    SUBCASE("invalid json") {
        auto r = parse_settings("{\"a\": ", "settings.json");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::SETTINGS_INVALID);
        CHECK(r.error().message().find("settings.json") == 0);
    }
}

TEST_CASE("governed_fragment per target") {
    SUBCASE("claude registers the bridge binary") {
        auto f = claude_fragment();
        REQUIRE(f.is_object());
        const auto& pre = f["hooks"]["PreToolUse"];
        REQUIRE(pre.size() == 1);
        CHECK(pre[0]["matcher"] == "Bash");
        CHECK(pre[0]["hooks"][0]["type"] == "command");
        CHECK(pre[0]["hooks"][0]["command"] ==
              "\"/p/.claude/hooks/agentic-hooks\" tool-before --host claude");

        const auto& start = f["hooks"]["SessionStart"];
        REQUIRE(start.size() == 2);
        CHECK(start[0]["matcher"] == "startup");
        CHECK(start[1]["matcher"] == "compact");
        CHECK(start[1]["hooks"][0]["command"] ==
              "\"/p/.claude/hooks/agentic-hooks\" event session.compacted --host claude");
    }
    SUBCASE("claude without the bridge binary") {
        CHECK(governed_fragment(TargetKind::Claude, "/p", {"hooks/other"}).is_null());
    }
    SUBCASE("opencode registers loadable shims") {
        auto f = governed_fragment(TargetKind::OpenCode, "/p/.opencode",
                                   {"plugins/agentic-hooks", "plugins/agentic-hooks.js"});
        CHECK(f == parse(R"({"plugin": ["file:///p/.opencode/plugins/agentic-hooks.js"]})"));
    }
    SUBCASE("targets without hooks") {
        CHECK(governed_fragment(TargetKind::Codex, "/p", {}).is_null());
        CHECK(governed_fragment(TargetKind::CodexMd, "/p", {}).is_null());
    }
}

TEST_CASE("merge_settings keeps user content and key order") {
    auto existing = parse(R"({"permissions": {"allow": ["Bash(echo:*)"]}, "model": "opus"})");
    auto merged = merge_settings(existing, claude_fragment());
    REQUIRE(merged.isOk());

    const auto& doc = merged.value();
    CHECK(doc["permissions"] == existing["permissions"]);
    CHECK(doc["model"] == "opus");
    CHECK(doc.begin().key() == "permissions");
    CHECK(doc.contains("hooks"));
}

TEST_CASE("merge_settings is idempotent") {
    auto existing = parse(R"({"permissions": {"allow": ["Bash(echo:*)"]}})");
    auto once = merge_settings(existing, claude_fragment());
    REQUIRE(once.isOk());
    auto twice = merge_settings(once.value(), claude_fragment());
    REQUIRE(twice.isOk());
    CHECK(twice.value() == once.value());
    CHECK(fragment_present(once.value(), claude_fragment()));
    CHECK_FALSE(fragment_present(existing, claude_fragment()));
}

TEST_CASE("merge_settings leaves foreign list entries in place") {
    auto existing = parse(R"({"hooks": {"PreToolUse": [
        {"matcher": "Write", "hooks": [{"type": "command", "command": "lint"}]},
        {"matcher": "Bash", "hooks": [{"type": "command", "command": "/old/agentic-hooks tool-before"}]},
        {"matcher": "Edit", "hooks": [{"type": "command", "command": "fmt"}]}
    ]}})");

    auto merged = merge_settings(existing, claude_fragment());
    REQUIRE(merged.isOk());
    const auto& pre = merged.value()["hooks"]["PreToolUse"];
    REQUIRE(pre.size() == 3);
    CHECK(pre[0]["matcher"] == "Write");
    CHECK(pre[1]["hooks"][0]["command"] ==
          "\"/p/.claude/hooks/agentic-hooks\" tool-before --host claude");
    CHECK(pre[2]["matcher"] == "Edit");
}

TEST_CASE("merge_settings reports type mismatches") {
    auto existing = parse(R"({"hooks": []})");
    auto merged = merge_settings(existing, claude_fragment());
    REQUIRE(merged.isErr());
    CHECK(merged.error().code() == ErrorCode::SETTINGS_INVALID);
    CHECK(merged.error().message().find("hooks") != std::string::npos);
}

TEST_CASE("merge_settings appends to opencode plugin lists") {
    auto existing = parse(R"({"theme": "dark", "plugin": ["file:///x/other.js"]})");
    auto fragment = governed_fragment(TargetKind::OpenCode, "/p", {"plugins/agentic-hooks.js"});
    auto merged = merge_settings(existing, fragment);
    REQUIRE(merged.isOk());
    CHECK(merged.value()["plugin"] ==
          parse(R"(["file:///x/other.js", "file:///p/plugins/agentic-hooks.js"])"));
    CHECK(merged.value()["theme"] == "dark");
}

TEST_CASE("unmerge_settings restores the document") {
    SUBCASE("fragment keys the user never had are pruned") {
        auto original = parse(R"({"permissions": {"allow": ["Bash(echo:*)"]}})");
        auto merged = merge_settings(original, claude_fragment());
        REQUIRE(merged.isOk());
        CHECK(unmerge_settings(merged.value(), claude_fragment()) == original);
    }
    SUBCASE("user entries under shared keys survive") {
        auto original = parse(R"({"hooks": {"PreToolUse": [
            {"matcher": "Write", "hooks": [{"type": "command", "command": "lint"}]}
        ]}})");
        auto merged = merge_settings(original, claude_fragment());
        REQUIRE(merged.isOk());
        CHECK(unmerge_settings(merged.value(), claude_fragment()) == original);
    }
    SUBCASE("a document holding only the fragment becomes empty") {
        auto merged = merge_settings(SettingsJson::object(), claude_fragment());
        REQUIRE(merged.isOk());
        CHECK(unmerge_settings(merged.value(), claude_fragment()).empty());
    }
}

TEST_CASE("serialize_settings") {
    auto doc = parse(R"({"b": 1, "a": [true]})");
    CHECK(serialize_settings(doc) == "{\n  \"b\": 1,\n  \"a\": [\n    true\n  ]\n}\n");
}
