#include "askills/doctor.hpp"

#include "askills/platform.hpp"
#include "askills/settings_merge.hpp"

#include <set>

namespace askills {

void CheckGroup::pass(const std::string& name, const std::string& detail) {
    checks.push_back({name, CheckStatus::Pass, detail});
    tally.passed++;
}

void CheckGroup::fail(const std::string& name, const std::string& detail) {
    checks.push_back({name, CheckStatus::Fail, detail});
    tally.failed++;
}

void CheckGroup::warn(const std::string& name, const std::string& detail) {
    checks.push_back({name, CheckStatus::Warn, detail});
    tally.warned++;
}

void DoctorReport::add(CheckGroup group) {
    for (auto& c : group.checks) checks.push_back(std::move(c));
    tally += group.tally;
}

namespace {

std::string rel_join(const std::string& a, const std::string& b) {
    return a.empty() ? b : a + "/" + b;
}

// Per-unit presence for manifests written without a file list
void check_recorded_units(const std::string& root, const Manifest& manifest, CheckGroup& group) {
    TargetLayout layout = layout_for(manifest.target);
    std::vector<std::string> expected;

    if (layout.is_single_document()) {
        if (!manifest.skills.empty() || !manifest.agents.empty()) {
            expected.push_back(layout.single_document);
        }
    } else {
        for (const auto& s : manifest.skills) {
            expected.push_back(rel_join(layout.skills_dir, s + "/SKILL.md"));
        }
        for (const auto& a : manifest.agents) {
            expected.push_back(rel_join(layout.agents_dir, a + ".md"));
        }
    }
    for (const auto& p : manifest.plugin_files) expected.push_back(p);

    size_t missing = 0;
    for (const auto& rel : expected) {
        if (!is_regular_file(join_path(root, rel))) {
            group.fail("recorded file", "missing: " + rel);
            missing++;
        }
    }
    if (missing == 0) {
        group.pass("recorded files", std::to_string(expected.size()) + " present");
    }
}

void scan_temp_artifacts(const std::string& root, const std::string& rel_dir, bool recursive,
                         CheckGroup& group, size_t& found) {
    std::string dir = rel_dir.empty() ? root : join_path(root, rel_dir);
    if (!is_directory(dir)) return;

    if (recursive) {
        for (const auto& rel : list_files_recursive(dir)) {
            if (is_temp_artifact(get_filename(rel))) {
                group.fail("temp artifact", "leftover: " + rel_join(rel_dir, rel));
                found++;
            }
        }
        return;
    }

    for (const auto& name : list_directory(dir)) {
        if (is_temp_artifact(name) && is_regular_file(join_path(dir, name))) {
            group.fail("temp artifact", "leftover: " + rel_join(rel_dir, name));
            found++;
        }
    }
}

} // namespace

CheckGroup check_recorded_files(const std::string& root, const Manifest& manifest) {
    CheckGroup group;

    if (manifest.files.empty()) {
        check_recorded_units(root, manifest, group);
        return group;
    }

    size_t missing = 0;
    for (const auto& rel : manifest.files) {
        if (!is_regular_file(join_path(root, rel))) {
            group.fail("recorded file", "missing: " + rel);
            missing++;
        }
    }
    if (missing == 0) {
        group.pass("recorded files", std::to_string(manifest.files.size()) + " present");
    }
    return group;
}

CheckGroup check_unrecorded_files(const std::string& root, const Manifest& manifest) {
    CheckGroup group;

    if (manifest.files.empty()) {
        group.warn("unrecorded files", "manifest has no file list; skipped");
        return group;
    }

    std::set<std::string> recorded(manifest.files.begin(), manifest.files.end());
    TargetLayout layout = layout_for(manifest.target);
    size_t strays = 0;

    if (!layout.is_single_document()) {
        for (const auto& skill : manifest.skills) {
            std::string rel_dir = rel_join(layout.skills_dir, skill);
            for (const auto& rel : list_files_recursive(join_path(root, rel_dir))) {
                if (is_temp_artifact(get_filename(rel))) continue;
                std::string path = rel_join(rel_dir, rel);
                if (!recorded.count(path)) {
                    group.fail("unrecorded file", path);
                    strays++;
                }
            }
        }
    }

    if (manifest.hooks && layout.supports_hooks()) {
        std::string plugin_dir = join_path(root, layout.plugin_dir);
        for (const auto& name : list_directory(plugin_dir)) {
            if (name.find(kHookToken) == std::string::npos || is_temp_artifact(name)) continue;
            if (!is_regular_file(join_path(plugin_dir, name))) continue;
            std::string path = rel_join(layout.plugin_dir, name);
            if (!recorded.count(path)) {
                group.fail("unrecorded file", path);
                strays++;
            }
        }
    }

    if (strays == 0) group.pass("unrecorded files", "none");
    return group;
}

CheckGroup check_temp_artifacts(const std::string& root, const Manifest& manifest) {
    CheckGroup group;
    TargetLayout layout = layout_for(manifest.target);
    size_t found = 0;

    scan_temp_artifacts(root, "", false, group, found);
    if (!layout.skills_dir.empty()) scan_temp_artifacts(root, layout.skills_dir, true, group, found);
    if (!layout.agents_dir.empty()) scan_temp_artifacts(root, layout.agents_dir, false, group, found);
    if (!layout.plugin_dir.empty()) scan_temp_artifacts(root, layout.plugin_dir, false, group, found);

    if (found == 0) group.pass("temp artifacts", "none");
    return group;
}

CheckGroup check_settings_fragment(const std::string& root, const Manifest& manifest) {
    CheckGroup group;
    if (!manifest.hooks) return group;

    SettingsJson fragment = governed_fragment(manifest.target, root, manifest.plugin_files);
    if (fragment.is_null()) {
        if (layout_for(manifest.target).supports_hooks()) {
            group.fail("settings fragment",
                       std::string("hook bridge not registered: no ") + kHookToken +
                           " in recorded plugin files");
        }
        return group;
    }

    std::string rel = manifest.settings ? manifest.settings->path
                                        : layout_for(manifest.target).settings_file;
    std::string path = join_path(root, rel);

    auto content = read_file(path);
    if (!content) {
        group.fail("settings fragment", "missing: " + rel);
        return group;
    }

    auto doc = parse_settings(*content, rel);
    if (doc.isErr()) {
        group.fail("settings fragment", doc.error().message());
        return group;
    }

    if (fragment_present(doc.value(), fragment)) {
        group.pass("settings fragment", rel);
    } else {
        group.fail("settings fragment", "hook registration missing or outdated in " + rel);
    }
    return group;
}

CheckGroup check_checksums(const std::string& root, const Manifest& manifest) {
    CheckGroup group;
    size_t drifted = 0;

    for (const auto& [rel, digest] : manifest.checksums) {
        std::string path = join_path(root, rel);
        if (!is_regular_file(path)) continue;

        auto hash = compute_sha256_file(path);
        if (!hash.ok || "sha256:" + hash.hex_digest != digest) {
            group.warn("checksum", "modified since install: " + rel);
            drifted++;
        }
    }

    if (drifted == 0 && !manifest.checksums.empty()) {
        group.pass("checksums", std::to_string(manifest.checksums.size()) + " match");
    }
    return group;
}

} // namespace askills
