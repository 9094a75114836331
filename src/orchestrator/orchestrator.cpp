#include "askills/orchestrator.hpp"

#include "askills/frontmatter.hpp"
#include "askills/platform.hpp"
#include "askills/settings_merge.hpp"
#include "askills/version.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <set>

namespace askills {

// ============================================================================
// TerminalConfirmer
// ============================================================================

bool TerminalConfirmer::interactive() const {
    return stdin_is_interactive();
}

bool TerminalConfirmer::confirm(const std::string& question, bool default_yes) {
    std::cerr << question << (default_yes ? " [Y/n]: " : " [y/N]: ") << std::flush;

    std::string line;
    if (!std::getline(std::cin, line)) return false;

    line = trim(line);
    if (line.empty()) return default_yes;
    return line[0] == 'y' || line[0] == 'Y';
}

namespace {

// Governed settings change computed before any write
struct SettingsStep {
    std::string path;
    bool write = false;
    bool remove = false;
    std::string text;
    std::optional<SettingsRecord> record;
};

Result<SettingsJson> load_settings_document(const std::string& path, const std::string& rel,
                                            bool& exists) {
    exists = path_exists(path);
    if (!exists) return Result<SettingsJson>::ok(SettingsJson::object());

    auto content = read_file(path);
    if (!content) {
        return Result<SettingsJson>::err(Error(ErrorCode::IO_ERROR, "failed to read " + path));
    }
    return parse_settings(*content, rel);
}

Result<SettingsStep> plan_settings_step(const std::string& root, const DeploymentPlan& plan,
                                        const std::optional<Manifest>& prior) {
    SettingsStep step;

    if (plan.settings) {
        const std::string& rel = plan.settings->rel_path;
        step.path = join_path(root, rel);

        bool exists = false;
        auto doc = load_settings_document(step.path, rel, exists);
        if (doc.isErr()) return Result<SettingsStep>::err(doc.error());

        auto merged = merge_settings(doc.value(), plan.settings->fragment);
        if (merged.isErr()) {
            return Result<SettingsStep>::err(merged.error().withContext(rel));
        }

        step.write = !exists || merged.value() != doc.value();
        step.text = serialize_settings(merged.value());

        bool created = (prior && prior->settings) ? prior->settings->created : !exists;
        step.record = SettingsRecord{rel, created};
        return Result<SettingsStep>::ok(std::move(step));
    }

    // Hooks dropped from scope: take the previous registration back out
    if (prior && prior->settings) {
        SettingsJson fragment = governed_fragment(prior->target, root, prior->plugin_files);
        step.path = join_path(root, prior->settings->path);

        bool exists = false;
        auto doc = load_settings_document(step.path, prior->settings->path, exists);
        if (doc.isErr()) return Result<SettingsStep>::err(doc.error());
        if (!exists || fragment.is_null()) return Result<SettingsStep>::ok(std::move(step));

        SettingsJson stripped = unmerge_settings(doc.value(), fragment);
        if (stripped.empty() && prior->settings->created) {
            step.remove = true;
        } else if (stripped != doc.value()) {
            step.write = true;
            step.text = serialize_settings(stripped);
        }
    }
    return Result<SettingsStep>::ok(std::move(step));
}

Manifest build_manifest(const DeploymentPlan& plan, const SourceBundle& bundle,
                        const std::optional<Manifest>& prior) {
    Manifest m;
    m.version = ASKILLS_VERSION;
    m.installed_at = (prior && !prior->installed_at.empty()) ? prior->installed_at
                                                             : get_current_timestamp();
    m.source = bundle.root;
    m.target = plan.target;
    m.target_path = plan.root;
    m.scope = plan.scope;
    m.skills = plan.skills;
    m.agents = plan.agents;
    m.hooks = plan.hooks;
    m.plugin_files = plan.plugin_files;

    for (const auto& f : plan.files) {
        m.files.push_back(f.rel_path);
        m.checksums[f.rel_path] = digest_ref(f.content);
    }

    normalize_set(m.skills);
    normalize_set(m.agents);
    normalize_set(m.plugin_files);
    normalize_set(m.files);
    return m;
}

bool file_matches(const std::string& path, const std::string& digest) {
    auto hash = compute_sha256_file(path);
    return hash.ok && "sha256:" + hash.hex_digest == digest;
}

// Record what actually reached disk before an aborted write phase
void record_partial(const std::string& root, const std::optional<Manifest>& prior,
                    const Manifest& next, const std::vector<std::string>& done) {
    Manifest partial = next;
    partial.files.clear();
    partial.checksums.clear();
    partial.settings = prior ? prior->settings : std::nullopt;

    if (prior) {
        partial.files = prior->files;
        partial.checksums = prior->checksums;
        partial.skills.insert(partial.skills.end(), prior->skills.begin(), prior->skills.end());
        partial.agents.insert(partial.agents.end(), prior->agents.begin(), prior->agents.end());
        partial.plugin_files.insert(partial.plugin_files.end(), prior->plugin_files.begin(),
                                    prior->plugin_files.end());
        partial.hooks = partial.hooks || prior->hooks;
    }
    for (const auto& rel : done) {
        partial.files.push_back(rel);
        auto it = next.checksums.find(rel);
        if (it != next.checksums.end()) partial.checksums[rel] = it->second;
    }
    normalize_set(partial.skills);
    normalize_set(partial.agents);
    normalize_set(partial.plugin_files);
    normalize_set(partial.files);

    auto written = write_manifest(root, partial);
    if (written.isErr()) {
        spdlog::warn("failed to record partial install: {}", written.error().message());
    }
}

Result<std::optional<Manifest>> load_prior(const std::string& root, bool force) {
    auto manifest = read_manifest(root);
    if (manifest.isErr()) {
        ErrorCode code = manifest.error().code();
        if (code == ErrorCode::NOT_INSTALLED) {
            return Result<std::optional<Manifest>>::ok(std::nullopt);
        }
        if (code == ErrorCode::MANIFEST_INVALID && force) {
            spdlog::warn("ignoring unreadable manifest: {}", manifest.error().message());
            return Result<std::optional<Manifest>>::ok(std::nullopt);
        }
        return Result<std::optional<Manifest>>::err(manifest.error());
    }

    Manifest m = manifest.value();
    if (m.files.empty()) m.files = expand_legacy_files(root, m);
    return Result<std::optional<Manifest>>::ok(std::move(m));
}

} // namespace

// ============================================================================
// Orchestrator
// ============================================================================

const char* Orchestrator::version() {
    return ASKILLS_VERSION;
}

Result<OperationReport> Orchestrator::install(const InstallRequest& request) {
    if (request.root.empty()) {
        return Result<OperationReport>::err(
            Error(ErrorCode::INVALID_ARGUMENT, "target path is empty"));
    }
    std::string root = absolute_path(request.root);

    auto bundle = load_bundle(request.bundle_root);
    if (bundle.isErr()) return Result<OperationReport>::err(bundle.error());

    auto prior = load_prior(root, request.force);
    if (prior.isErr()) return Result<OperationReport>::err(prior.error());

    if (prior.value() && prior.value()->target != request.target) {
        return Result<OperationReport>::err(Error(
            ErrorCode::INVALID_ARGUMENT,
            root + " already holds a " + target_to_string(prior.value()->target) +
                " installation"));
    }

    return apply(bundle.value(), request.target, request.scope, root, prior.value(),
                 request.force, request.dry_run);
}

Result<OperationReport> Orchestrator::update(const UpdateRequest& request) {
    std::string root = absolute_path(request.root);

    auto prior = load_prior(root, false);
    if (prior.isErr()) return Result<OperationReport>::err(prior.error());
    if (!prior.value()) {
        return Result<OperationReport>::err(
            Error(ErrorCode::NOT_INSTALLED, "no installation found at " + root));
    }
    const Manifest& manifest = *prior.value();

    std::string bundle_root = request.bundle_root.empty() ? manifest.source : request.bundle_root;
    if (bundle_root.empty()) {
        return Result<OperationReport>::err(Error(
            ErrorCode::INVALID_ARGUMENT, "manifest records no source bundle; pass --bundle"));
    }

    auto bundle = load_bundle(bundle_root);
    if (bundle.isErr()) return Result<OperationReport>::err(bundle.error());

    return apply(bundle.value(), manifest.target, manifest.scope, root, prior.value(),
                 request.force, request.dry_run);
}

Result<OperationReport> Orchestrator::selfUpdate(const SelfUpdateRequest& request) {
    if (request.source.empty()) {
        return Result<OperationReport>::err(
            Error(ErrorCode::INVALID_ARGUMENT, "source path is empty"));
    }
    auto valid = validate_bundle_root(request.source);
    if (valid.isErr()) return Result<OperationReport>::err(valid.error());

    std::string root = absolute_path(request.root);
    auto prior = load_prior(root, false);
    if (prior.isErr()) return Result<OperationReport>::err(prior.error());
    if (!prior.value()) {
        return Result<OperationReport>::err(
            Error(ErrorCode::NOT_INSTALLED, "no installation found at " + root));
    }

    if (!request.yes && confirmer_.interactive() &&
        !confirmer_.confirm("Update " + root + " from " + absolute_path(request.source) + "?",
                            true)) {
        return Result<OperationReport>::err(Error(ErrorCode::ABORTED, "self-update cancelled"));
    }

    auto bundle = load_bundle(request.source);
    if (bundle.isErr()) return Result<OperationReport>::err(bundle.error());

    const Manifest& manifest = *prior.value();
    return apply(bundle.value(), manifest.target, manifest.scope, root, prior.value(),
                 request.force, false);
}

Result<OperationReport> Orchestrator::apply(const SourceBundle& bundle, TargetKind target,
                                            Scope scope, const std::string& root,
                                            const std::optional<Manifest>& prior, bool force,
                                            bool dry_run) {
    auto planned = plan_deployment(bundle, target, scope, root);
    if (planned.isErr()) return Result<OperationReport>::err(planned.error());
    const DeploymentPlan& plan = planned.value();

    // A source without hook artifacts must not unwire an installed bridge
    if (prior && prior->hooks && scope_includes_hooks(scope) && !plan.hooks) {
        return Result<OperationReport>::err(
            Error(ErrorCode::BUNDLE_INVALID,
                  "bundle has no hook artifacts but " + root + " has hooks installed: " +
                      bundle.root));
    }

    OperationReport report;
    report.root = root;
    report.dry_run = dry_run;
    report.violations = plan.violations;
    report.warnings = plan.warnings;

    Manifest next = build_manifest(plan, bundle, prior);

    auto settings = plan_settings_step(root, plan, prior);
    if (settings.isErr()) return Result<OperationReport>::err(settings.error());
    const SettingsStep& step = settings.value();
    next.settings = step.record;

    // Classify every planned file before touching anything
    std::set<std::string> owned;
    if (prior) owned.insert(prior->files.begin(), prior->files.end());

    std::vector<std::string> conflicts;
    for (const auto& f : plan.files) {
        std::string path = join_path(root, f.rel_path);
        bool exists = path_exists(path);
        bool same = exists && file_matches(path, next.checksums[f.rel_path]) &&
                    is_executable(path) == f.executable;
        report.actions.push_back({same ? FileAction::Unchanged : FileAction::Write, f.rel_path});
        if (exists && !same && !owned.count(f.rel_path)) conflicts.push_back(f.rel_path);
    }

    ManifestDiff diff = diff_manifests(prior, next);
    for (const auto& rel : diff.to_remove) {
        report.actions.push_back({FileAction::Remove, rel});
    }

    if (!conflicts.empty() && !force) {
        std::string summary = std::to_string(conflicts.size()) +
                              " existing file(s) not installed by agentic-skills would be "
                              "overwritten (first: " + conflicts.front() + ")";
        if (dry_run) {
            report.warnings.push_back(summary);
        } else if (!confirmer_.interactive()) {
            return Result<OperationReport>::err(
                Error(ErrorCode::CONFLICT, summary + "; use --force to overwrite"));
        } else if (!confirmer_.confirm(summary + ". Overwrite?", false)) {
            return Result<OperationReport>::err(Error(ErrorCode::ABORTED, "install cancelled"));
        }
    }

    if (dry_run) {
        report.manifest = next;
        return Result<OperationReport>::ok(std::move(report));
    }

    // Write phase
    std::vector<std::string> done;
    for (size_t i = 0; i < plan.files.size(); ++i) {
        const HostFile& f = plan.files[i];
        if (report.actions[i].action == FileAction::Unchanged) {
            report.unchanged++;
            done.push_back(f.rel_path);
            continue;
        }

        auto written = atomic_write_file(join_path(root, f.rel_path), f.content,
                                         f.executable ? 0755u : 0644u);
        if (!written.ok) {
            record_partial(root, prior, next, done);
            return Result<OperationReport>::err(
                Error(ErrorCode::IO_ERROR, "failed to write " + f.rel_path + ": " + written.error));
        }
        spdlog::debug("wrote {}", f.rel_path);
        report.written++;
        done.push_back(f.rel_path);
    }

    for (const auto& rel : diff.to_remove) {
        std::string path = join_path(root, rel);
        if (path_exists(path) && !remove_file(path)) {
            report.warnings.push_back("failed to remove " + rel);
            next.files.push_back(rel);
            auto it = prior->checksums.find(rel);
            if (it != prior->checksums.end()) next.checksums[rel] = it->second;
            continue;
        }
        spdlog::debug("removed {}", rel);
        report.removed++;
        prune_empty_directories(get_parent_directory(path), root);
    }
    normalize_set(next.files);

    if (step.write) {
        auto written = atomic_write_file(step.path, step.text);
        if (!written.ok) {
            next.settings = prior ? prior->settings : std::nullopt;
            auto recorded = write_manifest(root, next);
            if (recorded.isErr()) spdlog::warn("{}", recorded.error().message());
            return Result<OperationReport>::err(
                Error(ErrorCode::IO_ERROR, "failed to write " + step.path + ": " + written.error));
        }
        report.settings_changed = true;
    } else if (step.remove) {
        if (remove_file(step.path)) {
            report.settings_changed = true;
        } else {
            report.warnings.push_back("failed to remove " + step.path);
        }
    }

    auto manifest_written = write_manifest(root, next);
    if (manifest_written.isErr()) return Result<OperationReport>::err(manifest_written.error());
    report.manifest_written = manifest_written.value();
    report.manifest = next;

    spdlog::info("{}: {} written, {} unchanged, {} removed", root, report.written,
                 report.unchanged, report.removed);
    return Result<OperationReport>::ok(std::move(report));
}

Result<UninstallReport> Orchestrator::uninstall(const std::string& root_path, bool force) {
    std::string root = absolute_path(root_path);

    auto read = read_manifest(root);
    if (read.isErr()) return Result<UninstallReport>::err(read.error());
    const Manifest& manifest = read.value();

    std::vector<std::string> files =
        manifest.files.empty() ? expand_legacy_files(root, manifest) : manifest.files;

    if (!force && confirmer_.interactive() &&
        !confirmer_.confirm("Remove " + std::to_string(files.size()) + " file(s) from " + root +
                                "?",
                            false)) {
        return Result<UninstallReport>::err(Error(ErrorCode::ABORTED, "uninstall cancelled"));
    }

    UninstallReport report;
    report.root = root;

    for (const auto& rel : files) {
        std::string path = join_path(root, rel);
        if (!path_exists(path)) {
            report.missing.push_back(rel);
            continue;
        }
        if (!remove_file(path)) {
            return Result<UninstallReport>::err(
                Error(ErrorCode::IO_ERROR, "failed to remove " + path));
        }
        report.removed++;
        prune_empty_directories(get_parent_directory(path), root);
    }

    if (manifest.settings) {
        std::string rel = manifest.settings->path;
        std::string path = join_path(root, rel);
        SettingsJson fragment = governed_fragment(manifest.target, root, manifest.plugin_files);
        auto content = read_file(path);

        if (content && !fragment.is_null()) {
            auto doc = parse_settings(*content, rel);
            if (doc.isErr()) {
                report.warnings.push_back(doc.error().message() + "; left untouched");
            } else {
                SettingsJson stripped = unmerge_settings(doc.value(), fragment);
                if (stripped.empty() && manifest.settings->created) {
                    if (remove_file(path)) {
                        report.settings_removed = true;
                    } else {
                        report.warnings.push_back("failed to remove " + rel);
                    }
                } else if (stripped != doc.value()) {
                    auto written = atomic_write_file(path, serialize_settings(stripped));
                    if (!written.ok) {
                        return Result<UninstallReport>::err(Error(
                            ErrorCode::IO_ERROR, "failed to write " + rel + ": " + written.error));
                    }
                    report.settings_changed = true;
                }
            }
        }
    }

    auto removed = remove_manifest(root);
    if (removed.isErr()) return Result<UninstallReport>::err(removed.error());

    spdlog::info("{}: removed {} file(s)", root, report.removed);
    return Result<UninstallReport>::ok(std::move(report));
}

DoctorReport Orchestrator::doctor(const std::string& root_path) const {
    DoctorReport report;
    report.root = absolute_path(root_path);

    auto manifest = read_manifest(report.root);
    if (manifest.isErr()) {
        if (manifest.error().code() == ErrorCode::NOT_INSTALLED) return report;

        report.installed = true;
        CheckGroup group;
        group.fail("manifest", manifest.error().message());
        report.add(std::move(group));
        return report;
    }

    report.installed = true;
    const Manifest& m = manifest.value();

    CheckGroup parsed;
    parsed.pass("manifest", manifest_path(report.root));
    report.add(std::move(parsed));

    report.add(check_recorded_files(report.root, m));
    report.add(check_unrecorded_files(report.root, m));
    report.add(check_temp_artifacts(report.root, m));
    report.add(check_settings_fragment(report.root, m));
    report.add(check_checksums(report.root, m));

    report.manifest = m;
    return report;
}

Result<StatusReport> Orchestrator::status(const std::string& root_path) const {
    StatusReport report;
    report.root = absolute_path(root_path);

    auto manifest = read_manifest(report.root);
    if (manifest.isErr()) {
        if (manifest.error().code() == ErrorCode::NOT_INSTALLED) {
            return Result<StatusReport>::ok(std::move(report));
        }
        return Result<StatusReport>::err(manifest.error());
    }

    report.installed = true;
    report.manifest = manifest.value();
    return Result<StatusReport>::ok(std::move(report));
}

// ============================================================================
// Discovery
// ============================================================================

std::vector<std::string> discover_installations(const std::string& base) {
    std::vector<std::string> roots;
    for (TargetKind kind : {TargetKind::Claude, TargetKind::OpenCode, TargetKind::Codex,
                            TargetKind::CodexMd}) {
        std::string default_root = layout_for(kind).default_root;
        std::string dir = default_root == "." ? base : join_path(base, default_root);
        if (is_regular_file(manifest_path(dir))) roots.push_back(absolute_path(dir));
    }
    normalize_set(roots);
    return roots;
}

std::vector<std::string> expand_legacy_files(const std::string& root, const Manifest& manifest) {
    std::vector<std::string> files;
    TargetLayout layout = layout_for(manifest.target);

    if (layout.is_single_document()) {
        if ((!manifest.skills.empty() || !manifest.agents.empty()) &&
            is_regular_file(join_path(root, layout.single_document))) {
            files.push_back(layout.single_document);
        }
    } else {
        for (const auto& skill : manifest.skills) {
            std::string rel_dir = layout.skills_dir + "/" + skill;
            for (const auto& rel : list_files_recursive(join_path(root, rel_dir))) {
                if (!is_temp_artifact(get_filename(rel))) files.push_back(rel_dir + "/" + rel);
            }
        }
        for (const auto& agent : manifest.agents) {
            std::string rel = layout.agents_dir + "/" + agent + ".md";
            if (is_regular_file(join_path(root, rel))) files.push_back(rel);
        }
    }

    for (const auto& rel : manifest.plugin_files) {
        if (is_regular_file(join_path(root, rel))) files.push_back(rel);
    }

    normalize_set(files);
    return files;
}

} // namespace askills
