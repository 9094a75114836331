#include "askills/manifest.hpp"

#include "askills/frontmatter.hpp"
#include "askills/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace askills {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::string strip_md_suffix(const std::string& name) {
    if (name.size() > 3 && name.compare(name.size() - 3, 3, ".md") == 0) {
        return name.substr(0, name.size() - 3);
    }
    return name;
}

Scope infer_scope(const Manifest& m) {
    if (m.skills.empty() && m.agents.empty() && m.hooks) return Scope::HooksOnly;
    if (m.agents.empty() && !m.hooks && !m.skills.empty()) return Scope::SkillsOnly;
    return Scope::Full;
}

} // namespace

void normalize_set(std::vector<std::string>& values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

ManifestParseResult parse_manifest(const std::string& json_str, const std::string& source_path) {
    ManifestParseResult result;
    std::string where = source_path.empty() ? "manifest" : source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            result.is_critical_error = true;
            return result;
        }

        // target (REQUIRED)
        if (auto target = get_string(j, "target")) {
            auto kind = parse_target_kind(trim(*target));
            if (!kind) {
                result.error = "unknown target: " + *target;
                result.is_critical_error = true;
                return result;
            }
            result.manifest.target = *kind;
            // Legacy manifests (no file list) used "codex" for the single-document host
            if (*kind == TargetKind::Codex && trim(*target) == "codex" && !j.contains("files")) {
                result.manifest.target = TargetKind::CodexMd;
            }
        } else {
            result.error = "target missing";
            result.is_critical_error = true;
            return result;
        }

        Manifest& m = result.manifest;
        m.version = get_string(j, "version").value_or("");
        m.installed_at = get_string(j, "installed_at").value_or("");
        m.source = get_string(j, "source").value_or("");
        m.target_path = get_string(j, "target_path").value_or("");

        m.skills = get_string_array(j, "skills");
        for (const auto& a : get_string_array(j, "agents")) {
            m.agents.push_back(strip_md_suffix(a));
        }
        if (j.contains("hooks") && j["hooks"].is_boolean()) {
            m.hooks = j["hooks"].get<bool>();
        }

        if (j.contains("plugin_files")) {
            m.plugin_files = get_string_array(j, "plugin_files");
        } else if (j.contains("hook_scripts")) {
            // Older manifests list bare script names below the plugin directory
            std::string plugin_dir = layout_for(m.target).plugin_dir;
            for (const auto& name : get_string_array(j, "hook_scripts")) {
                bool bare = name.find('/') == std::string::npos && !plugin_dir.empty();
                m.plugin_files.push_back(bare ? plugin_dir + "/" + name : name);
            }
        }

        if (auto scope = get_string(j, "scope")) {
            auto parsed = parse_scope(*scope);
            if (parsed) {
                m.scope = *parsed;
            } else {
                result.warnings.push_back("unknown scope '" + *scope + "', inferred from contents");
                m.scope = infer_scope(m);
            }
        } else {
            m.scope = infer_scope(m);
        }

        if (j.contains("files")) {
            m.files = get_string_array(j, "files");
        } else {
            result.warnings.push_back("manifest has no file list");
        }

        if (j.contains("checksums") && j["checksums"].is_object()) {
            for (auto it = j["checksums"].begin(); it != j["checksums"].end(); ++it) {
                if (it.value().is_string()) {
                    m.checksums[it.key()] = it.value().get<std::string>();
                }
            }
        }

        if (j.contains("settings") && j["settings"].is_object()) {
            const auto& s = j["settings"];
            if (auto path = get_string(s, "path")) {
                SettingsRecord record;
                record.path = *path;
                if (s.contains("created") && s["created"].is_boolean()) {
                    record.created = s["created"].get<bool>();
                }
                m.settings = record;
            } else {
                result.warnings.push_back("settings.path missing");
            }
        }

        normalize_set(m.skills);
        normalize_set(m.agents);
        normalize_set(m.plugin_files);
        normalize_set(m.files);

        result.ok = true;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        result.is_critical_error = true;
    }

    for (const auto& w : result.warnings) {
        spdlog::debug("{}: {}", where, w);
    }
    return result;
}

std::string serialize_manifest(const Manifest& m) {
    nlohmann::json j;
    j["version"] = m.version;
    j["installed_at"] = m.installed_at;
    j["source"] = m.source;
    j["target"] = target_to_string(m.target);
    j["target_path"] = m.target_path;
    j["scope"] = scope_to_string(m.scope);
    j["skills"] = m.skills;
    j["agents"] = m.agents;
    j["hooks"] = m.hooks;
    j["plugin_files"] = m.plugin_files;
    j["files"] = m.files;

    nlohmann::json checksums = nlohmann::json::object();
    for (const auto& [path, digest] : m.checksums) {
        checksums[path] = digest;
    }
    j["checksums"] = checksums;

    if (m.settings) {
        j["settings"] = {{"path", m.settings->path}, {"created", m.settings->created}};
    }

    return j.dump(2) + "\n";
}

std::string manifest_path(const std::string& root) {
    return join_path(root, kManifestFileName);
}

Result<Manifest> read_manifest(const std::string& root) {
    std::string path = manifest_path(root);
    if (!path_exists(path)) {
        return Result<Manifest>::err(
            Error(ErrorCode::NOT_INSTALLED, "no installation found at " + root));
    }

    auto content = read_file(path);
    if (!content) {
        return Result<Manifest>::err(Error(ErrorCode::IO_ERROR, "failed to read " + path));
    }

    auto parsed = parse_manifest(*content, path);
    if (!parsed.ok) {
        return Result<Manifest>::err(
            Error(ErrorCode::MANIFEST_INVALID, path + ": " + parsed.error));
    }
    return Result<Manifest>::ok(std::move(parsed.manifest));
}

Result<bool> write_manifest(const std::string& root, const Manifest& manifest) {
    std::string path = manifest_path(root);
    std::string serialized = serialize_manifest(manifest);

    auto existing = read_file(path);
    if (existing && *existing == serialized) {
        spdlog::debug("manifest unchanged: {}", path);
        return Result<bool>::ok(false);
    }

    auto write_result = atomic_write_file(path, serialized);
    if (!write_result.ok) {
        return Result<bool>::err(
            Error(ErrorCode::IO_ERROR, "failed to write " + path + ": " + write_result.error));
    }
    return Result<bool>::ok(true);
}

Result<void> remove_manifest(const std::string& root) {
    std::string path = manifest_path(root);
    if (!remove_file(path)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to remove " + path));
    }
    return Result<void>::ok();
}

ManifestDiff diff_manifests(const std::optional<Manifest>& old_manifest, const Manifest& next) {
    ManifestDiff diff;
    std::set<std::string> old_files;
    if (old_manifest) old_files.insert(old_manifest->files.begin(), old_manifest->files.end());
    std::set<std::string> new_files(next.files.begin(), next.files.end());

    for (const auto& f : new_files) {
        if (!old_files.count(f)) diff.to_add.push_back(f);
    }
    for (const auto& f : old_files) {
        if (!new_files.count(f)) diff.to_remove.push_back(f);
    }
    return diff;
}

} // namespace askills
