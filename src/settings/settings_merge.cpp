#include "askills/settings_merge.hpp"

#include "askills/frontmatter.hpp"
#include "askills/platform.hpp"

namespace askills {

namespace {

const char* type_name_of(const SettingsJson& v) {
    if (v.is_object()) return "object";
    if (v.is_array()) return "array";
    if (v.is_string()) return "string";
    if (v.is_boolean()) return "boolean";
    if (v.is_number()) return "number";
    return "null";
}

// Replace-or-append: the manager's elements are swapped in where the first of
// them was found, others keep their position.
SettingsJson merge_owned_list(const SettingsJson& existing, const SettingsJson& fragment,
                              const std::string& token) {
    SettingsJson result = SettingsJson::array();
    bool inserted = false;
    for (const auto& elem : existing) {
        if (json_contains_token(elem, token)) {
            if (!inserted) {
                for (const auto& f : fragment) result.push_back(f);
                inserted = true;
            }
            continue;
        }
        result.push_back(elem);
    }
    if (!inserted) {
        for (const auto& f : fragment) result.push_back(f);
    }
    return result;
}

bool merge_into(SettingsJson& target, const SettingsJson& fragment, const std::string& token,
                const std::string& path, std::string& error) {
    for (auto it = fragment.begin(); it != fragment.end(); ++it) {
        const std::string& key = it.key();
        const SettingsJson& fv = it.value();
        std::string key_path = path.empty() ? key : path + "." + key;

        auto existing = target.find(key);
        if (existing == target.end()) {
            target[key] = fv;
            continue;
        }

        SettingsJson& tv = *existing;
        if (fv.is_object()) {
            if (!tv.is_object()) {
                error = key_path + ": expected object, found " + type_name_of(tv);
                return false;
            }
            if (!merge_into(tv, fv, token, key_path, error)) return false;
        } else if (fv.is_array()) {
            if (!tv.is_array()) {
                error = key_path + ": expected array, found " + type_name_of(tv);
                return false;
            }
            tv = merge_owned_list(tv, fv, token);
        } else {
            tv = fv;
        }
    }
    return true;
}

bool unmerge_from(SettingsJson& target, const SettingsJson& fragment, const std::string& token) {
    bool changed = false;
    for (auto it = fragment.begin(); it != fragment.end(); ++it) {
        const std::string& key = it.key();
        const SettingsJson& fv = it.value();

        auto existing = target.find(key);
        if (existing == target.end()) continue;
        SettingsJson& tv = *existing;

        if (fv.is_object() && tv.is_object()) {
            if (unmerge_from(tv, fv, token)) {
                changed = true;
                if (tv.empty()) target.erase(key);
            }
        } else if (fv.is_array() && tv.is_array()) {
            SettingsJson kept = SettingsJson::array();
            for (const auto& elem : tv) {
                if (!json_contains_token(elem, token)) kept.push_back(elem);
            }
            if (kept.size() != tv.size()) {
                changed = true;
                if (kept.empty()) {
                    target.erase(key);
                } else {
                    tv = kept;
                }
            }
        } else if (!fv.is_object() && !fv.is_array() && tv == fv) {
            target.erase(key);
            changed = true;
        }
    }
    return changed;
}

std::string quote_command_path(const std::string& path) {
    return "\"" + path + "\"";
}

SettingsJson claude_command_hook(const std::string& command) {
    SettingsJson hook = SettingsJson::object();
    hook["type"] = "command";
    hook["command"] = command;
    return hook;
}

SettingsJson claude_hook_entry(const std::string& matcher, const std::string& command) {
    SettingsJson entry = SettingsJson::object();
    entry["matcher"] = matcher;
    entry["hooks"] = SettingsJson::array({claude_command_hook(command)});
    return entry;
}

} // namespace

bool is_plugin_shim(const std::string& name) {
    for (const char* ext : {".js", ".mjs", ".ts"}) {
        std::string e(ext);
        if (name.size() > e.size() && name.compare(name.size() - e.size(), e.size(), e) == 0) {
            return true;
        }
    }
    return false;
}

bool json_contains_token(const SettingsJson& value, const std::string& token) {
    if (value.is_string()) {
        return value.get_ref<const std::string&>().find(token) != std::string::npos;
    }
    if (value.is_object() || value.is_array()) {
        for (const auto& child : value) {
            if (json_contains_token(child, token)) return true;
        }
    }
    return false;
}

Result<SettingsJson> parse_settings(const std::string& text, const std::string& source_path) {
    std::string where = source_path.empty() ? "settings" : source_path;
    if (trim(text).empty()) {
        return Result<SettingsJson>::ok(SettingsJson::object());
    }

    try {
        auto doc = SettingsJson::parse(text);
        if (!doc.is_object()) {
            return Result<SettingsJson>::err(
                Error(ErrorCode::SETTINGS_INVALID, where + ": root must be a JSON object"));
        }
        return Result<SettingsJson>::ok(std::move(doc));
    } catch (const SettingsJson::parse_error& e) {
        return Result<SettingsJson>::err(
            Error(ErrorCode::SETTINGS_INVALID, where + ": " + e.what()));
    }
}

Result<SettingsJson> merge_settings(const SettingsJson& existing, const SettingsJson& fragment,
                                    const std::string& token) {
    if (!existing.is_object()) {
        return Result<SettingsJson>::err(
            Error(ErrorCode::SETTINGS_INVALID, "root must be a JSON object"));
    }
    if (fragment.is_null()) return Result<SettingsJson>::ok(existing);

    SettingsJson merged = existing;
    std::string error;
    if (!merge_into(merged, fragment, token, "", error)) {
        return Result<SettingsJson>::err(Error(ErrorCode::SETTINGS_INVALID, error));
    }
    return Result<SettingsJson>::ok(std::move(merged));
}

SettingsJson unmerge_settings(const SettingsJson& existing, const SettingsJson& fragment,
                              const std::string& token) {
    SettingsJson result = existing;
    if (!result.is_object() || !fragment.is_object()) return result;
    unmerge_from(result, fragment, token);
    return result;
}

bool fragment_present(const SettingsJson& existing, const SettingsJson& fragment,
                      const std::string& token) {
    auto merged = merge_settings(existing, fragment, token);
    return merged.isOk() && merged.value() == existing;
}

std::string serialize_settings(const SettingsJson& doc) {
    return doc.dump(2) + "\n";
}

SettingsJson governed_fragment(TargetKind target, const std::string& root,
                               const std::vector<std::string>& plugin_files) {
    TargetLayout layout = layout_for(target);
    if (!layout.supports_hooks()) return nullptr;

    if (target == TargetKind::Claude) {
        std::string bridge_rel = layout.plugin_dir + "/" + kHookToken;
        bool deployed = false;
        for (const auto& f : plugin_files) {
            if (f == bridge_rel) deployed = true;
        }
        if (!deployed) return nullptr;

        std::string bridge = quote_command_path(join_path(root, bridge_rel));
        SettingsJson hooks = SettingsJson::object();
        hooks["PreToolUse"] = SettingsJson::array(
            {claude_hook_entry("Bash", bridge + " tool-before --host claude")});
        hooks["SessionStart"] = SettingsJson::array(
            {claude_hook_entry("startup", bridge + " event session.created --host claude"),
             claude_hook_entry("compact", bridge + " event session.compacted --host claude")});

        SettingsJson fragment = SettingsJson::object();
        fragment["hooks"] = hooks;
        return fragment;
    }

    // opencode: register loadable plugin shims by file URL
    SettingsJson plugins = SettingsJson::array();
    for (const auto& f : plugin_files) {
        std::string name = get_filename(f);
        if (name.find(kHookToken) == std::string::npos || !is_plugin_shim(name)) continue;
        plugins.push_back("file://" + join_path(root, f));
    }
    if (plugins.empty()) return nullptr;

    SettingsJson fragment = SettingsJson::object();
    fragment["plugin"] = plugins;
    return fragment;
}

} // namespace askills
