#pragma once

#include "askills/result.hpp"
#include "askills/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace askills {

// ============================================================================
// Host Settings Documents
// ============================================================================
//
// The manager owns a fragment of a host JSON file (claude settings.local.json
// `hooks`, opencode.json `plugin`). Inside owned lists its entries are the
// elements that mention kHookToken; every other element and every key outside
// the fragment is left as the user wrote it. Key order is preserved.

using SettingsJson = nlohmann::ordered_json;

constexpr const char* kHookToken = "agentic-hooks";

// Parse an existing document. Empty text is an empty object. Invalid JSON or a
// non-object root is SETTINGS_INVALID.
Result<SettingsJson> parse_settings(const std::string& text, const std::string& source_path = "");

// Deep merge `fragment` into `existing`. Idempotent.
Result<SettingsJson> merge_settings(const SettingsJson& existing, const SettingsJson& fragment,
                                    const std::string& token = kHookToken);

// Inverse of merge_settings: drop the manager's entries below the keys named by
// `fragment`, pruning containers only when this removal emptied them.
SettingsJson unmerge_settings(const SettingsJson& existing, const SettingsJson& fragment,
                              const std::string& token = kHookToken);

// True when merging `fragment` would leave `existing` unchanged
bool fragment_present(const SettingsJson& existing, const SettingsJson& fragment,
                      const std::string& token = kHookToken);

// True if any string inside value contains token
bool json_contains_token(const SettingsJson& value, const std::string& token);

// Host plugin shim (.js, .mjs, .ts) as opposed to the bridge executable
bool is_plugin_shim(const std::string& name);

// Two-space indented JSON with a trailing newline
std::string serialize_settings(const SettingsJson& doc);

// Fragment the target's governed settings file must carry for the deployed
// hook artifacts. Null when nothing needs registering.
SettingsJson governed_fragment(TargetKind target, const std::string& root,
                               const std::vector<std::string>& plugin_files);

} // namespace askills
