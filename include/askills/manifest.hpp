#pragma once

#include "askills/result.hpp"
#include "askills/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace askills {

// ============================================================================
// Install Manifest
// ============================================================================
//
// Persisted at <root>/.agentic-skills.manifest. Records exactly which files
// and settings entries the manager placed under a target root.

constexpr const char* kManifestFileName = ".agentic-skills.manifest";

struct SettingsRecord {
    std::string path;          // Relative to the target root
    bool created = false;      // True if the manager created the file
};

struct Manifest {
    std::string version;
    std::string installed_at;
    std::string source;
    TargetKind target = TargetKind::Claude;
    std::string target_path;
    Scope scope = Scope::Full;

    std::vector<std::string> skills;        // Sorted, unique
    std::vector<std::string> agents;        // Sorted, unique
    bool hooks = false;
    std::vector<std::string> plugin_files;  // Sorted, unique

    std::vector<std::string> files;         // Every deployed file, sorted
    std::map<std::string, std::string> checksums;   // rel path -> sha256:<hex>
    std::optional<SettingsRecord> settings;
};

struct ManifestParseResult {
    bool ok = false;
    bool is_critical_error = false;
    std::string error;
    Manifest manifest;
    std::vector<std::string> warnings;
};

ManifestParseResult parse_manifest(const std::string& json_str,
                                   const std::string& source_path = "");

// Stable serialization: same manifest, same bytes
std::string serialize_manifest(const Manifest& manifest);

std::string manifest_path(const std::string& root);

// NOT_INSTALLED when absent, MANIFEST_INVALID when unparseable
Result<Manifest> read_manifest(const std::string& root);

// Atomic write. Returns false (without writing) when the file already holds
// the same serialization.
Result<bool> write_manifest(const std::string& root, const Manifest& manifest);

Result<void> remove_manifest(const std::string& root);

// ============================================================================
// Diff
// ============================================================================

struct ManifestDiff {
    std::vector<std::string> to_add;
    std::vector<std::string> to_remove;
};

// Over deployed file sets. A missing old manifest means everything is added.
ManifestDiff diff_manifests(const std::optional<Manifest>& old_manifest, const Manifest& next);

// Sort and deduplicate in place
void normalize_set(std::vector<std::string>& values);

} // namespace askills
