#pragma once

#include "askills/adapter.hpp"
#include "askills/bundle.hpp"
#include "askills/doctor.hpp"
#include "askills/manifest.hpp"
#include "askills/result.hpp"
#include "askills/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace askills {

// ============================================================================
// Confirmation
// ============================================================================

class Confirmer {
public:
    virtual ~Confirmer() = default;

    /// True when a human can answer prompts
    virtual bool interactive() const = 0;

    virtual bool confirm(const std::string& question, bool default_yes) = 0;
};

/// Prompts on stderr and reads the answer from stdin
class TerminalConfirmer : public Confirmer {
public:
    bool interactive() const override;
    bool confirm(const std::string& question, bool default_yes) override;
};

// ============================================================================
// Requests and Reports
// ============================================================================

struct InstallRequest {
    std::string bundle_root;
    std::string root;
    TargetKind target = TargetKind::Claude;
    Scope scope = Scope::Full;
    bool force = false;
    bool dry_run = false;
};

struct UpdateRequest {
    std::string bundle_root;   // Empty: the source recorded in the manifest
    std::string root;
    bool force = false;
    bool dry_run = false;
};

struct SelfUpdateRequest {
    std::string source;
    std::string root;
    bool yes = false;
    bool force = false;
};

enum class FileAction {
    Write,
    Unchanged,
    Remove
};

inline const char* file_action_to_string(FileAction a) {
    switch (a) {
        case FileAction::Write: return "write";
        case FileAction::Unchanged: return "unchanged";
        case FileAction::Remove: return "remove";
        default: return "write";
    }
}

struct PlannedAction {
    FileAction action = FileAction::Write;
    std::string rel_path;
};

struct OperationReport {
    std::string root;
    Manifest manifest;
    bool dry_run = false;

    std::vector<PlannedAction> actions;
    size_t written = 0;
    size_t unchanged = 0;
    size_t removed = 0;
    bool settings_changed = false;
    bool manifest_written = false;

    std::vector<SchemaViolation> violations;
    std::vector<std::string> warnings;

    bool has_failures() const { return !violations.empty(); }
};

struct UninstallReport {
    std::string root;
    size_t removed = 0;
    std::vector<std::string> missing;      // Recorded but already gone
    bool settings_changed = false;
    bool settings_removed = false;
    std::vector<std::string> warnings;
};

struct StatusReport {
    bool installed = false;
    std::string root;
    Manifest manifest;
};

// ============================================================================
// Orchestrator
// ============================================================================

/**
 * @brief Install lifecycle for one target root
 *
 * Every operation validates before it writes. Writes go through
 * atomic_write_file and the manifest is always written last.
 */
class Orchestrator {
public:
    explicit Orchestrator(Confirmer& confirmer) : confirmer_(confirmer) {}

    /// Absent -> Installed (behaves like update when already installed)
    Result<OperationReport> install(const InstallRequest& request);

    /// Re-deploy the recorded scope from the current bundle
    Result<OperationReport> update(const UpdateRequest& request);

    /// update from an explicit source, after confirmation
    Result<OperationReport> selfUpdate(const SelfUpdateRequest& request);

    /// Installed -> Absent
    Result<UninstallReport> uninstall(const std::string& root, bool force);

    /// Read-only consistency checks
    DoctorReport doctor(const std::string& root) const;

    /// Read-only summary; installed=false when there is no manifest
    Result<StatusReport> status(const std::string& root) const;

    static const char* version();

private:
    Result<OperationReport> apply(const SourceBundle& bundle, TargetKind target, Scope scope,
                                  const std::string& root, const std::optional<Manifest>& prior,
                                  bool force, bool dry_run);

    Confirmer& confirmer_;
};

// Target roots below `base` (default layouts) that carry a manifest
std::vector<std::string> discover_installations(const std::string& base);

// Files under the roots recorded by a manifest written without a file list
std::vector<std::string> expand_legacy_files(const std::string& root, const Manifest& manifest);

} // namespace askills
