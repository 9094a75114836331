#pragma once

#include "askills/manifest.hpp"

#include <optional>
#include <string>
#include <vector>

namespace askills {

// ============================================================================
// Doctor Checks
// ============================================================================

enum class CheckStatus {
    Pass,
    Fail,
    Warn
};

inline const char* check_status_to_string(CheckStatus s) {
    switch (s) {
        case CheckStatus::Pass: return "pass";
        case CheckStatus::Fail: return "fail";
        case CheckStatus::Warn: return "warn";
        default: return "fail";
    }
}

struct DoctorCheck {
    std::string name;
    CheckStatus status = CheckStatus::Pass;
    std::string detail;
};

struct CheckTally {
    size_t passed = 0;
    size_t failed = 0;
    size_t warned = 0;

    CheckTally& operator+=(const CheckTally& other) {
        passed += other.passed;
        failed += other.failed;
        warned += other.warned;
        return *this;
    }
};

// Result of one check: its findings and their counts
struct CheckGroup {
    std::vector<DoctorCheck> checks;
    CheckTally tally;

    void pass(const std::string& name, const std::string& detail = "");
    void fail(const std::string& name, const std::string& detail);
    void warn(const std::string& name, const std::string& detail);
};

struct DoctorReport {
    bool installed = false;
    std::string root;
    std::optional<Manifest> manifest;
    std::vector<DoctorCheck> checks;
    CheckTally tally;

    void add(CheckGroup group);
    bool healthy() const { return installed && tally.failed == 0; }
};

// Each recorded file exists
CheckGroup check_recorded_files(const std::string& root, const Manifest& manifest);

// No unrecorded manager-owned files in managed skill directories or the
// plugin directory
CheckGroup check_unrecorded_files(const std::string& root, const Manifest& manifest);

// No atomic-write leftovers under the root's managed directories
CheckGroup check_temp_artifacts(const std::string& root, const Manifest& manifest);

// Governed settings fragment is still merged
CheckGroup check_settings_fragment(const std::string& root, const Manifest& manifest);

// Recorded digests match disk; drift is a warning
CheckGroup check_checksums(const std::string& root, const Manifest& manifest);

} // namespace askills
