#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace askills {

// ============================================================================
// Subprocess Capture
// ============================================================================

struct CaptureResult {
    bool ok = false;           // Process ran and was reaped
    int exit_code = -1;
    std::string output;        // Captured stdout
    std::string error;
};

/**
 * Run argv[0] (PATH lookup) in `cwd` and capture its stdout.
 * stdin is /dev/null and stderr is discarded. Output beyond `max_output`
 * bytes is read and dropped so the child never blocks on a full pipe.
 */
CaptureResult run_capture(const std::vector<std::string>& argv, const std::string& cwd,
                          size_t max_output = 1 << 20);

} // namespace askills
