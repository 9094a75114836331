/**
 * agentic-skills CLI - Common utilities and types
 */

#pragma once

#include <askills/orchestrator.hpp>
#include <askills/platform.hpp>
#include <askills/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace askills::cli {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitNotInstalled = 3;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string bundle;            // --bundle
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library diagnostics to stderr; stdout carries command output.
 */
inline void init_logging(const GlobalOptions& opts) {
    if (!spdlog::get("agentic-skills")) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("agentic-skills"));
    }
    spdlog::set_pattern("%^%l%$: %v");
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Resolve the bundle directory.
 * Priority: --bundle flag > AGENTIC_SKILLS_BUNDLE env > manifest source > built-in default
 */
inline std::string resolve_bundle_root(const std::string& flag,
                                       const std::optional<std::string>& manifest_source = std::nullopt) {
    // 1. Explicit override
    if (!flag.empty()) return flag;

    // 2. Environment variable
    auto env_bundle = get_env("AGENTIC_SKILLS_BUNDLE");
    if (env_bundle && !env_bundle->empty()) return *env_bundle;

    // 3. Recorded at install time
    if (manifest_source && !manifest_source->empty()) return *manifest_source;

    // 4. Default
    return ASKILLS_DEFAULT_BUNDLE_DIR;
}

/**
 * Resolve the target root of an existing installation.
 * Without --path, look for a single installation below the working directory.
 */
inline Result<std::string> resolve_installed_root(const std::string& path_flag) {
    if (!path_flag.empty()) {
        // Accept the manifest file itself as well as its directory
        if (get_filename(path_flag) == kManifestFileName) {
            std::string parent = get_parent_directory(path_flag);
            return Result<std::string>::ok(parent.empty() ? "." : parent);
        }
        return Result<std::string>::ok(path_flag);
    }

    auto roots = discover_installations(".");
    if (roots.empty()) {
        return Result<std::string>::err(
            Error(ErrorCode::NOT_INSTALLED, "no installation found; pass --path"));
    }
    if (roots.size() > 1) {
        std::string list;
        for (const auto& r : roots) list += "\n  " + r;
        return Result<std::string>::err(Error(
            ErrorCode::INVALID_ARGUMENT, "multiple installations found; pass --path:" + list));
    }
    return Result<std::string>::ok(roots.front());
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode, const char* code = nullptr) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (code) j["code"] = code;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode) {
    print_error(error.message(), json_mode, error_code_to_string(error.code()));
}

inline void print_warning(const std::string& msg, bool /* json_mode */) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

inline int exit_code_for(const Error& error) {
    return error.code() == ErrorCode::NOT_INSTALLED ? kExitNotInstalled : kExitFailure;
}

inline std::string join(const std::vector<std::string>& values, const std::string& sep = ", ") {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) out += sep;
        out += v;
    }
    return out;
}

/**
 * Print the outcome of install / update / self-update.
 * Returns the process exit code (non-zero when units failed to convert).
 */
inline int report_operation(const std::string& verb, const OperationReport& report,
                            const GlobalOptions& opts) {
    for (const auto& w : report.warnings) print_warning(w, opts.json);
    for (const auto& v : report.violations) print_warning("skipped " + v.toString(), opts.json);

    const Manifest& m = report.manifest;
    int code = report.has_failures() ? kExitFailure : kExitOk;

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = code == kExitOk;
        j["dry_run"] = report.dry_run;
        j["target"] = target_to_string(m.target);
        j["path"] = report.root;
        j["scope"] = scope_to_string(m.scope);
        j["skills"] = m.skills;
        j["agents"] = m.agents;
        j["hooks"] = m.hooks;
        j["written"] = report.written;
        j["unchanged"] = report.unchanged;
        j["removed"] = report.removed;
        j["settings_changed"] = report.settings_changed;
        j["manifest_written"] = report.manifest_written;

        nlohmann::json actions = nlohmann::json::array();
        for (const auto& a : report.actions) {
            actions.push_back({{"action", file_action_to_string(a.action)}, {"path", a.rel_path}});
        }
        j["actions"] = actions;

        nlohmann::json failures = nlohmann::json::array();
        for (const auto& v : report.violations) {
            failures.push_back({{"unit", v.unit}, {"constraint", v.constraint}});
        }
        j["failures"] = failures;
        output_json(j);
        return code;
    }

    if (report.dry_run) {
        std::cout << "Plan for " << report.root << " (" << target_to_string(m.target) << ", "
                  << scope_to_string(m.scope) << "):" << std::endl;
        for (const auto& a : report.actions) {
            std::cout << "  " << file_action_to_string(a.action) << "  " << a.rel_path << std::endl;
        }
        return code;
    }

    if (!opts.quiet) {
        std::cout << verb << " " << target_to_string(m.target) << " at " << report.root
                  << std::endl;
        std::cout << "  Skills: " << m.skills.size() << "  Agents: " << m.agents.size()
                  << "  Hooks: " << (m.hooks ? "yes" : "no") << std::endl;
        std::cout << "  Files: " << report.written << " written, " << report.unchanged
                  << " unchanged, " << report.removed << " removed" << std::endl;
        if (report.settings_changed && m.settings) {
            std::cout << "  Settings: updated " << m.settings->path << std::endl;
        }
    }
    if (report.has_failures()) {
        print_error(std::to_string(report.violations.size()) + " unit(s) failed to convert",
                    opts.json);
    }
    return code;
}

} // namespace askills::cli
