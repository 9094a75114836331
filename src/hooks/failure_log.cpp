#include "askills/hook_bridge.hpp"

#include "askills/platform.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace askills::hooks {

std::string failure_log_path(const std::string& directory, const std::string& host_dir) {
    return join_path(join_path(directory, host_dir), "hooks/logs/tool_failures.jsonl");
}

void append_failure_log(const std::string& directory, const std::string& host_dir,
                        const nlohmann::json& event) noexcept {
    try {
        std::string path = failure_log_path(directory, host_dir);
        if (!create_directories(get_parent_directory(path))) {
            spdlog::debug("failure log directory unavailable: {}", path);
            return;
        }

        nlohmann::json entry;
        entry["timestamp"] = get_current_timestamp();
        entry["type"] = event.is_object() && event.contains("type") && event["type"].is_string()
                            ? event["type"]
                            : nlohmann::json("unknown");
        entry["properties"] = event.is_object() && event.contains("properties")
                                  ? event["properties"]
                                  : nlohmann::json(nullptr);

        std::ofstream out(path, std::ios::app | std::ios::binary);
        if (!out) {
            spdlog::debug("failure log not writable: {}", path);
            return;
        }
        out << entry.dump() << '\n';
    } catch (const std::exception& e) {
        spdlog::debug("failure log: {}", e.what());
    }
}

} // namespace askills::hooks
