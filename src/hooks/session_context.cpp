#include "askills/hook_bridge.hpp"

#include "askills/frontmatter.hpp"
#include "askills/platform.hpp"
#include "askills/process.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace askills::hooks {

namespace {

std::optional<std::string> first_existing(const std::vector<std::string>& candidates) {
    for (const auto& c : candidates) {
        if (path_exists(c)) return c;
    }
    return std::nullopt;
}

std::vector<std::string> subdirectory_names(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& entry : list_directory(dir)) {
        if (is_directory(join_path(dir, entry))) names.push_back(entry);
    }
    return names;
}

std::vector<std::string> markdown_stems(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& entry : list_directory(dir)) {
        if (entry.size() > 3 && entry.compare(entry.size() - 3, 3, ".md") == 0 &&
            is_regular_file(join_path(dir, entry))) {
            names.push_back(entry.substr(0, entry.size() - 3));
        }
    }
    return names;
}

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

std::string roster_part(const char* label, const std::vector<std::string>& names) {
    if (names.empty()) return std::string(label) + ": none found";
    return std::string(label) + " (" + std::to_string(names.size()) + "): " + join_names(names);
}

void add_head_part(const std::string& directory, const std::string& file,
                   std::vector<std::string>& parts) {
    auto path = first_existing({join_path(directory, ".claude/" + file),
                                join_path(directory, ".opencode/" + file)});
    if (!path) return;
    if (auto head = read_head(*path)) parts.push_back(file + ": " + *head);
}

} // namespace

std::optional<GitSnapshot> probe_git(const std::string& directory) {
    auto branch = run_capture({"git", "branch", "--show-current"}, directory);
    if (!branch.ok || branch.exit_code != 0) {
        spdlog::debug("git branch unavailable in {}", directory);
        return std::nullopt;
    }

    auto status = run_capture({"git", "status", "--porcelain"}, directory);
    if (!status.ok || status.exit_code != 0) {
        spdlog::debug("git status unavailable in {}", directory);
        return std::nullopt;
    }

    GitSnapshot snapshot;
    snapshot.branch = trim(branch.output);

    std::istringstream lines(status.output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) snapshot.uncommitted_files++;
    }
    return snapshot;
}

std::optional<std::string> read_head(const std::string& path, std::size_t limit) {
    auto content = read_file(path);
    if (!content) return std::nullopt;

    std::string head = content->substr(0, limit);
    if (content->size() > limit) {
        // Drop a trailing partial UTF-8 sequence
        size_t end = head.size();
        size_t lead = end;
        while (lead > 0 && (static_cast<unsigned char>(head[lead - 1]) & 0xC0) == 0x80) --lead;
        if (lead > 0) {
            unsigned char c = static_cast<unsigned char>(head[lead - 1]);
            size_t expected = c >= 0xF0 ? 4 : c >= 0xE0 ? 3 : c >= 0xC0 ? 2 : 1;
            if (end - (lead - 1) < expected) head.resize(lead - 1);
        }
    }

    head = trim(head);
    if (head.empty()) return std::nullopt;
    return head;
}

std::string build_session_context(const std::string& directory, const std::string& date,
                                  const GitProbe& git) {
    std::vector<std::string> parts;
    parts.push_back("Date: " + date);

    if (git) {
        if (auto snapshot = git(directory)) {
            std::string branch = snapshot->branch.empty() ? "detached" : snapshot->branch;
            parts.push_back("Git: branch=" + branch +
                            ", uncommitted_files=" + std::to_string(snapshot->uncommitted_files));
        }
    }

    add_head_part(directory, "CONTEXT.md", parts);
    add_head_part(directory, "TODO.md", parts);

    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += '\n';
        out += p;
    }
    return trim(out);
}

std::string build_compact_context(const std::string& directory) {
    std::vector<std::string> skills;
    if (auto dir = first_existing({join_path(directory, ".opencode/skills"),
                                   join_path(directory, ".claude/skills")})) {
        skills = subdirectory_names(*dir);
    }

    std::vector<std::string> agents;
    if (auto dir = first_existing({join_path(directory, ".opencode/agents"),
                                   join_path(directory, ".claude/agents")})) {
        agents = markdown_stems(*dir);
    }

    return "CRITICAL CONTEXT TO PRESERVE AFTER COMPACTION:\n" + roster_part("Skills", skills) +
           "\n" + roster_part("Agents", agents) +
           "\nAlways use relevant skills for the task at hand.";
}

std::optional<std::string> session_id_of(const nlohmann::json& event) {
    if (!event.is_object()) return std::nullopt;

    auto non_empty = [](const nlohmann::json* v) -> std::optional<std::string> {
        if (v && v->is_string() && !v->get_ref<const std::string&>().empty()) {
            return v->get<std::string>();
        }
        return std::nullopt;
    };
    auto child = [](const nlohmann::json* v, const char* key) -> const nlohmann::json* {
        if (!v || !v->is_object()) return nullptr;
        auto it = v->find(key);
        return it == v->end() ? nullptr : &*it;
    };

    const nlohmann::json* properties = child(&event, "properties");
    if (auto id = non_empty(child(child(properties, "info"), "id"))) return id;
    if (auto id = non_empty(child(properties, "sessionID"))) return id;
    if (auto id = non_empty(child(child(&event, "session"), "id"))) return id;
    return non_empty(child(&event, "session_id"));
}

} // namespace askills::hooks
