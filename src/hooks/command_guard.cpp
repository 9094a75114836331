#include "askills/command_guard.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>

namespace askills::hooks {

namespace {

constexpr int kMaxNesting = 8;

// Redirection markers never collide with shell words
const std::string kRedirectIn = "\x1f<";
const std::string kRedirectOut = "\x1f>";

const char* const kReadCommands[] = {
    "cat", "less", "more", "head", "tail", "source", ".",
    "bat", "nl", "tac", "strings", "xxd", "od",
};

const char* const kAllowedEnvSuffixes[] = {
    ".env.example", ".env.sample", ".env.template",
    ".env.test", ".env.development.local", ".env.local.example",
};

const char* const kDangerousTargets[] = {
    "/", "/*", "/.", "/..",
    "~", "~/*",
    ".", "./*", "..", "../*", ".*",
    "*",
    "$HOME", "${HOME}", "$HOME/*", "${HOME}/*",
};

const char* const kShells[] = {"sh", "bash", "zsh", "dash", "ksh", "fish"};

const char* const kDestructiveReason = "BLOCKED: Dangerous rm -rf pattern detected: ";
const char* const kSecretReason =
    "BLOCKED: Direct .env file access detected. Use environment variables instead.";

using Words = std::vector<std::string>;

struct SplitResult {
    std::vector<Words> commands;
    std::vector<std::string> nested;   // $(...), `...`, <(...) bodies
};

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string basename_of(const std::string& word) {
    auto slash = word.find_last_of('/');
    if (slash == std::string::npos || slash + 1 == word.size()) return word;
    return word.substr(slash + 1);
}

bool is_redirect(const std::string& w) {
    return w == kRedirectIn || w == kRedirectOut;
}

bool is_assignment(const std::string& w) {
    if (w.empty() || !(std::isalpha(static_cast<unsigned char>(w[0])) || w[0] == '_')) return false;
    for (size_t i = 1; i < w.size(); ++i) {
        char c = w[i];
        if (c == '=') return true;
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return false;
}

// Body of a $( ... ) or <( ... ) starting at `open` (the '('). Returns the
// index of the matching ')' or npos.
size_t find_closing_paren(const std::string& s, size_t open) {
    int depth = 0;
    char quote = 0;
    for (size_t i = open; i < s.size(); ++i) {
        char c = s[i];
        if (quote) {
            if (c == '\\' && quote == '"') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\\') {
            ++i;
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth == 0) return i;
        }
    }
    return std::string::npos;
}

SplitResult split_commands(const std::string& s) {
    SplitResult result;
    Words current;
    std::string word;
    bool in_word = false;

    auto flush_word = [&]() {
        if (in_word) current.push_back(word);
        word.clear();
        in_word = false;
    };
    auto flush_command = [&]() {
        flush_word();
        if (!current.empty()) result.commands.push_back(std::move(current));
        current.clear();
    };
    auto take_substitution = [&](size_t open) -> size_t {
        size_t close = find_closing_paren(s, open);
        size_t end = close == std::string::npos ? s.size() : close;
        result.nested.push_back(s.substr(open + 1, end - open - 1));
        return end;
    };

    const size_t n = s.size();
    for (size_t i = 0; i < n; ++i) {
        char c = s[i];

        if (c == '\\') {
            if (i + 1 < n && s[i + 1] != '\n') {
                word += s[i + 1];
                in_word = true;
            }
            ++i;
            continue;
        }

        if (c == '\'') {
            size_t close = s.find('\'', i + 1);
            size_t end = close == std::string::npos ? n : close;
            word += s.substr(i + 1, end - i - 1);
            in_word = true;
            i = end;
            continue;
        }

        if (c == '"') {
            in_word = true;
            size_t j = i + 1;
            for (; j < n && s[j] != '"'; ++j) {
                if (s[j] == '\\' && j + 1 < n) {
                    char next = s[j + 1];
                    if (next == '"' || next == '\\' || next == '$' || next == '`') {
                        word += next;
                        ++j;
                        continue;
                    }
                }
                if (s[j] == '$' && j + 1 < n && s[j + 1] == '(') {
                    j = take_substitution(j + 1);
                    word += "$()";
                    if (j >= n) break;
                    continue;
                }
                if (s[j] == '`') {
                    size_t close = s.find('`', j + 1);
                    size_t end = close == std::string::npos ? n : close;
                    result.nested.push_back(s.substr(j + 1, end - j - 1));
                    j = end;
                    if (j >= n) break;
                    continue;
                }
                word += s[j];
            }
            i = j;
            continue;
        }

        if (c == '$' && i + 1 < n && s[i + 1] == '(') {
            if (i + 2 < n && s[i + 2] == '(') {
                word += c;   // Arithmetic expansion
                in_word = true;
                continue;
            }
            i = take_substitution(i + 1);
            word += "$()";
            in_word = true;
            continue;
        }

        if (c == '`') {
            size_t close = s.find('`', i + 1);
            size_t end = close == std::string::npos ? n : close;
            result.nested.push_back(s.substr(i + 1, end - i - 1));
            i = end;
            continue;
        }

        if (c == '#' && !in_word) {
            while (i + 1 < n && s[i + 1] != '\n') ++i;
            continue;
        }

        if (c == ' ' || c == '\t' || c == '\r') {
            flush_word();
            continue;
        }

        if (c == '\n' || c == ';' || c == '&' || c == '|' || c == '(' || c == ')') {
            flush_command();
            continue;
        }

        if (c == '<' || c == '>') {
            // A numeric word directly before the operator is a file descriptor
            if (in_word && !word.empty() &&
                std::all_of(word.begin(), word.end(),
                            [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
                word.clear();
                in_word = false;
            }
            flush_word();

            if (i + 1 < n && s[i + 1] == '(') {
                i = take_substitution(i + 1);
                continue;
            }

            const std::string& marker = c == '<' ? kRedirectIn : kRedirectOut;
            while (i + 1 < n && (s[i + 1] == '<' || s[i + 1] == '>' || s[i + 1] == '&' ||
                                 s[i + 1] == '|')) {
                ++i;
            }
            current.push_back(marker);
            continue;
        }

        word += c;
        in_word = true;
    }
    flush_command();
    return result;
}

bool takes_argument(const std::string& command, const std::string& option) {
    static const std::set<std::string> sudo_opts = {"-u", "-g", "-C", "-D", "-h",
                                                    "-p", "-r", "-t", "-U"};
    static const std::set<std::string> env_opts = {"-u", "-C", "-S"};
    static const std::set<std::string> nice_opts = {"-n"};
    static const std::set<std::string> xargs_opts = {"-I", "-n", "-P", "-L", "-d",
                                                     "-E", "-s", "-a"};
    static const std::set<std::string> timeout_opts = {"-s", "-k"};

    if (command == "sudo" || command == "doas") return sudo_opts.count(option) > 0;
    if (command == "env") return env_opts.count(option) > 0;
    if (command == "nice" || command == "ionice") return nice_opts.count(option) > 0;
    if (command == "xargs") return xargs_opts.count(option) > 0;
    if (command == "timeout") return timeout_opts.count(option) > 0;
    return false;
}

// Index of the real command word after wrappers and assignments. Targets
// of input redirections placed before the command land in `inputs`.
size_t skip_prefixes(const Words& words, std::vector<std::string>& inputs) {
    static const std::set<std::string> wrappers = {
        "sudo", "doas", "env", "command", "builtin", "exec", "nohup", "time",
        "nice", "ionice", "stdbuf", "timeout", "xargs", "{", "!",
        "then", "do", "else", "if", "while", "until",
    };

    size_t i = 0;
    while (i < words.size()) {
        const std::string& w = words[i];
        if (is_redirect(w)) {
            if (w == kRedirectIn && i + 1 < words.size()) inputs.push_back(words[i + 1]);
            i += 2;
            continue;
        }
        if (is_assignment(w)) {
            ++i;
            continue;
        }

        std::string cmd = basename_of(w);
        if (!wrappers.count(cmd)) break;
        ++i;

        while (i < words.size() && words[i].size() > 1 && words[i][0] == '-') {
            bool with_arg = takes_argument(cmd, words[i]);
            ++i;
            if (with_arg) ++i;
        }
        if (cmd == "env") {
            while (i < words.size() && is_assignment(words[i])) ++i;
        }
        if (cmd == "timeout" && i < words.size()) ++i;   // Duration
    }
    return i;
}

std::string normalize_target(std::string target) {
    while (target.size() > 1 && target.back() == '/') target.pop_back();
    while (starts_with(target, "./") && target.size() > 2) target = target.substr(2);
    return target;
}

bool is_dangerous_target(const std::string& raw) {
    std::string target = normalize_target(raw);
    for (const char* t : kDangerousTargets) {
        if (target == t) return true;
    }
    return false;
}

bool rm_is_destructive(const Words& words, size_t cmd_index) {
    bool recursive = false;
    bool force = false;
    bool end_of_options = false;
    std::vector<std::string> operands;

    for (size_t j = cmd_index + 1; j < words.size(); ++j) {
        const std::string& w = words[j];
        if (is_redirect(w)) {
            ++j;
            continue;
        }
        if (!end_of_options && w == "--") {
            end_of_options = true;
            continue;
        }
        if (!end_of_options && starts_with(w, "--")) {
            if (w == "--recursive") recursive = true;
            if (w == "--force") force = true;
            if (w == "--no-preserve-root") return true;
            continue;
        }
        if (!end_of_options && w.size() > 1 && w[0] == '-') {
            for (size_t k = 1; k < w.size(); ++k) {
                if (w[k] == 'r' || w[k] == 'R') recursive = true;
                if (w[k] == 'f') force = true;
            }
            continue;
        }
        operands.push_back(w);
    }

    if (!recursive || !force) return false;
    return std::any_of(operands.begin(), operands.end(), is_dangerous_target);
}

bool reads_secret(const Words& words, size_t cmd_index) {
    std::string cmd = basename_of(words[cmd_index]);
    bool read_command = std::any_of(std::begin(kReadCommands), std::end(kReadCommands),
                                    [&](const char* r) { return cmd == r; });

    for (size_t j = cmd_index + 1; j < words.size(); ++j) {
        const std::string& w = words[j];
        if (w == kRedirectOut) {
            ++j;
            continue;
        }
        if (w == kRedirectIn) {
            if (j + 1 < words.size() && is_protected_env_name(basename_of(words[j + 1]))) {
                return true;
            }
            ++j;
            continue;
        }
        if (read_command && !(w.size() > 1 && w[0] == '-') &&
            is_protected_env_name(basename_of(w))) {
            return true;
        }
    }
    return false;
}

// Script argument of `su` / `runuser`: -c SCRIPT, --command SCRIPT,
// --command=SCRIPT or a short option cluster ending in c
std::optional<std::string> su_script(const Words& words, size_t cmd_index) {
    for (size_t j = cmd_index + 1; j < words.size(); ++j) {
        const std::string& w = words[j];
        if (starts_with(w, "--command=")) return w.substr(10);
        bool takes_script = w == "--command" ||
                            (w.size() > 1 && w[0] == '-' && w[1] != '-' && w.back() == 'c');
        if (takes_script) {
            if (j + 1 < words.size()) return words[j + 1];
            return std::nullopt;
        }
    }
    return std::nullopt;
}

struct Analysis {
    bool destructive = false;
    bool secret = false;
};

void analyze(const std::string& source, int depth, Analysis& out) {
    if (depth > kMaxNesting) return;

    SplitResult split = split_commands(source);
    for (const auto& nested : split.nested) analyze(nested, depth + 1, out);

    for (const auto& words : split.commands) {
        if (std::find(words.begin(), words.end(), "--no-preserve-root") != words.end()) {
            out.destructive = true;
        }

        std::vector<std::string> inputs;
        size_t i = skip_prefixes(words, inputs);
        for (const auto& target : inputs) {
            if (is_protected_env_name(basename_of(target))) out.secret = true;
        }
        if (i >= words.size()) continue;
        std::string cmd = basename_of(words[i]);

        if (cmd == "rm" && rm_is_destructive(words, i)) out.destructive = true;
        if (reads_secret(words, i)) out.secret = true;

        // Scripts handed to a shell or eval are commands too
        bool is_shell = std::any_of(std::begin(kShells), std::end(kShells),
                                    [&](const char* sh) { return cmd == sh; });
        if (is_shell) {
            for (size_t j = i + 1; j + 1 < words.size(); ++j) {
                const std::string& w = words[j];
                if (w.size() > 1 && w[0] == '-' && w[1] != '-' &&
                    w.find('c') != std::string::npos) {
                    analyze(words[j + 1], depth + 1, out);
                    break;
                }
            }
        } else if (cmd == "su" || cmd == "runuser") {
            if (auto script = su_script(words, i)) analyze(*script, depth + 1, out);
        } else if (cmd == "eval") {
            std::string script;
            for (size_t j = i + 1; j < words.size(); ++j) {
                if (!script.empty()) script += ' ';
                script += words[j];
            }
            analyze(script, depth + 1, out);
        }
    }
}

std::string shell_single_quote_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace

// ============================================================================
// Helpers
// ============================================================================

std::string normalize_command(const std::string& command) {
    std::string out;
    bool pending_space = false;
    for (char c : command) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

std::string block_command(const std::string& reason) {
    return "printf '%s\\n' '" + shell_single_quote_escape(reason) + "' >&2; exit 2";
}

bool is_protected_env_name(const std::string& filename) {
    for (const char* allowed : kAllowedEnvSuffixes) {
        if (ends_with(filename, allowed)) return false;
    }
    if (ends_with(filename, ".env")) return true;
    if (starts_with(filename, ".env.")) return true;
    // Globs that can expand to a dotenv file
    return starts_with(filename, ".env") && filename.size() > 4 &&
           (filename[4] == '*' || filename[4] == '?' || filename[4] == '[');
}

bool is_destructive_delete(const std::string& command) {
    Analysis a;
    analyze(command, 0, a);
    return a.destructive;
}

bool is_secret_file_read(const std::string& command) {
    Analysis a;
    analyze(command, 0, a);
    return a.secret;
}

std::optional<CommandSlot> extract_command(const nlohmann::json& args) {
    static const char* const keys[] = {"command", "cmd", "script"};

    auto find_in = [&](const nlohmann::json& obj,
                       const std::string& wrapper) -> std::optional<CommandSlot> {
        if (!obj.is_object()) return std::nullopt;
        for (const char* key : keys) {
            auto it = obj.find(key);
            if (it != obj.end() && it->is_string()) {
                return CommandSlot{wrapper, key, it->get<std::string>()};
            }
        }
        return std::nullopt;
    };

    if (auto slot = find_in(args, "")) return slot;
    for (const char* wrapper : {"input", "payload"}) {
        if (args.is_object() && args.contains(wrapper)) {
            if (auto slot = find_in(args[wrapper], wrapper)) return slot;
        }
    }
    return std::nullopt;
}

void set_command(nlohmann::json& args, const CommandSlot& slot, const std::string& command) {
    if (slot.wrapper.empty()) {
        args[slot.key] = command;
    } else {
        args[slot.wrapper][slot.key] = command;
    }
}

// ============================================================================
// CommandGuard
// ============================================================================

CommandGuard::CommandGuard() {
    auto flags = std::regex::ECMAScript | std::regex::icase;

    rules_.push_back({"rm-recursive-force-root",
                      std::regex(R"(rm\s+(-[a-zA-Z]*r[a-zA-Z]*f|--recursive\s+--force|-[a-zA-Z]*f[a-zA-Z]*r)[a-zA-Z]*\s+(/\s*$|/\*|~/?(\s|$)|\./?(\s|$)|\*(\s|$)))",
                                 flags),
                      RuleAction::Block, kDestructiveReason, GuardVerdict::DestructiveDelete});
    rules_.push_back({"rm-no-preserve-root", std::regex(R"(rm\s+.*--no-preserve-root)", flags),
                      RuleAction::Block, kDestructiveReason, GuardVerdict::DestructiveDelete});
    rules_.push_back({"dotenv-read",
                      std::regex(R"((cat|less|more|head|tail|source|\.)\s+[^\s]*\.env(\s|$))", flags),
                      RuleAction::Block, kSecretReason, GuardVerdict::SecretFileRead});

    allowed_env_ = std::regex(
        R"(\.env\.(example|sample|template|test|development\.local|local\.example)(\s|$))", flags);
}

std::optional<std::string> CommandGuard::match_rules(const std::string& normalized,
                                                     GuardVerdict verdict) const {
    for (const auto& rule : rules_) {
        if (rule.verdict != verdict) continue;
        if (!std::regex_search(normalized, rule.pattern)) continue;
        if (verdict == GuardVerdict::SecretFileRead && std::regex_search(normalized, allowed_env_)) {
            continue;
        }
        return rule.name;
    }
    return std::nullopt;
}

GuardDecision CommandGuard::evaluate(const std::string& command) const {
    GuardDecision decision;
    std::string normalized = normalize_command(command);
    if (normalized.empty()) return decision;

    Analysis analysis;
    analyze(command, 0, analysis);

    if (analysis.destructive) {
        decision.verdict = GuardVerdict::DestructiveDelete;
        decision.rule = "rm-analyser";
    } else if (auto rule = match_rules(normalized, GuardVerdict::DestructiveDelete)) {
        decision.verdict = GuardVerdict::DestructiveDelete;
        decision.rule = *rule;
    } else if (analysis.secret) {
        decision.verdict = GuardVerdict::SecretFileRead;
        decision.rule = "dotenv-analyser";
    } else if (auto rule = match_rules(normalized, GuardVerdict::SecretFileRead)) {
        decision.verdict = GuardVerdict::SecretFileRead;
        decision.rule = *rule;
    }

    if (decision.verdict == GuardVerdict::DestructiveDelete) {
        decision.reason = kDestructiveReason + normalized;
    } else if (decision.verdict == GuardVerdict::SecretFileRead) {
        decision.reason = kSecretReason;
    } else {
        return decision;
    }

    decision.rewritten = block_command(decision.reason);
    spdlog::debug("blocked by {}: {}", decision.rule, normalized);
    return decision;
}

GuardDecision CommandGuard::guard(const std::string& tool, nlohmann::json& args) const {
    std::string name = tool;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name != "bash" && name != "shell") return GuardDecision{};

    auto slot = extract_command(args);
    if (!slot) return GuardDecision{};

    GuardDecision decision = evaluate(slot->command);
    if (decision.blocked()) set_command(args, *slot, decision.rewritten);
    return decision;
}

} // namespace askills::hooks
