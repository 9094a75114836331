#include "askills/frontmatter.hpp"

#include <algorithm>
#include <cctype>

namespace askills {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim_right(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && is_space(s[end - 1])) --end;
    return s.substr(0, end);
}

bool is_indented(const std::string& line) {
    return !line.empty() && (line[0] == ' ' || line[0] == '\t');
}

size_t indent_of(const std::string& line) {
    size_t n = 0;
    while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) ++n;
    return n;
}

bool is_list_item(const std::string& trimmed) {
    return trimmed == "-" || (trimmed.size() >= 2 && trimmed[0] == '-' && trimmed[1] == ' ');
}

bool is_block_indicator(const std::string& v) {
    return v == ">" || v == ">-" || v == ">+" || v == "|" || v == "|-" || v == "|+";
}

std::string strip_quotes(const std::string& v) {
    if (v.size() < 2) return v;

    if (v.front() == '"' && v.back() == '"') {
        std::string out;
        std::string inner = v.substr(1, v.size() - 2);
        for (size_t i = 0; i < inner.size(); ++i) {
            if (inner[i] == '\\' && i + 1 < inner.size()) {
                char next = inner[++i];
                switch (next) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    default: out += next; break;
                }
            } else {
                out += inner[i];
            }
        }
        return out;
    }

    if (v.front() == '\'' && v.back() == '\'') {
        std::string out;
        std::string inner = v.substr(1, v.size() - 2);
        for (size_t i = 0; i < inner.size(); ++i) {
            out += inner[i];
            if (inner[i] == '\'' && i + 1 < inner.size() && inner[i + 1] == '\'') ++i;
        }
        return out;
    }

    return v;
}

std::vector<std::string> split_flow_list(const std::string& v) {
    std::vector<std::string> items;
    std::string inner = v.substr(1, v.size() - 2);
    size_t start = 0;
    while (start <= inner.size()) {
        size_t comma = inner.find(',', start);
        std::string item = trim(inner.substr(start, comma == std::string::npos
                                                        ? std::string::npos
                                                        : comma - start));
        if (!item.empty()) items.push_back(strip_quotes(item));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return items;
}

std::string join_block(std::vector<std::string> block, bool literal) {
    while (!block.empty() && trim(block.back()).empty()) block.pop_back();

    size_t min_indent = std::string::npos;
    for (const auto& line : block) {
        if (trim(line).empty()) continue;
        min_indent = std::min(min_indent, indent_of(line));
    }
    if (min_indent == std::string::npos) min_indent = 0;

    std::string out;
    for (size_t i = 0; i < block.size(); ++i) {
        const auto& line = block[i];
        bool blank = trim(line).empty();
        if (literal) {
            if (i > 0) out += '\n';
            if (!blank) out += trim_right(line.substr(min_indent));
            continue;
        }
        // Folded: adjacent lines join with a space, blank lines become newlines
        if (blank) {
            out += '\n';
        } else {
            if (!out.empty() && out.back() != '\n') out += ' ';
            out += trim(line);
        }
    }
    return out;
}

} // namespace

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;
    return s.substr(start, end - start);
}

std::string fold_whitespace(const std::string& s) {
    std::string out;
    bool pending_space = false;
    for (char c : s) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

std::string yaml_quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    out += '"';
    return out;
}

const FrontmatterField* FrontmatterDocument::find(const std::string& key) const {
    // Duplicate keys: the last one wins
    for (auto it = fields.rbegin(); it != fields.rend(); ++it) {
        if (it->key == key) return &*it;
    }
    return nullptr;
}

std::optional<std::string> FrontmatterDocument::get(const std::string& key) const {
    const auto* field = find(key);
    if (!field || field->is_list) return std::nullopt;
    return field->value;
}

FrontmatterDocument parse_frontmatter(const std::string& content) {
    FrontmatterDocument doc;

    size_t pos = 0;
    if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) pos = 3;

    size_t first_nl = content.find('\n', pos);
    if (first_nl == std::string::npos ||
        trim_right(content.substr(pos, first_nl - pos)) != "---") {
        doc.body = content;
        return doc;
    }

    // Collect lines up to the closing marker
    std::vector<std::string> lines;
    size_t body_start = std::string::npos;
    size_t line_start = first_nl + 1;
    while (line_start <= content.size()) {
        size_t nl = content.find('\n', line_start);
        std::string line = content.substr(line_start, nl == std::string::npos
                                                          ? std::string::npos
                                                          : nl - line_start);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (trim_right(line) == "---") {
            body_start = nl == std::string::npos ? content.size() : nl + 1;
            break;
        }
        lines.push_back(line);
        if (nl == std::string::npos) break;
        line_start = nl + 1;
    }

    if (body_start == std::string::npos) {
        doc.body = content;
        return doc;
    }

    doc.has_frontmatter = true;
    doc.body = content.substr(body_start);

    size_t i = 0;
    while (i < lines.size()) {
        const std::string& line = lines[i];
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || is_indented(line)) {
            ++i;
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            ++i;
            continue;
        }

        FrontmatterField field;
        field.key = trim(line.substr(0, colon));
        std::string rest = trim(line.substr(colon + 1));
        ++i;

        if (is_block_indicator(rest)) {
            std::vector<std::string> block;
            while (i < lines.size() && (is_indented(lines[i]) || trim(lines[i]).empty())) {
                block.push_back(lines[i]);
                ++i;
            }
            field.value = join_block(block, rest[0] == '|');
        } else if (rest.empty()) {
            while (i < lines.size()) {
                std::string t = trim(lines[i]);
                if (is_list_item(t)) {
                    field.is_list = true;
                    field.items.push_back(strip_quotes(trim(t.substr(1))));
                } else if (!t.empty() && !is_indented(lines[i])) {
                    break;
                }
                ++i;
            }
        } else if (rest.front() == '[' && rest.back() == ']') {
            field.is_list = true;
            field.items = split_flow_list(rest);
        } else {
            std::string value = rest;
            while (i < lines.size() && is_indented(lines[i]) && !trim(lines[i]).empty()) {
                value += " " + trim(lines[i]);
                ++i;
            }
            field.value = strip_quotes(value);
        }

        if (!field.key.empty()) doc.fields.push_back(std::move(field));
    }

    return doc;
}

std::vector<std::string> frontmatter_list(const FrontmatterDocument& doc,
                                          const std::string& key) {
    std::vector<std::string> result;
    const auto* field = doc.find(key);
    if (!field) return result;

    if (field->is_list) {
        for (const auto& item : field->items) {
            if (!item.empty()) result.push_back(item);
        }
        return result;
    }

    size_t start = 0;
    const std::string& v = field->value;
    while (start <= v.size()) {
        size_t comma = v.find(',', start);
        std::string item = trim(v.substr(start, comma == std::string::npos
                                                    ? std::string::npos
                                                    : comma - start));
        if (!item.empty()) result.push_back(item);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return result;
}

} // namespace askills
