#pragma once

#include <optional>
#include <string>
#include <vector>

namespace askills {

// ============================================================================
// Markdown Frontmatter
// ============================================================================
//
// Subset of YAML accepted in the leading `---` block of SKILL.md and agent
// files:
//
//   key: value            plain or quoted scalar
//   key: >  / >- / |      folded or literal block scalar (indented lines follow)
//   key:                  followed by indented `- item` lines (list)
//     continuation        indented line appended to a plain scalar
//
// Anything else inside the block is ignored.

struct FrontmatterField {
    std::string key;
    std::string value;
    std::vector<std::string> items;
    bool is_list = false;
};

struct FrontmatterDocument {
    bool has_frontmatter = false;
    std::vector<FrontmatterField> fields;  // Source order
    std::string body;                      // Everything after the closing marker

    const FrontmatterField* find(const std::string& key) const;
    std::optional<std::string> get(const std::string& key) const;
};

FrontmatterDocument parse_frontmatter(const std::string& content);

// Tool list from either a `- item` list or a comma separated scalar
std::vector<std::string> frontmatter_list(const FrontmatterDocument& doc,
                                          const std::string& key);

// Trim leading and trailing whitespace
std::string trim(const std::string& s);

// Collapse every whitespace run to a single space and trim
std::string fold_whitespace(const std::string& s);

// Double-quoted YAML scalar with `\` and `"` escaped
std::string yaml_quote(const std::string& s);

} // namespace askills
