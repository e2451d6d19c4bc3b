#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <regex>
#include <filesystem>

namespace repopatch {

/**
 * One gitignore line compiled to a regex.
 *
 * Supported syntax: `*`, `?`, `[...]`, `**` (leading, trailing and middle),
 * `!negation`, `dir/` (directory only), anchoring by a leading or inner `/`,
 * `#` comments and backslash escapes.
 */
class IgnoreRule {
public:
    // std::nullopt for blank lines, comments and patterns that fail to compile
    static std::optional<IgnoreRule> parse(const std::string& line);

    // `rel_path` uses '/' separators and is relative to the rule file's directory
    bool matches(const std::string& rel_path, bool is_dir) const;

    bool negated() const { return negated_; }
    bool directory_only() const { return dir_only_; }
    const std::string& pattern() const { return pattern_; }

private:
    IgnoreRule() = default;

    static std::string glob_to_regex(const std::string& glob);

    std::string pattern_;
    bool negated_ = false;
    bool dir_only_ = false;
    bool anchored_ = false;
    std::regex regex_;
};

// Ordered rules of a single rule file; the last matching rule decides.
class IgnoreRuleSet {
public:
    IgnoreRuleSet() = default;
    explicit IgnoreRuleSet(std::filesystem::path root);

    // Reads `rule_file`; its parent directory becomes the matching root.
    static std::shared_ptr<const IgnoreRuleSet> from_file(const std::filesystem::path& rule_file);

    void add_rule(const std::string& line);
    bool is_ignored(const std::filesystem::path& path, bool is_dir) const;

    const std::filesystem::path& root() const { return root_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

private:
    std::filesystem::path root_;
    std::vector<IgnoreRule> rules_;
};

// Rule set in force for one directory of a walk. A directory with its own
// rule file uses only that file; one without inherits its parent's set as is.
class IgnorePolicy {
public:
    static constexpr const char* kRuleFileName = ".gitignore";

    IgnorePolicy();
    explicit IgnorePolicy(std::shared_ptr<const IgnoreRuleSet> rules);

    // Policy for the walk root: its own rule file, or no rules at all.
    static IgnorePolicy for_root(const std::filesystem::path& dir);

    IgnorePolicy descend(const std::filesystem::path& subdir) const;

    bool is_ignored(const std::filesystem::path& path, bool is_dir) const;

    const IgnoreRuleSet& rules() const { return *rules_; }

private:
    std::shared_ptr<const IgnoreRuleSet> rules_;
};

}
