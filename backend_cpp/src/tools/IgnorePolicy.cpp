#include "tools/IgnorePolicy.hpp"
#include <fstream>
#include <cstring>
#include <spdlog/spdlog.h>

namespace repopatch {

namespace fs = std::filesystem;

// --- IgnoreRule ---

std::optional<IgnoreRule> IgnoreRule::parse(const std::string& line) {
    std::string s = line;
    if (!s.empty() && s.back() == '\r') s.pop_back();

    // Trailing spaces are insignificant unless escaped
    while (!s.empty() && s.back() == ' ' && !(s.size() >= 2 && s[s.size() - 2] == '\\')) {
        s.pop_back();
    }
    if (s.empty() || s[0] == '#') return std::nullopt;

    IgnoreRule rule;
    rule.pattern_ = s;

    if (s[0] == '!') {
        rule.negated_ = true;
        s.erase(0, 1);
    }
    if (!s.empty() && s.back() == '/') {
        rule.dir_only_ = true;
        s.pop_back();
    }
    if (s.empty()) return std::nullopt;

    // A slash anywhere but the end ties the pattern to the rule file's directory
    rule.anchored_ = s.find('/') != std::string::npos;
    if (s[0] == '/') s.erase(0, 1);
    if (s.empty()) return std::nullopt;

    std::string body = glob_to_regex(s);
    std::string full = rule.anchored_ ? body : "(?:.*/)?" + body;
    try {
        rule.regex_ = std::regex(full, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        spdlog::warn("Ignoring unusable ignore pattern '{}': {}", line, e.what());
        return std::nullopt;
    }
    return rule;
}

std::string IgnoreRule::glob_to_regex(const std::string& glob) {
    static const char* kRegexSpecial = ".^$+{}|()[]*?\\";
    std::string out;
    const size_t n = glob.size();

    for (size_t i = 0; i < n; ++i) {
        char c = glob[i];
        switch (c) {
            case '*':
                if (i + 1 < n && glob[i + 1] == '*') {
                    bool at_segment_start = (i == 0 || glob[i - 1] == '/');
                    if (at_segment_start && i + 2 < n && glob[i + 2] == '/') {
                        // "**/" : zero or more leading directories
                        out += "(?:.*/)?";
                        i += 2;
                    } else if (at_segment_start && i + 2 == n) {
                        // trailing "/**" : everything inside
                        out += ".*";
                        i += 1;
                    } else {
                        out += "[^/]*";
                        while (i + 1 < n && glob[i + 1] == '*') ++i;
                    }
                } else {
                    out += "[^/]*";
                }
                break;

            case '?':
                out += "[^/]";
                break;

            case '[': {
                size_t j = i + 1;
                if (j < n && (glob[j] == '!' || glob[j] == '^')) ++j;
                if (j < n && glob[j] == ']') ++j;
                while (j < n && glob[j] != ']') ++j;
                if (j >= n) {
                    out += "\\[";
                    break;
                }
                out += '[';
                size_t k = i + 1;
                if (glob[k] == '!' || glob[k] == '^') {
                    out += '^';
                    ++k;
                }
                for (; k < j; ++k) {
                    if (glob[k] == '\\' || glob[k] == '[' || glob[k] == ']') out += '\\';
                    out += glob[k];
                }
                out += ']';
                i = j;
                break;
            }

            case '\\':
                if (i + 1 < n) {
                    char next = glob[++i];
                    if (std::strchr(kRegexSpecial, next)) out += '\\';
                    out += next;
                } else {
                    out += "\\\\";
                }
                break;

            default:
                if (std::strchr(kRegexSpecial, c)) out += '\\';
                out += c;
                break;
        }
    }
    return out;
}

bool IgnoreRule::matches(const std::string& rel_path, bool is_dir) const {
    if (dir_only_ && !is_dir) return false;
    return std::regex_match(rel_path, regex_);
}

// --- IgnoreRuleSet ---

IgnoreRuleSet::IgnoreRuleSet(fs::path root) : root_(std::move(root)) {}

std::shared_ptr<const IgnoreRuleSet> IgnoreRuleSet::from_file(const fs::path& rule_file) {
    auto set = std::make_shared<IgnoreRuleSet>(rule_file.parent_path());

    std::ifstream f(rule_file);
    if (!f.is_open()) {
        spdlog::warn("⚠️ Could not open ignore file {}", rule_file.string());
        return set;
    }

    std::string line;
    while (std::getline(f, line)) {
        set->add_rule(line);
    }
    spdlog::debug("Loaded {} ignore rules from {}", set->size(), rule_file.string());
    return set;
}

void IgnoreRuleSet::add_rule(const std::string& line) {
    if (auto rule = IgnoreRule::parse(line)) {
        rules_.push_back(std::move(*rule));
    }
}

bool IgnoreRuleSet::is_ignored(const fs::path& path, bool is_dir) const {
    if (rules_.empty()) return false;

    fs::path rel = path.lexically_relative(root_);
    std::string rel_str;
    if (rel.empty() || *rel.begin() == "..") {
        // Outside this rule file's directory: only the name can be matched
        rel_str = path.filename().generic_string();
    } else {
        rel_str = rel.generic_string();
    }
    if (rel_str.empty() || rel_str == ".") return false;

    bool ignored = false;
    for (const auto& rule : rules_) {
        if (rule.matches(rel_str, is_dir)) {
            ignored = !rule.negated();
        }
    }
    return ignored;
}

// --- IgnorePolicy ---

IgnorePolicy::IgnorePolicy() : rules_(std::make_shared<IgnoreRuleSet>()) {}

IgnorePolicy::IgnorePolicy(std::shared_ptr<const IgnoreRuleSet> rules)
    : rules_(rules ? std::move(rules) : std::make_shared<IgnoreRuleSet>()) {}

IgnorePolicy IgnorePolicy::for_root(const fs::path& dir) {
    std::error_code ec;
    fs::path rule_file = dir / kRuleFileName;
    if (fs::is_regular_file(rule_file, ec)) {
        return IgnorePolicy(IgnoreRuleSet::from_file(rule_file));
    }
    return IgnorePolicy(std::make_shared<IgnoreRuleSet>(dir));
}

IgnorePolicy IgnorePolicy::descend(const fs::path& subdir) const {
    std::error_code ec;
    fs::path rule_file = subdir / kRuleFileName;
    if (fs::is_regular_file(rule_file, ec)) {
        return IgnorePolicy(IgnoreRuleSet::from_file(rule_file));
    }
    return *this;
}

bool IgnorePolicy::is_ignored(const fs::path& path, bool is_dir) const {
    return rules_->is_ignored(path, is_dir);
}

}
