#include <catch2/catch.hpp>
#include "tools/IgnorePolicy.hpp"
#include "TestHelpers.hpp"

using namespace repopatch;
using repopatch::testing::TempDir;

namespace {

bool rule_matches(const std::string& pattern, const std::string& rel, bool is_dir = false) {
    auto rule = IgnoreRule::parse(pattern);
    REQUIRE(rule.has_value());
    return rule->matches(rel, is_dir);
}

}

TEST_CASE("Blank lines and comments are not rules", "[ignore]") {
    CHECK_FALSE(IgnoreRule::parse("").has_value());
    CHECK_FALSE(IgnoreRule::parse("   ").has_value());
    CHECK_FALSE(IgnoreRule::parse("# build output").has_value());
    CHECK_FALSE(IgnoreRule::parse("!").has_value());
}

TEST_CASE("Unanchored patterns match at any depth", "[ignore]") {
    CHECK(rule_matches("*.log", "debug.log"));
    CHECK(rule_matches("*.log", "logs/deep/debug.log"));
    CHECK_FALSE(rule_matches("*.log", "debug.log.txt"));
    CHECK(rule_matches("node_modules", "web/node_modules", true));
}

TEST_CASE("A slash anchors the pattern to the rule file directory", "[ignore]") {
    CHECK(rule_matches("/build", "build", true));
    CHECK_FALSE(rule_matches("/build", "src/build", true));
    CHECK(rule_matches("docs/*.md", "docs/readme.md"));
    CHECK_FALSE(rule_matches("docs/*.md", "sub/docs/readme.md"));
    CHECK_FALSE(rule_matches("docs/*.md", "docs/api/readme.md"));
}

TEST_CASE("Double star forms", "[ignore]") {
    CHECK(rule_matches("**/cache", "cache", true));
    CHECK(rule_matches("**/cache", "a/b/cache", true));
    CHECK(rule_matches("logs/**", "logs/a/b.txt"));
    CHECK(rule_matches("a/**/z", "a/z"));
    CHECK(rule_matches("a/**/z", "a/b/c/z"));
}

TEST_CASE("Directory-only patterns skip files", "[ignore]") {
    CHECK(rule_matches("out/", "out", true));
    CHECK_FALSE(rule_matches("out/", "out", false));
}

TEST_CASE("Character classes, wildcards and escapes", "[ignore]") {
    CHECK(rule_matches("file?.txt", "file1.txt"));
    CHECK_FALSE(rule_matches("file?.txt", "file10.txt"));
    CHECK(rule_matches("[abc].c", "b.c"));
    CHECK_FALSE(rule_matches("[!abc].c", "b.c"));
    CHECK(rule_matches("[!abc].c", "d.c"));
    CHECK(rule_matches("\\#notes", "#notes"));
    CHECK(rule_matches("a+b(1).txt", "a+b(1).txt"));
}

TEST_CASE("Last matching rule wins, negation re-includes", "[ignore]") {
    IgnoreRuleSet rules("/repo");
    rules.add_rule("*.log");
    rules.add_rule("!keep.log");

    CHECK(rules.is_ignored("/repo/debug.log", false));
    CHECK_FALSE(rules.is_ignored("/repo/keep.log", false));
    CHECK_FALSE(rules.is_ignored("/repo/main.c", false));
    CHECK(rules.size() == 2);
}

TEST_CASE("Paths outside the rule root match by name only", "[ignore]") {
    IgnoreRuleSet rules("/repo/sub");
    rules.add_rule("secret.txt");
    CHECK(rules.is_ignored("/elsewhere/secret.txt", false));
    CHECK_FALSE(rules.is_ignored("/elsewhere/public.txt", false));
}

TEST_CASE("A subdirectory rule file replaces the inherited rules", "[ignore]") {
    TempDir tmp;
    tmp.write(".gitignore", "*.tmp\n");
    tmp.write("sub/.gitignore", "*.bak\n");
    tmp.mkdir("plain");

    IgnorePolicy root = IgnorePolicy::for_root(tmp.path());
    CHECK(root.is_ignored(tmp.path() / "a.tmp", false));
    CHECK_FALSE(root.is_ignored(tmp.path() / "a.bak", false));

    IgnorePolicy sub = root.descend(tmp.path() / "sub");
    CHECK(sub.is_ignored(tmp.path() / "sub" / "a.bak", false));
    CHECK_FALSE(sub.is_ignored(tmp.path() / "sub" / "a.tmp", false));

    IgnorePolicy plain = root.descend(tmp.path() / "plain");
    CHECK(plain.is_ignored(tmp.path() / "plain" / "a.tmp", false));
}

TEST_CASE("A root without a rule file ignores nothing", "[ignore]") {
    TempDir tmp;
    IgnorePolicy policy = IgnorePolicy::for_root(tmp.path());
    CHECK(policy.rules().empty());
    CHECK_FALSE(policy.is_ignored(tmp.path() / "anything", false));
}
