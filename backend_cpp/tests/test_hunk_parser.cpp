#include <catch2/catch.hpp>
#include "patch/HunkParser.hpp"

using namespace repopatch;
using Catch::Matchers::Contains;

TEST_CASE("Counted hunk with context, removal and addition", "[hunk]") {
    ParsedPatch p = HunkParser::parse("@@ -3,3 +3,3 @@ int main()\n a\n-b\n+B\n c\n");
    REQUIRE(p.hunks.size() == 1);
    const Hunk& h = p.hunks[0];
    CHECK(h.old_start == std::optional<size_t>(3));
    CHECK(h.old_count == 3);
    CHECK(h.new_start == 3);
    CHECK(h.new_count == 3);
    REQUIRE(h.lines.size() == 4);
    CHECK(h.lines[0].kind == LineKind::Context);
    CHECK(h.lines[1].kind == LineKind::Remove);
    CHECK(h.lines[1].text == "b");
    CHECK(h.lines[2].kind == LineKind::Add);
    CHECK(h.lines[2].text == "B");
    CHECK(h.old_lines() == std::vector<std::string>{"a", "b", "c"});
    CHECK(h.new_lines() == std::vector<std::string>{"a", "B", "c"});
}

TEST_CASE("Omitted counts default to one", "[hunk]") {
    ParsedPatch p = HunkParser::parse("@@ -7 +7 @@\n-x\n+y\n");
    REQUIRE(p.hunks.size() == 1);
    CHECK(p.hunks[0].old_count == 1);
    CHECK(p.hunks[0].new_count == 1);
}

TEST_CASE("Several hunks in one body", "[hunk]") {
    ParsedPatch p = HunkParser::parse(
        "@@ -1,2 +1,2 @@\n"
        " a\n"
        "-b\n"
        "+c\n"
        "@@ -10,0 +11,2 @@\n"
        "+x\n"
        "+y\n");
    REQUIRE(p.hunks.size() == 2);
    CHECK(p.hunks[1].old_start == std::optional<size_t>(10));
    CHECK(p.hunks[1].old_count == 0);
    CHECK(p.hunks[1].old_lines().empty());
    CHECK(p.hunks[1].new_lines() == std::vector<std::string>{"x", "y"});
}

TEST_CASE("An empty line inside a hunk is empty context", "[hunk]") {
    ParsedPatch p = HunkParser::parse("@@ -1,3 +1,3 @@\n a\n\n-b\n+c\n");
    REQUIRE(p.hunks[0].lines.size() == 4);
    CHECK(p.hunks[0].lines[1].kind == LineKind::Context);
    CHECK(p.hunks[0].lines[1].text.empty());
}

TEST_CASE("Blank lines after a complete hunk are dropped", "[hunk]") {
    ParsedPatch p = HunkParser::parse("@@ -1 +1 @@\n-a\n+b\n\n\n");
    REQUIRE(p.hunks.size() == 1);
    CHECK(p.hunks[0].lines.size() == 2);
}

TEST_CASE("No-newline markers attach to the preceding side", "[hunk]") {
    SECTION("old side") {
        ParsedPatch p = HunkParser::parse("@@ -1 +1 @@\n-a\n\\ No newline at end of file\n+a\n");
        CHECK(p.hunks[0].old_no_newline);
        CHECK_FALSE(p.hunks[0].new_no_newline);
    }
    SECTION("new side") {
        ParsedPatch p = HunkParser::parse("@@ -1 +1 @@\n-a\n+a\n\\ No newline at end of file\n");
        CHECK_FALSE(p.hunks[0].old_no_newline);
        CHECK(p.hunks[0].new_no_newline);
    }
    SECTION("context line counts for both") {
        ParsedPatch p = HunkParser::parse("@@ -1,2 +1,2 @@\n-a\n+b\n z\n\\ No newline at end of file\n");
        CHECK(p.hunks[0].old_no_newline);
        CHECK(p.hunks[0].new_no_newline);
    }
}

TEST_CASE("A bare @@ header has no recorded position", "[hunk]") {
    ParsedPatch p = HunkParser::parse("@@\n keep\n-a\n+b\n");
    REQUIRE(p.hunks.size() == 1);
    CHECK_FALSE(p.hunks[0].old_start.has_value());
    CHECK(p.hunks[0].lines.size() == 3);
}

TEST_CASE("Extra hunk lines past the declared counts still belong to the hunk", "[hunk]") {
    ParsedPatch p = HunkParser::parse("@@ -1 +1 @@\n-a\n+b\n+c\n");
    CHECK(p.hunks[0].new_lines() == std::vector<std::string>{"b", "c"});
}

TEST_CASE("git metadata and mail signatures end a hunk", "[hunk]") {
    SECTION("extended header") {
        ParsedPatch p = HunkParser::parse("@@ -1 +1 @@\n-a\n+b\ndiff --git a/x b/x\nindex 1..2\n");
        REQUIRE(p.hunks.size() == 1);
        CHECK(p.hunks[0].lines.size() == 2);
    }
    SECTION("signature") {
        ParsedPatch p = HunkParser::parse("@@ -1 +1 @@\n-a\n+b\n-- \n2.39.0\n");
        REQUIRE(p.hunks.size() == 1);
        CHECK(p.hunks[0].lines.size() == 2);
    }
}

TEST_CASE("Parse errors name the problem", "[hunk]") {
    SECTION("malformed header") {
        CHECK_THROWS_WITH(HunkParser::parse("@@ -x +1 @@\n-a\n"), Contains("malformed hunk header"));
    }
    SECTION("unexpected line inside a counted hunk") {
        CHECK_THROWS_WITH(HunkParser::parse("@@ -1,2 +1,2 @@\n a\ngarbage\n"), Contains("unexpected line 3"));
    }
    SECTION("no hunks") {
        CHECK_THROWS_WITH(HunkParser::parse("not a diff\n"), Contains("no hunks found"));
    }
    SECTION("empty hunk") {
        CHECK_THROWS_WITH(HunkParser::parse("@@ -1 +1 @@\n@@ -2 +2 @@\n-a\n+b\n"), Contains("hunk #1 has no lines"));
    }
    SECTION("errors are PatchParseError") {
        CHECK_THROWS_AS(HunkParser::parse(""), PatchParseError);
    }
}

TEST_CASE("Error excerpts are bounded", "[hunk]") {
    std::string body = "prefix " + std::string(1000, 'q') + "\n";
    try {
        HunkParser::parse(body);
        FAIL("expected a parse error");
    } catch (const PatchParseError& e) {
        CHECK(std::string(e.what()).size() < 300);
    }
}
