#include "patch/HunkParser.hpp"
#include "patch/TextDocument.hpp"
#include "utils/Scrubber.hpp"
#include <regex>
#include <optional>
#include <spdlog/spdlog.h>

namespace repopatch {

namespace {

const std::regex kHunkHeader(R"(^@@+ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@+.*$)");

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool is_git_extended_header(const std::string& line) {
    static const char* kPrefixes[] = {
        "diff ", "index ", "new file mode", "deleted file mode", "old mode", "new mode",
        "similarity index", "dissimilarity index", "rename ", "copy ", "Binary files"
    };
    for (const char* p : kPrefixes) {
        if (starts_with(line, p)) return true;
    }
    return false;
}

struct OpenHunk {
    Hunk hunk;
    size_t number = 0;
    bool counted = true;
    size_t seen_old = 0;
    size_t seen_new = 0;
    size_t pending_blanks = 0;

    bool counts_met() const {
        return counted && seen_old >= hunk.old_count && seen_new >= hunk.new_count;
    }

    void add(LineKind kind, std::string text) {
        if (kind != LineKind::Add) ++seen_old;
        if (kind != LineKind::Remove) ++seen_new;
        hunk.lines.push_back(HunkLine{kind, std::move(text)});
    }

    void flush_blanks() {
        for (; pending_blanks > 0; --pending_blanks) add(LineKind::Context, "");
    }
};

size_t parse_number(const std::ssub_match& m, size_t fallback, const std::string& line) {
    if (!m.matched) return fallback;
    try {
        return std::stoul(m.str());
    } catch (const std::exception&) {
        throw PatchParseError("hunk header number out of range: '" + scrub_snippet(line) + "'");
    }
}

}

ParsedPatch HunkParser::parse(const std::string& body) {
    ParsedPatch patch;
    std::optional<OpenHunk> open;
    bool skipping = false;  // between the end of a hunk and the next header

    auto close = [&]() {
        if (!open) return;
        if (open->hunk.lines.empty()) {
            throw PatchParseError("hunk #" + std::to_string(open->number) + " has no lines");
        }
        if (open->counted && (open->seen_old != open->hunk.old_count || open->seen_new != open->hunk.new_count)) {
            spdlog::debug("Hunk #{} declares -{} +{} lines but has -{} +{}", open->number,
                          open->hunk.old_count, open->hunk.new_count, open->seen_old, open->seen_new);
        }
        patch.hunks.push_back(std::move(open->hunk));
        open.reset();
    };

    const std::vector<std::string> lines = split_patch_lines(body);
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];

        // 1. Hunk header
        if (starts_with(line, "@@")) {
            close();
            skipping = false;

            OpenHunk next;
            next.number = patch.hunks.size() + 1;
            std::smatch m;
            if (std::regex_match(line, m, kHunkHeader)) {
                next.hunk.old_start = parse_number(m[1], 0, line);
                next.hunk.old_count = parse_number(m[2], 1, line);
                next.hunk.new_start = parse_number(m[3], 0, line);
                next.hunk.new_count = parse_number(m[4], 1, line);
            } else if (line.find(" -") != std::string::npos && line.find(" +") != std::string::npos) {
                throw PatchParseError("malformed hunk header: '" + scrub_snippet(line) + "'");
            } else {
                // Bare "@@": location unknown, size unknown
                next.counted = false;
            }
            open = std::move(next);
            continue;
        }

        // 2. git metadata between sections
        if (is_git_extended_header(line)) {
            close();
            skipping = true;
            continue;
        }

        if (!open || skipping) continue;

        const bool lenient = !open->counted || open->counts_met();

        // 3. Blank lines: held back once the hunk is complete
        if (line.empty()) {
            if (lenient) {
                ++open->pending_blanks;
            } else {
                open->add(LineKind::Context, "");
            }
            continue;
        }

        // 4. Regular hunk lines
        const char marker = line[0];
        if (marker == '\\') {
            if (!open->hunk.lines.empty()) {
                LineKind last = open->hunk.lines.back().kind;
                if (last != LineKind::Add) open->hunk.old_no_newline = true;
                if (last != LineKind::Remove) open->hunk.new_no_newline = true;
            }
            continue;
        }

        if (marker == ' ' || marker == '-' || marker == '+') {
            // "-- " after a complete hunk is a mail signature separator
            if (open->counts_met() && line == "-- ") {
                close();
                skipping = true;
                continue;
            }
            open->flush_blanks();
            LineKind kind = marker == ' ' ? LineKind::Context
                          : marker == '-' ? LineKind::Remove
                                          : LineKind::Add;
            open->add(kind, line.substr(1));
            continue;
        }

        if (lenient) {
            close();
            skipping = true;
            continue;
        }

        throw PatchParseError("unexpected line " + std::to_string(i + 1) + " in hunk #" +
                              std::to_string(open->number) + ": '" + scrub_snippet(line) + "'");
    }
    close();

    if (patch.hunks.empty()) {
        throw PatchParseError("no hunks found in patch body: '" + scrub_snippet(body) + "'");
    }
    return patch;
}

}
