#pragma once
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

namespace repopatch {

// Creation / deletion sentinel on either side of a file header
constexpr const char* kDevNull = "/dev/null";

// One file section of a combined patch, paths exactly as written in the headers
struct FilePatchRecord {
    std::string old_path;
    std::string new_path;
    std::string hunk_text;
};

enum class LineKind { Context, Remove, Add };

struct HunkLine {
    LineKind kind;
    std::string text;
};

struct Hunk {
    // 1-based, as declared in "@@ -a,b +c,d @@"; nullopt for a bare "@@" header
    std::optional<size_t> old_start;
    size_t old_count = 1;
    size_t new_start = 0;
    size_t new_count = 1;

    std::vector<HunkLine> lines;
    bool old_no_newline = false;
    bool new_no_newline = false;

    std::vector<std::string> old_lines() const {
        std::vector<std::string> out;
        for (const auto& l : lines)
            if (l.kind != LineKind::Add) out.push_back(l.text);
        return out;
    }

    std::vector<std::string> new_lines() const {
        std::vector<std::string> out;
        for (const auto& l : lines)
            if (l.kind != LineKind::Remove) out.push_back(l.text);
        return out;
    }
};

struct ParsedPatch {
    std::vector<Hunk> hunks;
};

class PatchParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
