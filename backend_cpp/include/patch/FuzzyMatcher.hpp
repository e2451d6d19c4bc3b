#pragma once
#include <string>
#include <vector>
#include "patch/PatchTypes.hpp"
#include "patch/TextDocument.hpp"

namespace repopatch {

struct FuzzOptions {
    size_t max_offset = 1000;      // lines searched on each side of the nominal position
    size_t max_fuzz = 2;           // context lines that may be ignored at each hunk edge
    double min_similarity = 0.75;  // share of context lines that must match in the last pass
};

enum class MatchKind {
    NotFound,
    Exact,
    Whitespace,       // trailing whitespace differs
    Fuzz,             // outer context lines ignored
    Similar,          // context similarity above threshold
    AlreadyApplied    // the hunk's result is already there
};

struct HunkPlacement {
    MatchKind kind = MatchKind::NotFound;
    size_t position = 0;   // first line of the matched span in the original document
    long offset = 0;       // distance from the nominal position
    size_t fuzz = 0;
    double similarity = 0.0;

    bool applied() const {
        return kind != MatchKind::NotFound && kind != MatchKind::AlreadyApplied;
    }
    bool already_applied() const { return kind == MatchKind::AlreadyApplied; }
};

struct ApplyResult {
    TextDocument document;
    std::vector<HunkPlacement> hunks;

    // Every hunk placed and changed
    bool all_applied() const;
    // Every hunk found already in place: nothing to do
    bool all_already_applied() const;
    size_t applied_count() const;
    std::vector<size_t> failed_hunks() const;   // 1-based
    std::vector<size_t> skipped_hunks() const;  // 1-based, already applied
};

/**
 * Offset-tolerant hunk placement.
 *
 * Each hunk is searched near its recorded line, adjusted by how far earlier
 * hunks had to move. Passes, in order: exact match, already-applied check,
 * trailing-whitespace tolerant match, fuzz (ignore outer context lines) and
 * finally context similarity with exact removal lines. Hunks never overlap
 * and keep their order.
 */
class FuzzyMatcher {
public:
    explicit FuzzyMatcher(FuzzOptions options = {});

    ApplyResult apply(const TextDocument& original, const ParsedPatch& patch) const;

    const FuzzOptions& options() const { return options_; }

private:
    FuzzOptions options_;
};

std::string to_string(MatchKind kind);

}
