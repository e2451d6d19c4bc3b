#include "patch/FuzzyMatcher.hpp"
#include <algorithm>
#include <optional>
#include <spdlog/spdlog.h>

namespace repopatch {

namespace {

using LineEq = bool (*)(const std::string&, const std::string&);

bool span_matches(const std::vector<std::string>& doc, size_t pos,
                  const std::vector<std::string>& lines, size_t from, size_t to, LineEq eq) {
    for (size_t k = from; k < to; ++k) {
        if (!eq(doc[pos + k], lines[k])) return false;
    }
    return true;
}

// Visits candidate starts nominal, +1, -1, +2, -2 ... within [lower, upper].
// Stops at the first start the predicate accepts.
template <typename Pred>
std::optional<size_t> search_window(size_t nominal, size_t lower, size_t upper,
                                    size_t max_offset, Pred accept) {
    if (lower > upper) return std::nullopt;
    for (size_t d = 0; d <= max_offset; ++d) {
        bool in_range = false;

        size_t up = nominal + d;
        if (up >= lower && up <= upper) {
            in_range = true;
            if (accept(up)) return up;
        }
        if (d > 0 && nominal >= d) {
            size_t down = nominal - d;
            if (down >= lower && down <= upper) {
                in_range = true;
                if (accept(down)) return down;
            }
        }
        if (!in_range && up > upper && (nominal < d || nominal - d < lower)) break;
    }
    return std::nullopt;
}

size_t leading_context(const Hunk& hunk) {
    size_t n = 0;
    for (const auto& l : hunk.lines) {
        if (l.kind != LineKind::Context) break;
        ++n;
    }
    return n;
}

size_t trailing_context(const Hunk& hunk) {
    size_t n = 0;
    for (auto it = hunk.lines.rbegin(); it != hunk.lines.rend(); ++it) {
        if (it->kind != LineKind::Context) break;
        ++n;
    }
    return n;
}

}

std::string to_string(MatchKind kind) {
    switch (kind) {
        case MatchKind::NotFound: return "not found";
        case MatchKind::Exact: return "exact";
        case MatchKind::Whitespace: return "whitespace";
        case MatchKind::Fuzz: return "fuzz";
        case MatchKind::Similar: return "similar";
        case MatchKind::AlreadyApplied: return "already applied";
    }
    return "unknown";
}

// --- ApplyResult ---

bool ApplyResult::all_applied() const {
    return !hunks.empty() &&
           std::all_of(hunks.begin(), hunks.end(), [](const HunkPlacement& h) { return h.applied(); });
}

bool ApplyResult::all_already_applied() const {
    return !hunks.empty() &&
           std::all_of(hunks.begin(), hunks.end(), [](const HunkPlacement& h) { return h.already_applied(); });
}

size_t ApplyResult::applied_count() const {
    return std::count_if(hunks.begin(), hunks.end(), [](const HunkPlacement& h) { return h.applied(); });
}

std::vector<size_t> ApplyResult::failed_hunks() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < hunks.size(); ++i)
        if (hunks[i].kind == MatchKind::NotFound) out.push_back(i + 1);
    return out;
}

std::vector<size_t> ApplyResult::skipped_hunks() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < hunks.size(); ++i)
        if (hunks[i].already_applied()) out.push_back(i + 1);
    return out;
}

// --- FuzzyMatcher ---

FuzzyMatcher::FuzzyMatcher(FuzzOptions options) : options_(options) {}

ApplyResult FuzzyMatcher::apply(const TextDocument& original, const ParsedPatch& patch) const {
    const std::vector<std::string>& doc = original.lines;
    ApplyResult result;
    result.hunks.resize(patch.hunks.size());

    size_t lower = 0;   // hunks may not start before the end of the previous one
    long drift = 0;     // how far earlier hunks moved from their recorded lines

    // 1. Locate every hunk against the original document
    for (size_t idx = 0; idx < patch.hunks.size(); ++idx) {
        const Hunk& hunk = patch.hunks[idx];
        HunkPlacement& placement = result.hunks[idx];

        const std::vector<std::string> old_lines = hunk.old_lines();
        const std::vector<std::string> new_lines = hunk.new_lines();

        // Recorded start; a zero-length old side names the line it follows
        size_t base = lower;
        size_t window = doc.size();
        if (hunk.old_start) {
            base = (hunk.old_count == 0 || *hunk.old_start == 0) ? *hunk.old_start : *hunk.old_start - 1;
            window = options_.max_offset;
        }
        long shifted = static_cast<long>(base) + drift;
        size_t nominal = shifted < static_cast<long>(lower) ? lower : static_cast<size_t>(shifted);

        // Pure insertion: an empty old side matches exactly at the recorded line.
        if (old_lines.empty()) {
            size_t pos = std::min(nominal, doc.size());
            placement.kind = MatchKind::Exact;
            lower = pos;
            placement.position = pos;
            placement.offset = static_cast<long>(pos) - shifted;
            drift = static_cast<long>(pos) - static_cast<long>(base);
            continue;
        }

        auto find_lines = [&](const std::vector<std::string>& lines, LineEq eq) -> std::optional<size_t> {
            if (lines.size() > doc.size()) return std::nullopt;
            return search_window(nominal, lower, doc.size() - lines.size(), window, [&](size_t p) {
                return span_matches(doc, p, lines, 0, lines.size(), eq);
            });
        };

        std::optional<size_t> found;

        // Pass 1: exact
        if ((found = find_lines(old_lines, lines_equal))) {
            placement.kind = MatchKind::Exact;
        }

        // Pass 2: result already present
        if (!found && !new_lines.empty() && new_lines != old_lines) {
            if (auto at = find_lines(new_lines, lines_equal)) {
                placement.kind = MatchKind::AlreadyApplied;
                placement.position = *at;
                placement.offset = static_cast<long>(*at) - static_cast<long>(nominal);
                lower = *at + new_lines.size();
                drift = static_cast<long>(*at) - static_cast<long>(base);
                continue;
            }
        }

        // Pass 3: trailing whitespace drift
        if (!found && (found = find_lines(old_lines, lines_equal_loose))) {
            placement.kind = MatchKind::Whitespace;
        }

        // Pass 4: ignore outer context lines
        const size_t lead_ctx = leading_context(hunk);
        const size_t trail_ctx = trailing_context(hunk);
        for (size_t f = 1; !found && f <= options_.max_fuzz; ++f) {
            size_t lead = std::min(f, lead_ctx);
            size_t trail = std::min(f, trail_ctx);
            if (lead == 0 && trail == 0) break;
            if (lead + trail >= old_lines.size()) break;
            if (old_lines.size() > doc.size()) break;

            found = search_window(nominal, lower, doc.size() - old_lines.size(), window, [&](size_t p) {
                return span_matches(doc, p, old_lines, lead, old_lines.size() - trail, lines_equal_loose);
            });
            if (found) {
                placement.kind = MatchKind::Fuzz;
                placement.fuzz = f;
            }
        }

        // Pass 5: context similarity, removal lines must still match
        if (!found && old_lines.size() <= doc.size()) {
            size_t context_total = 0;
            for (const auto& l : hunk.lines)
                if (l.kind == LineKind::Context) ++context_total;

            double best_score = -1.0;
            if (context_total > 0) {
                search_window(nominal, lower, doc.size() - old_lines.size(), window, [&](size_t p) {
                    size_t k = p;
                    size_t matched = 0;
                    for (const auto& l : hunk.lines) {
                        if (l.kind == LineKind::Add) continue;
                        bool same = lines_equal_loose(doc[k], l.text);
                        if (l.kind == LineKind::Remove && !same) return false;
                        if (l.kind == LineKind::Context && same) ++matched;
                        ++k;
                    }
                    double score = static_cast<double>(matched) / static_cast<double>(context_total);
                    if (score >= options_.min_similarity && score > best_score) {
                        best_score = score;
                        found = p;
                    }
                    return score >= 1.0;  // keep looking for a better candidate
                });
            }
            if (found) {
                placement.kind = MatchKind::Similar;
                placement.similarity = best_score;
            }
        }

        if (!found) {
            placement.kind = MatchKind::NotFound;
            spdlog::debug("Hunk #{} not found near line {}", idx + 1, nominal + 1);
            continue;
        }

        placement.position = *found;
        placement.offset = static_cast<long>(*found) - static_cast<long>(nominal);
        lower = *found + old_lines.size();
        drift = static_cast<long>(*found) - static_cast<long>(base);

        if (placement.kind != MatchKind::Exact) {
            spdlog::debug("Hunk #{} placed at line {} ({}, offset {})", idx + 1, *found + 1,
                          to_string(placement.kind), placement.offset);
        }
    }

    // 2. Rebuild the document, keeping the file's own context lines
    TextDocument& out = result.document;
    out.eol = original.eol;
    out.final_newline = original.final_newline;

    size_t cursor = 0;
    for (size_t idx = 0; idx < patch.hunks.size(); ++idx) {
        const HunkPlacement& placement = result.hunks[idx];
        if (!placement.applied()) continue;
        const Hunk& hunk = patch.hunks[idx];

        out.lines.insert(out.lines.end(), doc.begin() + cursor, doc.begin() + placement.position);
        size_t k = placement.position;
        for (const auto& l : hunk.lines) {
            switch (l.kind) {
                case LineKind::Context: out.lines.push_back(doc[k++]); break;
                case LineKind::Remove: ++k; break;
                case LineKind::Add: out.lines.push_back(l.text); break;
            }
        }
        cursor = k;

        if (k == doc.size()) {
            if (hunk.new_no_newline) {
                out.final_newline = false;
            } else if (hunk.old_no_newline) {
                out.final_newline = true;
            }
        }
    }
    out.lines.insert(out.lines.end(), doc.begin() + cursor, doc.end());

    return result;
}

}
