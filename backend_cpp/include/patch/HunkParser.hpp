#pragma once
#include <string>
#include "patch/PatchTypes.hpp"

namespace repopatch {

/**
 * Parses the body of one file section (everything after its ---/+++ pair)
 * into hunks.
 *
 * Accepted grammar:
 *  - "@@ -a[,b] +c[,d] @@ ..." starts a hunk; counts default to 1. A bare
 *    "@@" header without ranges gives a hunk with no recorded position.
 *  - ' ', '-', '+' lines are context, removal and addition; an empty line is
 *    an empty context line; "\ No newline at end of file" marks the line
 *    before it.
 *  - Until a hunk reaches its declared counts every line must be one of the
 *    above. Past that point further hunk lines extend it, anything else ends
 *    it and is ignored up to the next "@@".
 *  - git extended headers (diff, index, mode and rename lines) end a hunk.
 *  - Blank lines trailing a hunk beyond its declared counts are dropped.
 *
 * Throws PatchParseError with a bounded excerpt of the offending line.
 */
class HunkParser {
public:
    static ParsedPatch parse(const std::string& body);
};

}
