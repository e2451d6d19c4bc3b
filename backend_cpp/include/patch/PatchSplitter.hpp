#pragma once
#include <string>
#include <vector>
#include "patch/PatchTypes.hpp"

namespace repopatch {

/**
 * Splits a combined multi-file diff into per-file records.
 *
 * A section starts at a "--- " line immediately followed by a "+++ " line.
 * Everything after that pair up to the next section is the record's body.
 * Sections whose body is blank are dropped. A "+++ " line without a
 * preceding "--- " header (outside of a started hunk) discards the
 * in-progress section and scanning resumes at the next header.
 */
class PatchSplitter {
public:
    static std::vector<FilePatchRecord> split(const std::string& payload);

    // "--- a/src/x.c\t2024-01-01 ..." -> "a/src/x.c"
    static std::string header_path(const std::string& header_line);
};

}
