#pragma once
#include <string>
#include "patch/PatchTypes.hpp"

namespace repopatch {

inline bool is_dev_null(const std::string& path) {
    return path == kDevNull;
}

// Drops `levels` leading '/'-separated segments ("-p1" style). Paths with
// fewer segments than that come back unchanged.
inline std::string strip_path(const std::string& path, size_t levels) {
    size_t pos = 0;
    for (size_t i = 0; i < levels; ++i) {
        auto slash = path.find('/', pos);
        if (slash == std::string::npos) return path;
        pos = slash + 1;
        // "a//b" counts as one separator
        while (pos < path.size() && path[pos] == '/') ++pos;
    }
    return path.substr(pos);
}

// Both sides stripped; the /dev/null sentinel passes through.
inline FilePatchRecord strip_record(const FilePatchRecord& record, size_t levels) {
    FilePatchRecord out = record;
    if (!is_dev_null(out.old_path)) out.old_path = strip_path(out.old_path, levels);
    if (!is_dev_null(out.new_path)) out.new_path = strip_path(out.new_path, levels);
    return out;
}

}
