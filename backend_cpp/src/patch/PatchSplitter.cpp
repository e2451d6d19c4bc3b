#include "patch/PatchSplitter.hpp"
#include "patch/TextDocument.hpp"
#include <optional>
#include <spdlog/spdlog.h>

namespace repopatch {

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

static bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string PatchSplitter::header_path(const std::string& header_line) {
    std::string path = header_line.size() > 4 ? header_line.substr(4) : std::string();

    // Timestamps follow a tab
    auto tab = path.find('\t');
    if (tab != std::string::npos) path.erase(tab);

    auto last = path.find_last_not_of(" \r");
    path.erase(last == std::string::npos ? 0 : last + 1);

    // git quotes names with unusual characters
    if (path.size() >= 2 && path.front() == '"' && path.back() == '"') {
        path = path.substr(1, path.size() - 2);
    }
    return path;
}

std::vector<FilePatchRecord> PatchSplitter::split(const std::string& payload) {
    std::vector<FilePatchRecord> records;
    std::vector<std::string> lines = split_patch_lines(payload);

    std::optional<FilePatchRecord> current;
    bool hunk_started = false;

    auto flush = [&]() {
        if (!current) return;
        if (is_blank(current->hunk_text)) {
            spdlog::debug("Dropping empty patch section {} -> {}", current->old_path, current->new_path);
        } else {
            records.push_back(std::move(*current));
        }
        current.reset();
        hunk_started = false;
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];

        // 1. New section header pair
        if (starts_with(line, "--- ") && i + 1 < lines.size() && starts_with(lines[i + 1], "+++ ")) {
            flush();
            current = FilePatchRecord{header_path(line), header_path(lines[i + 1]), ""};
            ++i;
            continue;
        }

        // 2. Orphan addition header
        if (starts_with(line, "+++ ") && !(current && hunk_started)) {
            spdlog::warn("⚠️ Patch line {}: '+++' header without a preceding '---' header, skipping section",
                         i + 1);
            current.reset();
            hunk_started = false;
            continue;
        }

        // 3. Body (lines before the first header are preamble)
        if (current) {
            if (starts_with(line, "@@")) hunk_started = true;
            current->hunk_text += line;
            current->hunk_text += '\n';
        }
    }
    flush();

    spdlog::debug("Split patch into {} file section(s)", records.size());
    return records;
}

}
