#pragma once
#include <string>
#include <algorithm>

namespace repopatch {

constexpr size_t kSnippetMaxBytes = 200;

// Single-line, bounded excerpt of untrusted text for error details.
// Newlines become a visible "\n", other control bytes a space.
inline std::string scrub_snippet(const std::string& str, size_t max_bytes = kSnippetMaxBytes) {
    size_t cut = std::min(str.size(), max_bytes);

    // Never split a UTF-8 sequence: back off over continuation bytes
    if (cut < str.size()) {
        while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) --cut;
    }

    std::string out;
    out.reserve(cut + 8);
    for (size_t i = 0; i < cut; ++i) {
        unsigned char c = str[i];
        if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            continue;
        } else if (c < 0x20 && c != '\t') {
            out += ' ';
        } else {
            out += static_cast<char>(c);
        }
    }
    if (cut < str.size()) out += "...";
    return out;
}

}
