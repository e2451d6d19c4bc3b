#include "patch/TextDocument.hpp"

namespace repopatch {

TextDocument TextDocument::parse(const std::string& content) {
    TextDocument doc;
    if (content.empty()) return doc;

    auto first_nl = content.find('\n');
    if (first_nl != std::string::npos && first_nl > 0 && content[first_nl - 1] == '\r') {
        doc.eol = "\r\n";
    }
    const bool crlf = doc.eol == "\r\n";

    size_t start = 0;
    while (start < content.size()) {
        auto nl = content.find('\n', start);
        if (nl == std::string::npos) {
            doc.lines.push_back(content.substr(start));
            doc.final_newline = false;
            break;
        }
        std::string line = content.substr(start, nl - start);
        if (crlf && !line.empty() && line.back() == '\r') line.pop_back();
        doc.lines.push_back(std::move(line));
        start = nl + 1;
    }
    return doc;
}

std::string TextDocument::render() const {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        out += lines[i];
        if (i + 1 < lines.size() || final_newline) out += eol;
    }
    return out;
}

std::vector<std::string> split_patch_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

static size_t trimmed_length(const std::string& s, const char* ws) {
    auto last = s.find_last_not_of(ws);
    return last == std::string::npos ? 0 : last + 1;
}

bool lines_equal(const std::string& a, const std::string& b) {
    size_t la = (!a.empty() && a.back() == '\r') ? a.size() - 1 : a.size();
    size_t lb = (!b.empty() && b.back() == '\r') ? b.size() - 1 : b.size();
    return la == lb && a.compare(0, la, b, 0, lb) == 0;
}

bool lines_equal_loose(const std::string& a, const std::string& b) {
    size_t la = trimmed_length(a, " \t\r\f\v");
    size_t lb = trimmed_length(b, " \t\r\f\v");
    return la == lb && a.compare(0, la, b, 0, lb) == 0;
}

}
