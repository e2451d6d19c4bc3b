#pragma once
#include <string>
#include <vector>

namespace repopatch {

// File content as lines, remembering how to write it back.
struct TextDocument {
    std::vector<std::string> lines;   // without terminators
    std::string eol = "\n";           // "\r\n" when the first line ends that way
    bool final_newline = true;

    static TextDocument parse(const std::string& content);
    std::string render() const;
};

// Patch text split on '\n' with any trailing '\r' removed
std::vector<std::string> split_patch_lines(const std::string& text);

// Equal ignoring one trailing '\r'
bool lines_equal(const std::string& a, const std::string& b);

// Equal ignoring all trailing whitespace
bool lines_equal_loose(const std::string& a, const std::string& b);

}
