#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include <filesystem>
#include <system_error>

namespace repopatch {

enum class ReadStatus {
    Ok,
    InvalidPath,   // could not canonicalize (missing, inaccessible)
    NotAFile,
    TooLarge,
    IoError
};

struct FileReadResult {
    ReadStatus status = ReadStatus::IoError;
    std::optional<std::string> content;
    std::optional<std::string> error;

    bool success() const { return status == ReadStatus::Ok; }
};

struct WritableProbe {
    bool writable = false;
    std::string error;
};

class FileSystemTools {
public:
    // Canonical absolute form of an existing path; empty path + ec on failure.
    static std::filesystem::path resolve_existing(const std::string& requested, std::error_code& ec);

    // Lexical containment check, both sides made absolute and normalized.
    static bool is_safe_path(const std::filesystem::path& root, const std::filesystem::path& target);

    // Whole-file read of a caller-supplied path. max_bytes == 0 disables the size limit.
    static FileReadResult read_file_safe(const std::string& requested, std::uintmax_t max_bytes);

    static std::string read_all(const std::filesystem::path& path);

    // Create + delete a uniquely named probe file inside `dir`.
    static WritableProbe check_writable(const std::filesystem::path& dir);
};

}
