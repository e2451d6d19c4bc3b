#include "tools/FileSystemTools.hpp"
#include <fstream>
#include <sstream>
#include <chrono>
#include <cstdio>
#include <cerrno>
#include <system_error>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace repopatch {

namespace fs = std::filesystem;

fs::path FileSystemTools::resolve_existing(const std::string& requested, std::error_code& ec) {
    ec.clear();
    if (requested.empty()) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return {};
    }
    fs::path resolved = fs::canonical(fs::path(requested), ec);
    if (ec) return {};
    return resolved;
}

// Helper for containment: component-wise prefix test
static bool is_inside_path(const fs::path& child, const fs::path& parent) {
    if (parent.empty()) return false;
    auto it_c = child.begin();
    for (auto it_p = parent.begin(); it_p != parent.end(); ++it_p) {
        // "/base/" normalizes with a trailing empty element
        if (it_p->empty()) continue;
        if (it_c == child.end() || *it_c != *it_p) return false;
        ++it_c;
    }
    return true;
}

// 🛡️ SANDBOX CHECK
bool FileSystemTools::is_safe_path(const fs::path& root, const fs::path& target) {
    if (root.empty()) return false;

    std::error_code ec;
    auto root_abs = fs::absolute(root, ec).lexically_normal();
    if (ec) return false;
    auto target_abs = fs::absolute(target, ec).lexically_normal();
    if (ec) return false;

    if (!is_inside_path(target_abs, root_abs)) {
        spdlog::warn("🚨 Path escape blocked! Root: {} | Target: {}", root_abs.string(), target_abs.string());
        return false;
    }
    return true;
}

std::string FileSystemTools::read_all(const fs::path& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open " + path.string() + ": " +
                                 std::error_code(errno, std::generic_category()).message());
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) {
        throw std::runtime_error("read error on " + path.string());
    }
    return buffer.str();
}

FileReadResult FileSystemTools::read_file_safe(const std::string& requested, std::uintmax_t max_bytes) {
    FileReadResult result;

    std::error_code ec;
    fs::path target = resolve_existing(requested, ec);
    if (ec) {
        result.status = ReadStatus::InvalidPath;
        result.error = "Invalid path '" + requested + "': " + ec.message();
        return result;
    }

    if (!fs::is_regular_file(target, ec)) {
        result.status = ReadStatus::NotAFile;
        result.error = "Path is not a file";
        return result;
    }

    if (max_bytes > 0) {
        auto size = fs::file_size(target, ec);
        if (!ec && size > max_bytes) {
            result.status = ReadStatus::TooLarge;
            result.error = "File too large (" + std::to_string(size) + " bytes, limit " +
                           std::to_string(max_bytes) + ")";
            return result;
        }
    }

    try {
        result.content = read_all(target);
        result.status = ReadStatus::Ok;
    } catch (const std::exception& e) {
        result.status = ReadStatus::IoError;
        result.error = std::string("Failed to read file: ") + e.what();
    }
    return result;
}

WritableProbe FileSystemTools::check_writable(const fs::path& dir) {
    WritableProbe probe;

    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    fs::path test_file = dir / (".repopatch_writetest_" + std::to_string(nanos));

    spdlog::debug("Attempting writability check in {} with file {}", dir.string(), test_file.string());

    // "x": fail if the probe name is already taken
    std::FILE* handle = std::fopen(test_file.string().c_str(), "wx");
    if (!handle) {
        probe.error = std::string("Failed to create temporary test file (check permissions): ") +
                      std::error_code(errno, std::generic_category()).message();
        spdlog::info("Failed to create writability test file {}: {}", test_file.string(), probe.error);
        return probe;
    }
    std::fclose(handle);
    spdlog::debug("Writability test file created: {}", test_file.string());

    std::error_code ec;
    if (!fs::remove(test_file, ec) || ec) {
        probe.error = "Failed to delete temporary test file: " + ec.message();
        spdlog::warn("Failed to delete writability test file {}: {}", test_file.string(), ec.message());
        return probe;
    }

    spdlog::debug("Writability test file deleted: {}", test_file.string());
    probe.writable = true;
    return probe;
}

}
