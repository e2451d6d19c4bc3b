#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <spdlog/spdlog.h>

namespace repopatch {
namespace fs = std::filesystem;

// Whole-file rewrite with a backup copy that is restored if the write fails.
class AtomicJournal {
public:
    static constexpr int kMaxNameAttempts = 16;

    // Picks a backup name beside the file that no existing entry uses
    static std::optional<std::string> journal_path(const std::string& filePath) {
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
            std::string candidate = filePath + ".repopatch_journal_" + std::to_string(nanos + attempt);
            std::error_code ec;
            bool taken = fs::exists(candidate, ec);
            if (!taken && !ec) return candidate;
        }
        spdlog::error("🚨 No free journal name next to {}", filePath);
        return std::nullopt;
    }

    // 🛡️ Creates a backup of the file before the rewrite
    static bool backup(const std::string& filePath, const std::string& journal) {
        fs::path p(filePath);
        std::error_code ec;
        if (!fs::exists(p, ec)) {
            // New file creation; backup not needed
            return true;
        }
        // Never overwrite: the name was free a moment ago and must still be
        fs::copy_file(p, journal, fs::copy_options::none, ec);
        if (ec) {
            spdlog::error("🚨 Journal Backup Failed for {}: {}", filePath, ec.message());
            return false;
        }
        return true;
    }

    // ✅ Rewrite succeeded: drop the backup
    static void commit(const std::string& journal) {
        std::error_code ec;
        fs::remove(journal, ec);
        if (ec) spdlog::warn("Could not remove journal {}: {}", journal, ec.message());
    }

    // 🔄 Restores the file to its state before the failed rewrite
    static void rollback(const std::string& filePath, const std::string& journal) {
        std::error_code ec;
        if (!fs::exists(journal, ec)) {
            // Nothing existed before: remove the partial new file
            fs::remove(filePath, ec);
            return;
        }
        fs::copy_file(journal, filePath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            spdlog::critical("💥 ROLLBACK FAILED for {}: {}. Backup kept at {}", filePath, ec.message(), journal);
            return;
        }
        fs::remove(journal, ec);
        spdlog::warn("🔄 Rollback triggered for: {}", filePath);
    }

    // Backup, write, then commit or roll back
    static bool rewrite_safe(const std::string& path, const std::string& content) {
        std::optional<std::string> journal = journal_path(path);
        if (!journal || !backup(path, *journal)) return false;

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("💥 Cannot open {} for writing", path);
            rollback(path, *journal);
            return false;
        }

        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (out.fail()) {
            spdlog::error("💥 Write failed for {}", path);
            rollback(path, *journal);
            return false;
        }

        commit(*journal);
        return true;
    }
};

}
