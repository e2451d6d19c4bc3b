#include "patch/PatchApplier.hpp"
#include "patch/PatchSplitter.hpp"
#include "patch/PathStripper.hpp"
#include "patch/HunkParser.hpp"
#include "patch/TextDocument.hpp"
#include "tools/AtomicJournal.hpp"
#include "tools/FileSystemTools.hpp"
#include "utils/Scrubber.hpp"
#include <sstream>
#include <spdlog/spdlog.h>

namespace repopatch {

namespace fs = std::filesystem;

namespace {

RecordOutcome failed(const std::string& rel, const std::string& message) {
    spdlog::warn("❌ {}: {}", rel, message);
    return RecordOutcome{false, rel, rel + ": " + message};
}

RecordOutcome succeeded(const std::string& rel) {
    return RecordOutcome{true, rel, ""};
}

std::string join_numbers(const std::vector<size_t>& numbers) {
    std::ostringstream ss;
    for (size_t i = 0; i < numbers.size(); ++i) {
        if (i) ss << ", ";
        ss << '#' << numbers[i];
    }
    return ss.str();
}

}

std::string to_string(PatchOperation op) {
    switch (op) {
        case PatchOperation::Create: return "create";
        case PatchOperation::Delete: return "delete";
        case PatchOperation::Modify: return "modify";
        case PatchOperation::Invalid: return "invalid";
    }
    return "unknown";
}

void PatchOutcome::add(const RecordOutcome& outcome) {
    if (outcome.applied) {
        applied_files.push_back(outcome.path);
    } else {
        details.push_back(outcome.detail);
    }
}

PatchApplier::PatchApplier(PatchOptions options) : options_(options), matcher_(options.fuzz) {}

PatchOperation PatchApplier::classify(const FilePatchRecord& record) {
    const bool creates = is_dev_null(record.old_path);
    const bool deletes = is_dev_null(record.new_path);
    if (creates && deletes) return PatchOperation::Invalid;
    if (creates) return PatchOperation::Create;
    if (deletes) return PatchOperation::Delete;
    return PatchOperation::Modify;
}

PatchOutcome PatchApplier::apply(const fs::path& base_dir, const std::string& payload) const {
    PatchOutcome outcome;

    std::vector<FilePatchRecord> records = PatchSplitter::split(payload);
    outcome.record_count = records.size();
    if (records.empty()) {
        outcome.details.push_back("No file sections found in patch: '" + scrub_snippet(payload) + "'");
        return outcome;
    }

    // Sequential on purpose: later records may touch files earlier ones created
    for (const auto& raw : records) {
        outcome.add(apply_record(base_dir, strip_record(raw, options_.strip_levels)));
    }

    spdlog::info("🩹 Patch in {}: {} applied, {} failed", base_dir.string(),
                 outcome.applied_files.size(), outcome.details.size());
    return outcome;
}

RecordOutcome PatchApplier::apply_record(const fs::path& base_dir, const FilePatchRecord& record) const {
    const PatchOperation op = classify(record);
    const std::string rel = is_dev_null(record.old_path) ? record.new_path : record.old_path;

    if (op == PatchOperation::Invalid || rel.empty()) {
        return failed(record.old_path + " -> " + record.new_path, "record has no target path");
    }

    fs::path rel_path(rel);
    fs::path target = (base_dir / rel_path).lexically_normal();
    if (rel_path.is_absolute() || !FileSystemTools::is_safe_path(base_dir, target)) {
        return failed(rel, "Path escapes base directory");
    }

    if (op == PatchOperation::Modify && record.old_path != record.new_path) {
        spdlog::debug("Record renames {} -> {}; patching the old path", record.old_path, record.new_path);
    }

    try {
        switch (op) {
            case PatchOperation::Create: return create_file(target, rel, record);
            case PatchOperation::Delete: return delete_file(target, rel);
            case PatchOperation::Modify: return modify_file(target, rel, record);
            case PatchOperation::Invalid: break;
        }
    } catch (const std::exception& e) {
        return failed(rel, std::string("error while applying patch: ") + e.what());
    }
    return failed(rel, "record has no target path");
}

RecordOutcome PatchApplier::create_file(const fs::path& target, const std::string& rel,
                                        const FilePatchRecord& record) const {
    ParsedPatch parsed;
    try {
        parsed = HunkParser::parse(record.hunk_text);
    } catch (const PatchParseError& e) {
        return failed(rel, std::string("failed to parse patch for new file: ") + e.what());
    }

    ApplyResult result = matcher_.apply(TextDocument{}, parsed);
    if (!result.all_applied()) {
        return failed(rel, "patch for new file applied only partially (" + std::to_string(result.applied_count()) +
                           " of " + std::to_string(parsed.hunks.size()) + " hunks); file not created");
    }
    const std::string content = result.document.render();

    std::error_code ec;
    if (fs::exists(target, ec)) {
        if (fs::is_regular_file(target, ec) && FileSystemTools::read_all(target) == content) {
            spdlog::info("✅ {} already exists with the patched content", rel);
            return succeeded(rel);
        }
        return failed(rel, "file to create already exists");
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return failed(rel, "failed to create parent directories: " + ec.message());
    }

    if (!AtomicJournal::rewrite_safe(target.string(), content)) {
        return failed(rel, "failed to write new file");
    }

    spdlog::info("✅ Created {}", rel);
    return succeeded(rel);
}

RecordOutcome PatchApplier::delete_file(const fs::path& target, const std::string& rel) const {
    std::error_code ec;
    auto status = fs::symlink_status(target, ec);
    if (ec || !fs::exists(status)) {
        return failed(rel, "file to delete does not exist");
    }
    if (fs::is_directory(status)) {
        return failed(rel, "path to delete is a directory");
    }

    if (!fs::remove(target, ec) || ec) {
        return failed(rel, "failed to delete file: " + (ec ? ec.message() : std::string("not removed")));
    }

    spdlog::info("🗑️ Deleted {}", rel);
    return succeeded(rel);
}

RecordOutcome PatchApplier::modify_file(const fs::path& target, const std::string& rel,
                                        const FilePatchRecord& record) const {
    std::error_code ec;
    if (!fs::exists(target, ec)) {
        return failed(rel, "file to modify does not exist");
    }
    if (!fs::is_regular_file(target, ec)) {
        return failed(rel, "path to modify is not a regular file");
    }

    const std::string current = FileSystemTools::read_all(target);

    ParsedPatch parsed;
    try {
        parsed = HunkParser::parse(record.hunk_text);
    } catch (const PatchParseError& e) {
        return failed(rel, std::string("failed to parse patch: ") + e.what());
    }

    ApplyResult result = matcher_.apply(TextDocument::parse(current), parsed);

    if (result.all_already_applied()) {
        spdlog::info("✅ {}: all {} hunk(s) already applied, nothing to do", rel, parsed.hunks.size());
        return succeeded(rel);
    }

    if (!result.all_applied()) {
        std::string message;
        auto failed_hunks = result.failed_hunks();
        auto skipped_hunks = result.skipped_hunks();
        if (!failed_hunks.empty()) {
            message = "hunk(s) " + join_numbers(failed_hunks) + " of " + std::to_string(parsed.hunks.size()) +
                      " failed to apply";
        }
        if (!skipped_hunks.empty()) {
            if (!message.empty()) message += "; ";
            message += "hunk(s) " + join_numbers(skipped_hunks) + " already applied";
        }
        return failed(rel, message + "; file left unchanged");
    }

    const std::string updated = result.document.render();
    if (updated != current && !AtomicJournal::rewrite_safe(target.string(), updated)) {
        return failed(rel, "failed to write patched file");
    }

    spdlog::info("✅ Patched {} ({} hunk(s))", rel, parsed.hunks.size());
    return succeeded(rel);
}

}
