#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include "patch/PatchTypes.hpp"
#include "patch/FuzzyMatcher.hpp"

namespace repopatch {

struct PatchOptions {
    size_t strip_levels = 1;
    FuzzOptions fuzz;
};

enum class PatchOperation { Create, Delete, Modify, Invalid };

// Result of one file record
struct RecordOutcome {
    bool applied = false;
    std::string path;     // relative to the base directory
    std::string detail;   // set when !applied
};

// Aggregate over a whole request; no rollback of earlier files
struct PatchOutcome {
    std::vector<std::string> applied_files;
    std::vector<std::string> details;
    size_t record_count = 0;

    bool success() const { return details.empty(); }
    void add(const RecordOutcome& outcome);
};

class PatchApplier {
public:
    explicit PatchApplier(PatchOptions options = {});

    // Split, strip and apply every record under `base_dir`, continuing past failures.
    PatchOutcome apply(const std::filesystem::path& base_dir, const std::string& payload) const;

    // One already-stripped record. Never throws.
    RecordOutcome apply_record(const std::filesystem::path& base_dir, const FilePatchRecord& record) const;

    static PatchOperation classify(const FilePatchRecord& record);

    const PatchOptions& options() const { return options_; }

private:
    RecordOutcome create_file(const std::filesystem::path& target, const std::string& rel,
                              const FilePatchRecord& record) const;
    RecordOutcome delete_file(const std::filesystem::path& target, const std::string& rel) const;
    RecordOutcome modify_file(const std::filesystem::path& target, const std::string& rel,
                              const FilePatchRecord& record) const;

    PatchOptions options_;
    FuzzyMatcher matcher_;
};

std::string to_string(PatchOperation op);

}
