#pragma once
#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "tools/FileSystemTools.hpp"

namespace repopatch {

// Keyed by the exact path string the caller sent
using BatchReadResults = std::map<std::string, FileReadResult>;

class BatchReader {
public:
    // Upper bound on reads in flight at once
    static constexpr int kMaxConcurrentReads = 50;

    explicit BatchReader(std::uintmax_t max_file_bytes = 0);

    // Every path gets its own success/failure entry; never throws for a bad path.
    BatchReadResults read_many(const std::vector<std::string>& paths) const;

    static nlohmann::json to_json(const BatchReadResults& results);

private:
    std::uintmax_t max_file_bytes_;
};

nlohmann::json file_result_to_json(const FileReadResult& result);

}
