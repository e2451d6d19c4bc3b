#include "tools/BatchReader.hpp"
#include <algorithm>
#include <omp.h>
#include <spdlog/spdlog.h>

namespace repopatch {

BatchReader::BatchReader(std::uintmax_t max_file_bytes) : max_file_bytes_(max_file_bytes) {}

BatchReadResults BatchReader::read_many(const std::vector<std::string>& paths) const {
    const int count = static_cast<int>(paths.size());
    std::vector<FileReadResult> slots(paths.size());

    if (count > 0) {
        const int workers = std::min(count, kMaxConcurrentReads);
        const std::uintmax_t limit = max_file_bytes_;

        // 🚀 Each worker owns its slot; no shared mutable state
        #pragma omp parallel for num_threads(workers) schedule(dynamic, 1)
        for (int i = 0; i < count; ++i) {
            slots[i] = FileSystemTools::read_file_safe(paths[i], limit);
        }
    }

    BatchReadResults results;
    size_t failures = 0;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (!slots[i].success()) ++failures;
        results[paths[i]] = std::move(slots[i]);
    }

    spdlog::info("📚 Batch read: {} path(s), {} failed", paths.size(), failures);
    return results;
}

nlohmann::json file_result_to_json(const FileReadResult& result) {
    nlohmann::json j;
    j["success"] = result.success();
    j["content"] = result.content ? nlohmann::json(*result.content) : nlohmann::json(nullptr);
    j["error"] = result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json BatchReader::to_json(const BatchReadResults& results) {
    nlohmann::json files = nlohmann::json::object();
    for (const auto& [path, result] : results) {
        files[path] = file_result_to_json(result);
    }
    return files;
}

}
