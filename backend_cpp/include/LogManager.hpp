#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace repopatch {

struct OperationLog {
    long long timestamp = 0;     // ms since epoch
    std::string endpoint;        // "directory", "apply_patch", ...
    std::string target;          // path or directory the request touched
    bool success = false;
    double duration_ms = 0.0;
    size_t applied_files = 0;
    size_t detail_count = 0;
};

// Recent requests, newest last. Kept in memory only.
class LogManager {
public:
    static constexpr size_t kMaxEntries = 100;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    static long long now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    void add_log(const OperationLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kMaxEntries) logs_.pop_front();
    }

    // Newest first
    json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"endpoint", it->endpoint},
                {"target", it->target},
                {"success", it->success},
                {"duration_ms", it->duration_ms},
                {"applied_files", it->applied_files},
                {"detail_count", it->detail_count}
            });
        }
        return j_list;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

private:
    LogManager() = default;

    std::deque<OperationLog> logs_;
    mutable std::mutex mtx_;
};

}
