#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "tools/TreeBuilder.hpp"
#include "tools/BatchReader.hpp"
#include "tools/FileSystemTools.hpp"
#include "patch/PatchApplier.hpp"

namespace repopatch {

// Rejected request: becomes {"success": false, "error": message, ...extra}
struct ApiError {
    int status = 500;
    std::string message;
    nlohmann::json extra = nlohmann::json::object();

    nlohmann::json to_json() const;
};

template <typename T>
using ApiResult = std::variant<T, ApiError>;

struct DirectoryListing {
    std::string root;
    TreeListing tree;

    int status() const { return 200; }
    nlohmann::ordered_json to_json() const;
};

struct FileContent {
    std::string content;

    int status() const { return 200; }
    nlohmann::json to_json() const;
};

struct BatchRead {
    BatchReadResults files;

    int status() const { return 200; }
    nlohmann::json to_json() const;
};

// Per-file failures still carry the partial result, with a 500
struct PatchReport {
    PatchOutcome outcome;

    int status() const { return outcome.success() ? 200 : 500; }
    nlohmann::json to_json() const;
};

struct WritableReport {
    WritableProbe probe;

    int status() const { return 200; }
    nlohmann::json to_json() const;
};

struct ConnectInfo {
    std::string timestamp;   // RFC 3339, UTC
    int port = 0;

    int status() const { return 200; }
    nlohmann::json to_json() const;
};

struct OperationLogView {
    nlohmann::json entries;

    int status() const { return 200; }
    nlohmann::json to_json() const { return entries; }
};

struct ApiResponse {
    int status = 200;
    std::string body;
};

// Invalid UTF-8 in file contents is replaced rather than thrown on
template <typename J>
std::string dump_json(const J& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

template <typename T>
ApiResponse render(const ApiResult<T>& result) {
    if (const auto* err = std::get_if<ApiError>(&result)) {
        return {err->status, dump_json(err->to_json())};
    }
    const T& payload = std::get<T>(result);
    return {payload.status(), dump_json(payload.to_json())};
}

}
