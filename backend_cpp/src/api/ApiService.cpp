#include "api/ApiService.hpp"
#include "LogManager.hpp"
#include "tools/TreeBuilder.hpp"
#include "utils/Scrubber.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>

namespace repopatch {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
ApiResult<T> reject(int status, std::string message, json extra = json::object()) {
    return ApiResult<T>(std::in_place_type<ApiError>, ApiError{status, std::move(message), std::move(extra)});
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::optional<std::string> string_field(const json& body, const char* key) {
    if (!body.is_object() || !body.contains(key) || !body.at(key).is_string()) return std::nullopt;
    return body.at(key).get<std::string>();
}

}

// --- Payload serialization ---

json ApiError::to_json() const {
    json j = {{"success", false}, {"error", message}};
    if (extra.is_object()) {
        for (auto it = extra.begin(); it != extra.end(); ++it) j[it.key()] = it.value();
    }
    return j;
}

nlohmann::ordered_json DirectoryListing::to_json() const {
    nlohmann::ordered_json j;
    j["success"] = true;
    j["tree"] = TreeBuilder::to_json(tree);
    j["root"] = root;
    return j;
}

json FileContent::to_json() const {
    return {{"success", true}, {"content", content}};
}

json BatchRead::to_json() const {
    return {{"success", true}, {"files", BatchReader::to_json(files)}};
}

json PatchReport::to_json() const {
    json j;
    j["success"] = outcome.success();
    if (outcome.success()) {
        j["message"] = "Patch applied successfully.";
    } else {
        size_t total = std::max(outcome.record_count, outcome.details.size());
        j["error"] = "Patch failed for " + std::to_string(outcome.details.size()) + " of " +
                     std::to_string(total) + " file(s).";
    }
    j["appliedFiles"] = outcome.applied_files;
    j["details"] = outcome.details;
    return j;
}

json WritableReport::to_json() const {
    json j = {{"success", true}, {"writable", probe.writable}};
    if (!probe.error.empty()) j["error"] = probe.error;
    return j;
}

json ConnectInfo::to_json() const {
    return {
        {"success", true},
        {"status", "Server is running"},
        {"timestamp", timestamp},
        {"port", port}
    };
}

std::string rfc3339_now() {
    auto now = std::chrono::system_clock::now();
    auto since_epoch = now.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs).count();

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(9) << std::setfill('0') << nanos
       << "+00:00";
    return ss.str();
}

// --- ApiService ---

ApiService::ApiService(const ServerConfig& config)
    : config_(config), applier_(config.patch), reader_(config.max_read_bytes) {}

ApiResult<json> ApiService::parse_body(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        spdlog::error("❌ JSON Error. Body length: {}", body.length());
        return reject<json>(400, "Invalid JSON body");
    }
    return ApiResult<json>(std::in_place_type<json>, std::move(parsed));
}

ApiResult<fs::path> ApiService::resolve_directory(const std::string& requested) {
    std::error_code ec;
    fs::path dir = FileSystemTools::resolve_existing(requested, ec);
    if (ec) {
        return reject<fs::path>(400, "Invalid directory path '" + requested + "': " + ec.message());
    }
    if (!fs::is_directory(dir, ec)) {
        return reject<fs::path>(400, "Provided path is not a directory");
    }
    return ApiResult<fs::path>(std::in_place_type<fs::path>, dir);
}

void ApiService::record(const std::string& endpoint, const std::string& target, bool success,
                        Clock::time_point started, size_t applied_files, size_t detail_count) const {
    double ms = std::chrono::duration<double, std::milli>(Clock::now() - started).count();
    LogManager::instance().add_log({LogManager::now_ms(), endpoint, target, success, ms, applied_files, detail_count});
    spdlog::info("⏱️ {} {} {} in {:.2f} ms", endpoint, target, success ? "ok" : "failed", ms);
}

ApiResult<DirectoryListing> ApiService::list_directory(const std::optional<std::string>& path) const {
    auto started = Clock::now();

    std::string requested;
    if (path && !path->empty()) {
        requested = *path;
    } else {
        std::error_code ec;
        requested = fs::current_path(ec).string();
        if (ec) {
            record("directory", "", false, started);
            return reject<DirectoryListing>(500, "Cannot determine working directory: " + ec.message());
        }
    }

    auto dir = resolve_directory(requested);
    if (auto* err = std::get_if<ApiError>(&dir)) {
        record("directory", requested, false, started);
        return *err;
    }
    const fs::path& root = std::get<fs::path>(dir);

    try {
        DirectoryListing listing{root.string(), TreeBuilder::build_tree(root)};
        record("directory", root.string(), true, started);
        return listing;
    } catch (const TreeBuildError& e) {
        record("directory", root.string(), false, started);
        return reject<DirectoryListing>(500, e.what());
    }
}

ApiResult<FileContent> ApiService::read_file(const std::optional<std::string>& path) const {
    auto started = Clock::now();
    if (!path || path->empty()) {
        return reject<FileContent>(400, "Path parameter is required");
    }

    std::error_code ec;
    fs::path resolved = FileSystemTools::resolve_existing(*path, ec);
    if (ec) {
        record("file", *path, false, started);
        return reject<FileContent>(400, "Invalid file path '" + *path + "': " + ec.message());
    }

    FileReadResult result = FileSystemTools::read_file_safe(resolved.string(), config_.max_read_bytes);
    record("file", resolved.string(), result.success(), started);

    switch (result.status) {
        case ReadStatus::Ok:
            return FileContent{*result.content};
        case ReadStatus::InvalidPath:
        case ReadStatus::NotAFile:
            return reject<FileContent>(400, result.error.value_or("Path is not a file"));
        case ReadStatus::TooLarge:
            return reject<FileContent>(413, result.error.value_or("File too large"));
        case ReadStatus::IoError:
            break;
    }
    return reject<FileContent>(500, result.error.value_or("Failed to read file"));
}

ApiResult<BatchRead> ApiService::read_files(const json& body) const {
    auto started = Clock::now();

    if (!body.contains("paths") || !body.at("paths").is_array() || body.at("paths").empty()) {
        return reject<BatchRead>(400, "Paths array is required and cannot be empty");
    }

    std::vector<std::string> paths;
    for (const auto& p : body.at("paths")) {
        if (!p.is_string()) {
            return reject<BatchRead>(400, "Paths array must contain only strings");
        }
        paths.push_back(p.get<std::string>());
    }

    BatchRead payload{reader_.read_many(paths)};
    size_t failures = std::count_if(payload.files.begin(), payload.files.end(),
                                    [](const auto& kv) { return !kv.second.success(); });
    record("files", std::to_string(paths.size()) + " path(s)", true, started, payload.files.size() - failures, failures);
    return payload;
}

ApiResult<PatchReport> ApiService::apply_patch(const json& body) const {
    auto started = Clock::now();

    auto directory = string_field(body, "directoryPath");
    if (!directory) {
        return reject<PatchReport>(400, "directoryPath is required");
    }
    auto patch_content = string_field(body, "patchContent");
    if (!patch_content) {
        return reject<PatchReport>(400, "patchContent is required");
    }

    auto dir = resolve_directory(*directory);
    if (auto* err = std::get_if<ApiError>(&dir)) {
        record("apply_patch", *directory, false, started);
        return *err;
    }
    const fs::path& base_dir = std::get<fs::path>(dir);

    if (is_blank(*patch_content)) {
        record("apply_patch", base_dir.string(), false, started);
        return reject<PatchReport>(400, "Patch content cannot be empty");
    }

    spdlog::info("🩹 Applying patch ({} bytes) in {}", patch_content->size(), base_dir.string());
    PatchReport report{applier_.apply(base_dir, *patch_content)};

    if (!report.outcome.success()) {
        for (const auto& detail : report.outcome.details) {
            spdlog::warn("   ↳ {}", scrub_snippet(detail));
        }
    }
    record("apply_patch", base_dir.string(), report.outcome.success(), started,
           report.outcome.applied_files.size(), report.outcome.details.size());
    return report;
}

ApiResult<WritableReport> ApiService::check_writable(const json& body) const {
    auto started = Clock::now();
    const json not_writable = {{"writable", false}};

    auto directory = string_field(body, "directoryPath");
    if (!directory) {
        return reject<WritableReport>(400, "directoryPath is required", not_writable);
    }

    auto dir = resolve_directory(*directory);
    if (auto* err = std::get_if<ApiError>(&dir)) {
        record("check_writable", *directory, false, started);
        return reject<WritableReport>(err->status, err->message, not_writable);
    }
    const fs::path& base_dir = std::get<fs::path>(dir);

    WritableReport report{FileSystemTools::check_writable(base_dir)};
    record("check_writable", base_dir.string(), report.probe.writable, started);
    return report;
}

ApiResult<ConnectInfo> ApiService::connect() const {
    return ConnectInfo{rfc3339_now(), config_.port};
}

ApiResult<OperationLogView> ApiService::logs() const {
    return OperationLogView{LogManager::instance().get_logs_json()};
}

}
