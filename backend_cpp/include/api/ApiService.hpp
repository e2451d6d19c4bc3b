#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "api/ApiTypes.hpp"
#include "ServerConfig.hpp"
#include "patch/PatchApplier.hpp"
#include "tools/BatchReader.hpp"

namespace repopatch {

/**
 * Endpoint logic, independent of the HTTP library.
 *
 * Every operation validates its input before touching the filesystem and
 * returns either a typed payload or an ApiError. Each call is recorded in
 * the LogManager operation log.
 */
class ApiService {
public:
    explicit ApiService(const ServerConfig& config);

    // Body parsing shared by the POST routes: 400 on malformed JSON or a non-object root
    static ApiResult<nlohmann::json> parse_body(const std::string& body);

    ApiResult<DirectoryListing> list_directory(const std::optional<std::string>& path) const;
    ApiResult<FileContent> read_file(const std::optional<std::string>& path) const;
    ApiResult<BatchRead> read_files(const nlohmann::json& body) const;
    ApiResult<PatchReport> apply_patch(const nlohmann::json& body) const;
    ApiResult<WritableReport> check_writable(const nlohmann::json& body) const;
    ApiResult<ConnectInfo> connect() const;
    ApiResult<OperationLogView> logs() const;

    const ServerConfig& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    void record(const std::string& endpoint, const std::string& target, bool success,
                Clock::time_point started, size_t applied_files = 0, size_t detail_count = 0) const;

    // Canonical directory or a 400 naming what went wrong
    static ApiResult<std::filesystem::path> resolve_directory(const std::string& requested);

    const ServerConfig& config_;
    PatchApplier applier_;
    BatchReader reader_;
};

// "2026-01-31T12:00:00.123456789+00:00"
std::string rfc3339_now();

}
