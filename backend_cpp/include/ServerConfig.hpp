#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "patch/PatchApplier.hpp"

namespace repopatch {

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * Process configuration, built once in main and passed by reference.
 *
 * Precedence, lowest first: defaults, repopatch.json, .env, environment.
 * Values that fail validation are logged and the previous value is kept.
 */
struct ServerConfig {
    static constexpr const char* kConfigFileName = "repopatch.json";

    int port = 3000;
    std::string host = "0.0.0.0";
    bool use_https = false;
    std::string cert_file = "server.cert";
    std::string key_file = "server.key";
    std::vector<std::string> allowed_origins = {
        "https://repoprompt.netlify.app",
        "http://localhost:8080",
        "http://127.0.0.1:8080"
    };
    std::string static_dir = "public";
    std::string log_level = "info";
    uintmax_t max_read_bytes = 8 * 1024 * 1024;  // 0 = unlimited
    PatchOptions patch;

    std::string config_file;  // the repopatch.json that was used, if any

    bool is_origin_allowed(const std::string& origin) const;

    // Reads repopatch.json from ., .. or build/, then ./.env and the process environment
    static ServerConfig load();

    static ServerConfig load(const std::vector<std::filesystem::path>& json_candidates,
                             const std::filesystem::path& dotenv_file,
                             const EnvLookup& env);

    void apply_json(const nlohmann::json& j);
    void apply_env(const EnvLookup& env);

    // KEY=VALUE per line, '#' comments, optional quotes around the value
    static std::map<std::string, std::string> parse_dotenv(const std::string& content);
    static std::vector<std::string> split_list(const std::string& value);
};

}
