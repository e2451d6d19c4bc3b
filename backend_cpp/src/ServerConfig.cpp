#include "ServerConfig.hpp"
#include "tools/FileSystemTools.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace repopatch {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::optional<long long> parse_integer(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        long long n = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument("trailing characters");
        return n;
    } catch (const std::exception&) {
        spdlog::warn("⚠️ Config {}: '{}' is not an integer, keeping default", key, value);
        return std::nullopt;
    }
}

std::optional<double> parse_double(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        double d = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument("trailing characters");
        return d;
    } catch (const std::exception&) {
        spdlog::warn("⚠️ Config {}: '{}' is not a number, keeping default", key, value);
        return std::nullopt;
    }
}

std::optional<bool> parse_bool(const std::string& key, const std::string& value) {
    std::string v = lower(trim(value));
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    spdlog::warn("⚠️ Config {}: '{}' is not a boolean, keeping default", key, value);
    return std::nullopt;
}

bool valid_log_level(const std::string& level) {
    static const std::vector<std::string> names = {
        "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"
    };
    return std::find(names.begin(), names.end(), lower(level)) != names.end();
}

// JSON scalars arrive either as their natural type or as strings
std::optional<std::string> json_scalar(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key)) return std::nullopt;
    const auto& v = j.at(key);
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? std::string("true") : std::string("false");
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number()) return v.dump();
    spdlog::warn("⚠️ Config {}: unsupported value {}, keeping default", key, v.dump());
    return std::nullopt;
}

}

bool ServerConfig::is_origin_allowed(const std::string& origin) const {
    return std::find(allowed_origins.begin(), allowed_origins.end(), origin) != allowed_origins.end();
}

std::vector<std::string> ServerConfig::split_list(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string item = trim(value.substr(start, comma - start));
        if (!item.empty()) out.push_back(item);
        start = comma + 1;
    }
    return out;
}

std::map<std::string, std::string> ServerConfig::parse_dotenv(const std::string& content) {
    std::map<std::string, std::string> vars;
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) nl = content.size();
        std::string line = trim(content.substr(start, nl - start));
        start = nl + 1;

        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            spdlog::warn("⚠️ Ignoring malformed .env line: {}", line);
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        vars[key] = value;
    }
    return vars;
}

void ServerConfig::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        spdlog::warn("⚠️ Config file root is not an object, ignoring it");
        return;
    }

    // Same keys as the environment, lower-case
    EnvLookup lookup = [&j](const std::string& key) -> std::optional<std::string> {
        if (key == "ALLOWED_ORIGINS" && j.contains("allowed_origins") && j.at("allowed_origins").is_array()) {
            std::string joined;
            for (const auto& o : j.at("allowed_origins")) {
                if (!o.is_string()) continue;
                if (!joined.empty()) joined += ",";
                joined += o.get<std::string>();
            }
            return joined;
        }
        return json_scalar(j, lower(key));
    };
    apply_env(lookup);

    if (!j.contains("patch")) return;
    const auto& p = j.at("patch");
    if (!p.is_object()) {
        spdlog::warn("⚠️ Config 'patch' is not an object, ignoring it");
        return;
    }
    if (auto v = json_scalar(p, "strip_levels")) {
        if (auto n = parse_integer("patch.strip_levels", *v)) {
            if (*n >= 0) patch.strip_levels = static_cast<size_t>(*n);
            else spdlog::warn("⚠️ Config patch.strip_levels must not be negative");
        }
    }
    if (auto v = json_scalar(p, "max_offset")) {
        if (auto n = parse_integer("patch.max_offset", *v)) {
            if (*n >= 0) patch.fuzz.max_offset = static_cast<size_t>(*n);
            else spdlog::warn("⚠️ Config patch.max_offset must not be negative");
        }
    }
    if (auto v = json_scalar(p, "max_fuzz")) {
        if (auto n = parse_integer("patch.max_fuzz", *v)) {
            if (*n >= 0) patch.fuzz.max_fuzz = static_cast<size_t>(*n);
            else spdlog::warn("⚠️ Config patch.max_fuzz must not be negative");
        }
    }
    if (auto v = json_scalar(p, "min_similarity")) {
        if (auto d = parse_double("patch.min_similarity", *v)) {
            if (*d >= 0.0 && *d <= 1.0) patch.fuzz.min_similarity = *d;
            else spdlog::warn("⚠️ Config patch.min_similarity {} outside [0,1], keeping {}", *d, patch.fuzz.min_similarity);
        }
    }
}

void ServerConfig::apply_env(const EnvLookup& env) {
    if (auto v = env("PORT")) {
        if (auto n = parse_integer("PORT", *v)) {
            if (*n > 0 && *n <= 65535) port = static_cast<int>(*n);
            else spdlog::warn("⚠️ Config PORT {} out of range, keeping {}", *n, port);
        }
    }
    if (auto v = env("HOST"); v && !v->empty()) host = *v;
    if (auto v = env("USE_HTTPS")) {
        if (auto b = parse_bool("USE_HTTPS", *v)) use_https = *b;
    }
    if (auto v = env("CERT_FILE"); v && !v->empty()) cert_file = *v;
    if (auto v = env("KEY_FILE"); v && !v->empty()) key_file = *v;
    if (auto v = env("ALLOWED_ORIGINS")) {
        auto origins = split_list(*v);
        if (!origins.empty()) allowed_origins = origins;
        else spdlog::warn("⚠️ Config ALLOWED_ORIGINS is empty, keeping defaults");
    }
    if (auto v = env("STATIC_DIR"); v && !v->empty()) static_dir = *v;
    if (auto v = env("LOG_LEVEL")) {
        if (valid_log_level(*v)) log_level = lower(*v);
        else spdlog::warn("⚠️ Config LOG_LEVEL '{}' unknown, keeping {}", *v, log_level);
    }
    if (auto v = env("MAX_READ_BYTES")) {
        if (auto n = parse_integer("MAX_READ_BYTES", *v)) {
            if (*n >= 0) max_read_bytes = static_cast<uintmax_t>(*n);
            else spdlog::warn("⚠️ Config MAX_READ_BYTES must not be negative");
        }
    }
}

ServerConfig ServerConfig::load(const std::vector<fs::path>& json_candidates,
                                const fs::path& dotenv_file,
                                const EnvLookup& env) {
    ServerConfig config;

    for (const auto& candidate : json_candidates) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) continue;
        try {
            config.apply_json(nlohmann::json::parse(FileSystemTools::read_all(candidate)));
            config.config_file = candidate.string();
            spdlog::info("⚙️ Loaded config from {}", candidate.string());
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to parse {}: {}", candidate.string(), e.what());
        }
        break;
    }

    std::map<std::string, std::string> dotenv;
    std::error_code ec;
    if (!dotenv_file.empty() && fs::is_regular_file(dotenv_file, ec)) {
        try {
            dotenv = parse_dotenv(FileSystemTools::read_all(dotenv_file));
            spdlog::debug("Loaded {} variable(s) from {}", dotenv.size(), dotenv_file.string());
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Could not read {}: {}", dotenv_file.string(), e.what());
        }
    }

    // The real environment wins over .env
    config.apply_env([&](const std::string& key) -> std::optional<std::string> {
        if (auto v = env(key)) return v;
        auto it = dotenv.find(key);
        if (it != dotenv.end()) return it->second;
        return std::nullopt;
    });

    return config;
}

ServerConfig ServerConfig::load() {
    std::vector<fs::path> candidates = {
        fs::path(kConfigFileName),
        fs::path("..") / kConfigFileName,
        fs::path("build") / kConfigFileName
    };
    return load(candidates, ".env", [](const std::string& key) -> std::optional<std::string> {
        const char* v = std::getenv(key.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    });
}

}
