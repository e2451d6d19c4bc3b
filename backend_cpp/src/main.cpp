#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <filesystem>
#include <signal.h>

#include "ServerConfig.hpp"
#include "api/ApiService.hpp"
#include "api/ApiTypes.hpp"
#include "tools/FileSystemTools.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

httplib::Server* global_server_ptr = nullptr;

void signal_handler(int signum) {
    spdlog::info("🛑 Interrupt signal ({}) received. Shutting down...", signum);
    if (global_server_ptr) {
        global_server_ptr->stop();
    }
}

namespace {

void send(httplib::Response& res, const repopatch::ApiResponse& response) {
    res.status = response.status;
    res.set_content(response.body, "application/json");
}

std::optional<std::string> query_param(const httplib::Request& req, const char* key) {
    if (!req.has_param(key)) return std::nullopt;
    return req.get_param_value(key);
}

}

class RepoPatchServer {
public:
    explicit RepoPatchServer(const repopatch::ServerConfig& config)
        : config_(config), api_(config) {}

    // False when the server object could not be created (TLS material, missing OpenSSL)
    bool init() {
        if (config_.use_https) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
            auto ssl = std::make_unique<httplib::SSLServer>(config_.cert_file.c_str(), config_.key_file.c_str());
            if (!ssl->is_valid()) {
                spdlog::error("🚨 Failed to load TLS material from {} / {}", config_.cert_file, config_.key_file);
                return false;
            }
            server_ = std::move(ssl);
#else
            spdlog::error("🚨 USE_HTTPS=true but this binary was built without OpenSSL support");
            return false;
#endif
        } else {
            server_ = std::make_unique<httplib::Server>();
        }

        setup_routes();
        global_server_ptr = server_.get();
        return true;
    }

    bool run() {
        spdlog::info("🚀 RepoPatch server listening on {}://{}:{}", config_.use_https ? "https" : "http",
                     config_.host, config_.port);
        for (const auto& origin : config_.allowed_origins) {
            spdlog::info("🌐 Allowed origin: {}", origin);
        }
        bool ok = server_->listen(config_.host, config_.port);
        global_server_ptr = nullptr;
        if (!ok) {
            spdlog::error("💥 Could not bind {}:{}", config_.host, config_.port);
        }
        return ok;
    }

private:
    const repopatch::ServerConfig& config_;
    repopatch::ApiService api_;
    std::unique_ptr<httplib::Server> server_;

    // Handlers never let an exception reach httplib
    template <typename Fn>
    httplib::Server::Handler guarded(const char* route, Fn fn) {
        return [route, fn](const httplib::Request& req, httplib::Response& res) {
            try {
                fn(req, res);
            } catch (const std::exception& e) {
                spdlog::error("❌ {} failed: {}", route, e.what());
                send(res, {500, repopatch::dump_json(json{{"success", false}, {"error", e.what()}})});
            }
        };
    }

    void apply_cors(const httplib::Request& req, httplib::Response& res) const {
        if (!req.has_header("Origin")) return;
        std::string origin = req.get_header_value("Origin");
        if (!config_.is_origin_allowed(origin)) return;
        res.set_header("Access-Control-Allow-Origin", origin);
        res.set_header("Access-Control-Allow-Credentials", "true");
        res.set_header("Vary", "Origin");
    }

    void setup_routes() {
        // --- CORS HEADERS ---
        server_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
            apply_cors(req, res);
            return httplib::Server::HandlerResponse::Unhandled;
        });
        server_->Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers",
                           "Content-Type, Authorization, Accept, ngrok-skip-browser-warning");
            res.set_header("Access-Control-Max-Age", "3600");
            res.status = 204;
        });

        // 1. Directory tree
        server_->Get("/api/directory", guarded("/api/directory", [this](const httplib::Request& req, httplib::Response& res) {
            send(res, repopatch::render(api_.list_directory(query_param(req, "path"))));
        }));

        // 2. Single file
        server_->Get("/api/file", guarded("/api/file", [this](const httplib::Request& req, httplib::Response& res) {
            send(res, repopatch::render(api_.read_file(query_param(req, "path"))));
        }));

        // 3. Batch read
        server_->Post("/api/files", guarded("/api/files", [this](const httplib::Request& req, httplib::Response& res) {
            auto body = repopatch::ApiService::parse_body(req.body);
            if (auto* err = std::get_if<repopatch::ApiError>(&body)) {
                send(res, repopatch::render(repopatch::ApiResult<repopatch::BatchRead>(*err)));
                return;
            }
            send(res, repopatch::render(api_.read_files(std::get<json>(body))));
        }));

        // 4. Patch
        server_->Post("/api/apply_patch", guarded("/api/apply_patch", [this](const httplib::Request& req, httplib::Response& res) {
            auto body = repopatch::ApiService::parse_body(req.body);
            if (auto* err = std::get_if<repopatch::ApiError>(&body)) {
                send(res, repopatch::render(repopatch::ApiResult<repopatch::PatchReport>(*err)));
                return;
            }
            send(res, repopatch::render(api_.apply_patch(std::get<json>(body))));
        }));

        // 5. Writability probe
        server_->Post("/api/check_writable", guarded("/api/check_writable", [this](const httplib::Request& req, httplib::Response& res) {
            auto body = repopatch::ApiService::parse_body(req.body);
            if (auto* err = std::get_if<repopatch::ApiError>(&body)) {
                err->extra = json{{"writable", false}};
                send(res, repopatch::render(repopatch::ApiResult<repopatch::WritableReport>(*err)));
                return;
            }
            send(res, repopatch::render(api_.check_writable(std::get<json>(body))));
        }));

        server_->Get("/api/connect", guarded("/api/connect", [this](const httplib::Request&, httplib::Response& res) {
            send(res, repopatch::render(api_.connect()));
        }));

        // 6. Operation log
        server_->Get("/api/admin/logs", guarded("/api/admin/logs", [this](const httplib::Request&, httplib::Response& res) {
            send(res, repopatch::render(api_.logs()));
        }));

        // --- STATIC UI ---
        std::error_code ec;
        if (fs::is_directory(config_.static_dir, ec)) {
            server_->set_mount_point("/", config_.static_dir);
        } else {
            spdlog::warn("⚠️ Static directory '{}' not found; UI disabled", config_.static_dir);
        }

        // Unknown non-API GETs fall back to the single-page index
        server_->set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
            if (res.status != 404 || req.method != "GET" || req.path.rfind("/api/", 0) == 0) return;
            fs::path index = fs::path(config_.static_dir) / "index.html";
            std::error_code ec;
            if (!fs::is_regular_file(index, ec)) {
                res.set_content("404 Not Found", "text/plain");
                return;
            }
            try {
                res.set_content(repopatch::FileSystemTools::read_all(index), "text/html");
                res.set_header("Cache-Control", "no-cache");
                res.status = 200;
            } catch (const std::exception& e) {
                spdlog::error("❌ Could not serve {}: {}", index.string(), e.what());
                res.status = 500;
            }
        });
    }
};

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    repopatch::ServerConfig config = repopatch::ServerConfig::load();
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    RepoPatchServer app(config);
    if (!app.init()) {
        return 1;
    }

    return app.run() ? 0 : 1; // This blocks
}
