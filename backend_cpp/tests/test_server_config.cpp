#include <catch2/catch.hpp>
#include "ServerConfig.hpp"
#include "TestHelpers.hpp"

using namespace repopatch;
using repopatch::testing::TempDir;

namespace {

EnvLookup env_from(std::map<std::string, std::string> vars) {
    return [vars](const std::string& key) -> std::optional<std::string> {
        auto it = vars.find(key);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

const EnvLookup kNoEnv = env_from({});

}

TEST_CASE("Defaults without any source", "[config]") {
    TempDir tmp;
    ServerConfig c = ServerConfig::load({tmp.path() / "repopatch.json"}, tmp.path() / ".env", kNoEnv);
    CHECK(c.port == 3000);
    CHECK(c.host == "0.0.0.0");
    CHECK_FALSE(c.use_https);
    CHECK(c.cert_file == "server.cert");
    CHECK(c.key_file == "server.key");
    CHECK(c.allowed_origins.size() == 3);
    CHECK(c.is_origin_allowed("https://repoprompt.netlify.app"));
    CHECK(c.is_origin_allowed("http://localhost:8080"));
    CHECK_FALSE(c.is_origin_allowed("https://evil.example"));
    CHECK(c.static_dir == "public");
    CHECK(c.log_level == "info");
    CHECK(c.max_read_bytes == 8u * 1024 * 1024);
    CHECK(c.patch.strip_levels == 1);
    CHECK(c.patch.fuzz.max_offset == 1000);
    CHECK(c.patch.fuzz.max_fuzz == 2);
    CHECK(c.patch.fuzz.min_similarity == Approx(0.75));
    CHECK(c.config_file.empty());
}

TEST_CASE("Sources layer: file, then .env, then environment", "[config]") {
    TempDir tmp;
    tmp.write("repopatch.json", R"({
        "port": 4000,
        "host": "127.0.0.1",
        "static_dir": "ui",
        "allowed_origins": ["https://a.example", "https://b.example"],
        "patch": {"strip_levels": 0, "max_fuzz": 3, "min_similarity": 0.5}
    })");
    tmp.write(".env", "# local overrides\nPORT=5000\nLOG_LEVEL=debug\nexport STATIC_DIR=\"web\"\n");

    ServerConfig c = ServerConfig::load({tmp.path() / "repopatch.json"}, tmp.path() / ".env",
                                        env_from({{"PORT", "6000"}}));
    CHECK(c.port == 6000);                 // environment beats .env
    CHECK(c.log_level == "debug");         // .env beats defaults
    CHECK(c.static_dir == "web");          // .env beats the file
    CHECK(c.host == "127.0.0.1");          // file beats defaults
    CHECK(c.allowed_origins == std::vector<std::string>{"https://a.example", "https://b.example"});
    CHECK(c.patch.strip_levels == 0);
    CHECK(c.patch.fuzz.max_fuzz == 3);
    CHECK(c.patch.fuzz.min_similarity == Approx(0.5));
    CHECK(c.config_file == (tmp.path() / "repopatch.json").string());
}

TEST_CASE("First existing config file wins", "[config]") {
    TempDir tmp;
    tmp.write("second/repopatch.json", R"({"port": 7001})");
    tmp.write("third/repopatch.json", R"({"port": 7002})");

    ServerConfig c = ServerConfig::load({tmp.path() / "first" / "repopatch.json",
                                         tmp.path() / "second" / "repopatch.json",
                                         tmp.path() / "third" / "repopatch.json"},
                                        "", kNoEnv);
    CHECK(c.port == 7001);
}

TEST_CASE("Invalid values keep the previous setting", "[config]") {
    ServerConfig c;
    c.apply_env(env_from({
        {"PORT", "eighty"},
        {"USE_HTTPS", "maybe"},
        {"LOG_LEVEL", "loud"},
        {"MAX_READ_BYTES", "-5"},
        {"ALLOWED_ORIGINS", " , "}
    }));
    CHECK(c.port == 3000);
    CHECK_FALSE(c.use_https);
    CHECK(c.log_level == "info");
    CHECK(c.max_read_bytes == 8u * 1024 * 1024);
    CHECK(c.allowed_origins.size() == 3);

    c.apply_env(env_from({{"PORT", "70000"}}));
    CHECK(c.port == 3000);

    c.apply_json(nlohmann::json::parse(R"({"patch": {"min_similarity": 1.5, "max_offset": -1}})"));
    CHECK(c.patch.fuzz.min_similarity == Approx(0.75));
    CHECK(c.patch.fuzz.max_offset == 1000);
}

TEST_CASE("A broken config file is skipped", "[config]") {
    TempDir tmp;
    tmp.write("repopatch.json", "{ not json");
    ServerConfig c = ServerConfig::load({tmp.path() / "repopatch.json"}, "", kNoEnv);
    CHECK(c.port == 3000);
    CHECK(c.config_file.empty());
}

TEST_CASE("Environment values parse booleans and lists", "[config]") {
    ServerConfig c;
    c.apply_env(env_from({
        {"USE_HTTPS", "TRUE"},
        {"ALLOWED_ORIGINS", "https://x.example, http://y.example ,"},
        {"MAX_READ_BYTES", "0"}
    }));
    CHECK(c.use_https);
    CHECK(c.allowed_origins == std::vector<std::string>{"https://x.example", "http://y.example"});
    CHECK(c.max_read_bytes == 0);
}

TEST_CASE(".env parsing", "[config]") {
    auto vars = ServerConfig::parse_dotenv(
        "# comment\n"
        "\n"
        "A=1\n"
        "B = two words \n"
        "C='quoted'\n"
        "export D=4\r\n"
        "broken line\n"
        "E=\n");
    CHECK(vars.size() == 5);
    CHECK(vars["A"] == "1");
    CHECK(vars["B"] == "two words");
    CHECK(vars["C"] == "quoted");
    CHECK(vars["D"] == "4");
    CHECK(vars["E"].empty());
}
