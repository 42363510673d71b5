#include "doctest/doctest.h"
#include "test_support.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <vector>

using codeact::util::ConfigError;
using codeact::util::ServerConfig;

namespace {

// argv built from string literals, argv[0] included
struct Args {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    Args(std::initializer_list<const char*> list) {
        storage.emplace_back("codeact-server");
        for (const char* s : list) storage.emplace_back(s);
        for (auto& s : storage) ptrs.push_back(s.data());
    }
    int argc() { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }
};

} // namespace

TEST_CASE("defaults match the documented server settings") {
    ServerConfig config;
    CHECK(config.port == 3001);
    CHECK(config.execution_timeout_ms == 5000);
    CHECK(config.workspace_root == "workspace");
    CHECK(config.tool_kinds.size() == 2);
    CHECK(config.resolved_dispatch_threads() >= 2);
    CHECK(config.resolved_execution_threads() >= 4);
    CHECK_NOTHROW(config.validate());
}

TEST_CASE("command line flags override values") {
    ServerConfig config;
    Args args{"--port", "4000", "--workspace", "/tmp/ws", "--timeout", "750", "--log-level", "debug"};
    config.apply_args(args.argc(), args.argv());

    CHECK(config.port == 4000);
    CHECK(config.workspace_root == "/tmp/ws");
    CHECK(config.execution_timeout_ms == 750);
    CHECK(config.log_level == "debug");
}

TEST_CASE("bad flags are configuration errors") {
    ServerConfig config;
    Args unknown{"--verbose"};
    CHECK_THROWS_AS(config.apply_args(unknown.argc(), unknown.argv()), ConfigError);

    Args missing{"--port"};
    CHECK_THROWS_AS(config.apply_args(missing.argc(), missing.argv()), ConfigError);

    Args range{"--port", "70000"};
    CHECK_THROWS_AS(config.apply_args(range.argc(), range.argv()), ConfigError);

    Args junk{"--timeout", "5s"};
    CHECK_THROWS_AS(config.apply_args(junk.argc(), junk.argv()), ConfigError);
}

TEST_CASE("timeouts too large for an int are rejected instead of truncated") {
    ServerConfig config;
    Args huge{"--timeout", "4294967296000"};
    CHECK_THROWS_AS(config.apply_args(huge.argc(), huge.argv()), ConfigError);
    CHECK(config.execution_timeout_ms == 5000);

    CHECK_THROWS_AS(config.apply_json({{"execution_timeout_ms", 4294967296000LL}}), ConfigError);
    CHECK_THROWS_AS(config.apply_json({{"invoke_timeout_ms", 4294967296000LL}}), ConfigError);
    CHECK_THROWS_AS(config.apply_json({{"ready_timeout_ms", "soon"}}), ConfigError);

    setenv("EXECUTION_TIMEOUT_MS", "4294967296000", 1);
    CHECK_THROWS_AS(config.apply_env(), ConfigError);
    unsetenv("EXECUTION_TIMEOUT_MS");

    config.apply_json({{"execution_timeout_ms", 2500}});
    CHECK(config.execution_timeout_ms == 2500);
}

TEST_CASE("environment variables are applied") {
    setenv("PORT", "3100", 1);
    setenv("EXECUTION_TIMEOUT_MS", "1200", 1);
    setenv("WORKSPACE_DIR", "/srv/ws", 1);

    ServerConfig config;
    config.apply_env();
    CHECK(config.port == 3100);
    CHECK(config.execution_timeout_ms == 1200);
    CHECK(config.workspace_root == "/srv/ws");

    unsetenv("PORT");
    unsetenv("EXECUTION_TIMEOUT_MS");
    unsetenv("WORKSPACE_DIR");
}

TEST_CASE("config files replace tool kinds and inherit the ready timeout") {
    auto dir = codeact::test::temp_dir("config_file");
    auto path = dir / "codeact.json";
    {
        std::ofstream file(path);
        file << R"({
            "port": 3200,
            "ready_timeout_ms": 1500,
            "tools": {
                "echo": {"command": "sh", "args": ["-c", "cat"], "operations": ["ping"]}
            }
        })";
    }

    ServerConfig config;
    config.load_file(path.string());
    CHECK(config.port == 3200);
    REQUIRE(config.tool_kinds.size() == 1);
    CHECK(config.tool_kinds[0].name == "echo");
    CHECK(config.tool_kinds[0].ready_timeout_ms == 1500);

    ServerConfig defaults;
    defaults.apply_json({{"ready_timeout_ms", 900}});
    CHECK(defaults.tool_kinds[0].ready_timeout_ms == 900);
}

TEST_CASE("invalid config files are rejected") {
    auto dir = codeact::test::temp_dir("config_bad");
    auto path = dir / "bad.json";
    {
        std::ofstream file(path);
        file << "{ not json";
    }

    ServerConfig config;
    CHECK_THROWS_AS(config.load_file(path.string()), ConfigError);
    CHECK_THROWS_AS(config.load_file((dir / "missing.json").string()), ConfigError);
    CHECK_THROWS_AS(config.apply_json({{"port", "abc"}}), ConfigError);
    CHECK_THROWS_AS(config.apply_json({{"tools", {1, 2}}}), ConfigError);

    ServerConfig zero;
    zero.execution_timeout_ms = 0;
    CHECK_THROWS_AS(zero.validate(), ConfigError);
}

TEST_CASE("log level names parse with an info fallback") {
    using codeact::util::parse_log_level;
    CHECK(parse_log_level("debug") == spdlog::level::debug);
    CHECK(parse_log_level("warn") == spdlog::level::warn);
    CHECK(parse_log_level("loud") == spdlog::level::info);
}
