#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include "server/workspace_server.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

void print_banner() {
    fmt::print(fg(fmt::color::cyan) | fmt::emphasis::bold,
               "\n    codeact workspace server\n");
    fmt::print(fmt::emphasis::faint,
               "    files, sandboxed JavaScript and tool processes over WebSocket\n\n");
}

void print_status_box(const codeact::util::ServerConfig& config, uint16_t port) {
    fmt::print(fmt::emphasis::bold, "    ┌──────────────────────────────────────────────────┐\n");
    fmt::print("    │  {:<12}{:<37}│\n", "Listen", fmt::format("{}:{}", config.host, port));
    fmt::print("    │  {:<12}{:<37}│\n", "Workspace", config.workspace_root);
    fmt::print("    │  {:<12}{:<37}│\n", "Interpreter", config.node_path);
    fmt::print("    │  {:<12}{:<37}│\n", "Timeout", fmt::format("{}ms", config.execution_timeout_ms));
    fmt::print("    │  {:<12}{:<37}│\n", "Tool kinds", config.tool_kinds.size());
    fmt::print(fmt::emphasis::bold, "    └──────────────────────────────────────────────────┘\n\n");
}

int main(int argc, char** argv) {
    print_banner();

    codeact::util::init_logger();

    codeact::util::ServerConfig config;
    try {
        config = codeact::util::ServerConfig::load(argc, argv);
    } catch (const codeact::util::ConfigError& e) {
        fmt::print(stderr, fg(fmt::color::red), "    ✗  {}\n\n", e.what());
        return 2;
    }
    codeact::util::set_log_level(codeact::util::parse_log_level(config.log_level));

    codeact::server::WorkspaceServer server(config);
    if (!server.init()) {
        fmt::print(stderr, fg(fmt::color::red), "\n    ✗  Failed to initialize server\n\n");
        return 1;
    }

    print_status_box(config, server.port());

    // Blocks until Ctrl+C
    server.run();

    fmt::print(fg(fmt::color::yellow), "\n    ⟳  Shut down gracefully\n\n");
    return 0;
}
