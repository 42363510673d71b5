#include "server/workspace_server.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <csignal>
#include <filesystem>
#include <thread>
#include <vector>
#include "ipc/protocol.hpp"

namespace codeact::server {

WorkspaceServer::WorkspaceServer(util::ServerConfig config)
    : config_(std::move(config))
    , signals_(ioc_, SIGINT, SIGTERM) {}

WorkspaceServer::~WorkspaceServer() {
    stop_subsystems();
}

bool WorkspaceServer::init() {
    spdlog::info("Initializing codeact server...");

    store_ = std::make_unique<workspace::WorkspaceStore>(config_.workspace_root);
    std::error_code ec;
    if (!std::filesystem::is_directory(store_->root(), ec)) {
        spdlog::error("Workspace {} is not a usable directory", store_->root().string());
        return false;
    }

    runtime::ExecutorConfig exec_config;
    exec_config.node_path = config_.node_path;
    exec_config.timeout_ms = config_.execution_timeout_ms;
    exec_config.max_old_space_mb = config_.max_old_space_mb;
    executor_ = std::make_unique<runtime::CodeExecutor>(exec_config);
    history_ = std::make_unique<runtime::ExecutionLog>(config_.execution_history);

    runtime::ToolManagerConfig tool_config;
    tool_config.invoke_timeout_ms = config_.invoke_timeout_ms;
    tools_ = std::make_unique<runtime::ToolProcessManager>(config_.tool_kinds, tool_config);

    ipc::HubConfig hub_config;
    hub_config.dispatch_threads = config_.resolved_dispatch_threads();
    hub_config.execution_threads = config_.resolved_execution_threads();
    hub_ = std::make_unique<ipc::ConnectionHub>(registry_, *store_, *executor_, *tools_,
                                                *history_, hub_config);

    http_api_ = std::make_unique<ipc::HttpApi>(*store_, registry_, *tools_, *history_,
                                               config_.node_path);
    ipc::WsLimits ws_limits;
    ws_limits.max_message_bytes = config_.max_message_bytes;
    ws_limits.max_outbox_bytes = config_.max_outbox_bytes;
    ws_server_ = std::make_unique<ipc::WsServer>(ioc_, *hub_, *http_api_, ws_limits);
    if (!ws_server_->listen(config_.host, config_.port)) {
        spdlog::error("Failed to bind {}:{}", config_.host, config_.port);
        return false;
    }

    watcher_ = std::make_unique<workspace::FsWatcher>(
        *store_, [this](const std::string& path, const std::string& content) {
            hub_->broadcast(ipc::events::file_changed(path, content));
        });
    if (!watcher_->start()) {
        spdlog::warn("Filesystem watcher unavailable; file_changed events disabled");
    }

    tools_->start_monitor();

    signals_.async_wait([this](const boost::system::error_code& ec, int signum) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down...", signum);
        shutdown();
    });

    spdlog::info("Server initialized successfully");
    spdlog::info("Workspace: {}", store_->root().string());
    spdlog::info("Interpreter: {} (timeout {}ms)", config_.node_path, config_.execution_timeout_ms);
    spdlog::info("Tool kinds: {}", config_.tool_kinds.size());
    return true;
}

void WorkspaceServer::run() {
    running_ = true;
    spdlog::info("codeact server running on port {}", port());
    spdlog::info("Press Ctrl+C to exit");

    unsigned io_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
    std::vector<std::thread> threads;
    threads.reserve(io_threads - 1);
    for (unsigned i = 1; i < io_threads; ++i) {
        threads.emplace_back([this] { ioc_.run(); });
    }
    ioc_.run();
    for (auto& t : threads) {
        t.join();
    }

    running_ = false;
    stop_subsystems();
    spdlog::info("codeact server stopped");
}

void WorkspaceServer::shutdown() {
    if (ws_server_) {
        ws_server_->stop();
    }
    boost::system::error_code ec;
    signals_.cancel(ec);
    ioc_.stop();
}

uint16_t WorkspaceServer::port() const {
    return ws_server_ ? ws_server_->port() : 0;
}

void WorkspaceServer::stop_subsystems() {
    if (stopped_.exchange(true)) {
        return;
    }
    if (watcher_) {
        watcher_->stop();
    }
    if (ws_server_) {
        ws_server_->stop();
    }
    if (tools_) {
        tools_->shutdown();
    }
    if (hub_) {
        hub_->shutdown();
    }
}

} // namespace codeact::server
