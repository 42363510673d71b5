/**
 * codeact Workspace Server
 *
 * Owns and wires every subsystem:
 * - WorkspaceStore + FsWatcher (file changes broadcast to all clients)
 * - CodeExecutor + ExecutionLog (sandboxed JavaScript runs)
 * - ToolProcessManager (docker tool servers)
 * - ConnectionHub + WsServer + HttpApi (WebSocket and HTTP on one port)
 */
#pragma once
#include <atomic>
#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include "ipc/connection_hub.hpp"
#include "ipc/http_api.hpp"
#include "ipc/ws_server.hpp"
#include "runtime/code_executor.hpp"
#include "runtime/execution_log.hpp"
#include "runtime/tool_process.hpp"
#include "util/config.hpp"
#include "workspace/fs_watcher.hpp"
#include "workspace/workspace_store.hpp"

namespace codeact::server {

class WorkspaceServer {
public:
    explicit WorkspaceServer(util::ServerConfig config);
    ~WorkspaceServer();

    WorkspaceServer(const WorkspaceServer&) = delete;
    WorkspaceServer& operator=(const WorkspaceServer&) = delete;

    // Creates the workspace, starts the watcher and binds the listener
    bool init();

    // Blocks until SIGINT/SIGTERM or shutdown()
    void run();

    // Safe to call from any thread, and more than once
    void shutdown();

    bool is_running() const { return running_; }
    uint16_t port() const;

    const util::ServerConfig& config() const { return config_; }
    workspace::WorkspaceStore& store() { return *store_; }

private:
    util::ServerConfig config_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    boost::asio::io_context ioc_;
    boost::asio::signal_set signals_;

    ipc::ConnectionRegistry registry_;
    std::unique_ptr<workspace::WorkspaceStore> store_;
    std::unique_ptr<runtime::CodeExecutor> executor_;
    std::unique_ptr<runtime::ExecutionLog> history_;
    std::unique_ptr<runtime::ToolProcessManager> tools_;
    std::unique_ptr<ipc::ConnectionHub> hub_;
    std::unique_ptr<ipc::HttpApi> http_api_;
    std::unique_ptr<ipc::WsServer> ws_server_;
    std::unique_ptr<workspace::FsWatcher> watcher_;

    void stop_subsystems();
};

} // namespace codeact::server
