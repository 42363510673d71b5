/**
 * codeact Connection Hub
 *
 * Maps connection ids to transports and routes decoded requests to the
 * workspace store, the code executor and the tool process manager.
 *
 * Requests are handled on a dispatch pool, through one strand per
 * connection so a client's frames run in the order they arrived while
 * different clients proceed in parallel. Executions and tool calls,
 * which may block for seconds, run on a separate execution pool so a hung
 * script never delays file operations or broadcasts.
 */
#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"
#include "runtime/code_executor.hpp"
#include "runtime/execution_log.hpp"
#include "runtime/tool_process.hpp"
#include "workspace/workspace_store.hpp"

namespace codeact::ipc {

// Outbound half of one client connection
class Transport {
public:
    virtual ~Transport() = default;
    virtual bool is_open() const = 0;

    // Queues a text frame; must not block on the network
    virtual void send_text(std::string text) = 0;
};

// 128-bit random id in UUID v4 form
std::string generate_connection_id();

class ConnectionRegistry {
public:
    std::string attach(std::shared_ptr<Transport> transport);
    bool detach(const std::string& id);

    // false if the id is unknown or its transport is closed
    bool send(const std::string& id, const std::string& text);

    // Returns the number of transports the frame was queued on
    size_t broadcast(const std::string& text);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Transport>> connections_;
};

struct HubConfig {
    unsigned dispatch_threads = 2;
    unsigned execution_threads = 4;
};

class ConnectionHub {
public:
    ConnectionHub(ConnectionRegistry& registry,
                  workspace::WorkspaceStore& store,
                  runtime::CodeExecutor& executor,
                  runtime::ToolProcessManager& tools,
                  runtime::ExecutionLog& history,
                  HubConfig config = {});
    ~ConnectionHub();

    ConnectionHub(const ConnectionHub&) = delete;
    ConnectionHub& operator=(const ConnectionHub&) = delete;

    std::string attach(std::shared_ptr<Transport> transport);
    void detach(const std::string& id);

    void send(const std::string& id, const nlohmann::json& event);
    void broadcast(const nlohmann::json& event);

    // Queues the raw frame on the connection's strand; frames for unknown
    // or detached connections are dropped
    void on_message(const std::string& id, std::string raw);

    // Decodes and handles one frame on the calling thread
    void handle(const std::string& id, const std::string& raw);

    // Waits for queued work to finish; no new work is accepted afterwards
    void shutdown();

    ConnectionRegistry& registry() { return registry_; }

private:
    struct Dispatch;
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

    ConnectionRegistry& registry_;
    workspace::WorkspaceStore& store_;
    runtime::CodeExecutor& executor_;
    runtime::ToolProcessManager& tools_;
    runtime::ExecutionLog& history_;

    boost::asio::thread_pool dispatch_pool_;
    boost::asio::thread_pool execution_pool_;

    std::mutex strands_mutex_;
    std::unordered_map<std::string, Strand> strands_;

    std::mutex shutdown_mutex_;
    bool shut_down_ = false;

    template <typename Target, typename Fn>
    void post_guarded(Target& target, const std::string& id, Fn fn);

    void run_execution(const std::string& id, const ExecuteCode& request);
};

} // namespace codeact::ipc
