#include "ipc/connection_hub.hpp"
#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <optional>

namespace codeact::ipc {

using json = nlohmann::json;
namespace asio = boost::asio;

std::string generate_connection_id() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

// ============================================================================
// ConnectionRegistry Implementation
// ============================================================================

std::string ConnectionRegistry::attach(std::shared_ptr<Transport> transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id;
    do {
        id = generate_connection_id();
    } while (connections_.count(id));
    connections_.emplace(id, std::move(transport));
    return id;
}

bool ConnectionRegistry::detach(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.erase(id) > 0;
}

bool ConnectionRegistry::send(const std::string& id, const std::string& text) {
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end()) {
            return false;
        }
        transport = it->second;
    }
    if (!transport->is_open()) {
        return false;
    }
    transport->send_text(text);
    return true;
}

size_t ConnectionRegistry::broadcast(const std::string& text) {
    std::vector<std::shared_ptr<Transport>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(connections_.size());
        for (const auto& [_, transport] : connections_) {
            snapshot.push_back(transport);
        }
    }

    size_t delivered = 0;
    for (const auto& transport : snapshot) {
        if (!transport->is_open()) {
            continue;
        }
        transport->send_text(text);
        ++delivered;
    }
    return delivered;
}

size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

// ============================================================================
// Console output bound to one connection
// ============================================================================

namespace {

class ConnectionOutput : public runtime::OutputChannel {
public:
    ConnectionOutput(ConnectionRegistry& registry, std::string id)
        : registry_(registry), id_(std::move(id)) {}

    void write(const std::string& line) override {
        registry_.send(id_, events::console_output(line).dump());
    }

private:
    ConnectionRegistry& registry_;
    std::string id_;
};

} // namespace

// ============================================================================
// Work posting
// ============================================================================

template <typename Target, typename Fn>
void ConnectionHub::post_guarded(Target& target, const std::string& id, Fn fn) {
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        if (shut_down_) {
            spdlog::debug("Hub shut down, dropping work for {}", id);
            return;
        }
    }
    asio::post(target, [this, id, fn = std::move(fn)]() mutable {
        try {
            fn();
        } catch (const std::exception& e) {
            spdlog::error("Request from {} failed: {}", id, e.what());
            send(id, events::error(e.what()));
        }
    });
}

// ============================================================================
// Request handlers
// ============================================================================

struct ConnectionHub::Dispatch {
    ConnectionHub& hub;
    const std::string& id;

    void reply(const json& event) const { hub.send(id, event); }

    void operator()(const ExecuteCode& request) const {
        std::string conn = id;
        ConnectionHub* self = &hub;
        hub.post_guarded(hub.execution_pool_, id, [self, conn, request] {
            self->run_execution(conn, request);
        });
    }

    void operator()(const ReadFile& request) const {
        auto result = hub.store_.read(request.file_path);
        reply(result.ok() ? events::file_content(request.file_path, result.content)
                          : events::error(result.message));
    }

    void operator()(const WriteFile& request) const {
        auto result = hub.store_.write(request.file_path, request.content);
        reply(result.ok() ? events::file_written(request.file_path)
                          : events::error(result.message));
    }

    void operator()(const ListFiles& request) const {
        auto result = hub.store_.list(request.directory);
        if (!result.ok()) {
            reply(events::error(result.message));
            return;
        }
        json files = json::array();
        for (const auto& entry : result.entries) {
            files.push_back(entry.to_json());
        }
        reply(events::file_list(files, request.directory));
    }

    void operator()(const CreateFile& request) const {
        auto result = hub.store_.create(request.file_path, request.content);
        reply(result.ok() ? events::file_created(request.file_path)
                          : events::error(result.message));
    }

    void operator()(const DeleteFile& request) const {
        auto result = hub.store_.remove(request.file_path);
        reply(result.ok() ? events::file_deleted(request.file_path)
                          : events::error(result.message));
    }

    void operator()(const RenameFile& request) const {
        auto result = hub.store_.rename(request.old_path, request.new_path);
        reply(result.ok() ? events::file_renamed(request.old_path, request.new_path)
                          : events::error(result.message));
    }

    void operator()(const StartTool& request) const {
        std::string conn = id;
        ConnectionHub* self = &hub;
        hub.post_guarded(hub.execution_pool_, id, [self, conn, request] {
            auto result = self->tools_.start(request.kind);
            if (result.ok) {
                self->send(conn, events::tool_started(result.process_id, request.kind,
                                                      runtime::tool_state_to_string(result.state)));
            } else if (result.process_id.empty()) {
                self->send(conn, events::error(result.error));
            } else {
                self->send(conn, events::error("Failed to start tool " + request.kind + ": " + result.error));
            }
        });
    }

    void operator()(const StopTool& request) const {
        std::string conn = id;
        ConnectionHub* self = &hub;
        hub.post_guarded(hub.execution_pool_, id, [self, conn, request] {
            auto outcome = self->tools_.stop(request.process_id);
            self->send(conn, events::tool_stopped(request.process_id,
                                                  runtime::stop_outcome_to_string(outcome)));
        });
    }

    void operator()(const ListTools&) const {
        json processes = json::array();
        for (const auto& status : hub.tools_.list()) {
            processes.push_back(status.to_json());
        }
        reply(events::tool_list(processes));
    }

    void operator()(const InvokeTool& request) const {
        std::string conn = id;
        ConnectionHub* self = &hub;
        hub.post_guarded(hub.execution_pool_, id, [self, conn, request] {
            auto result = self->tools_.invoke(request.process_id, request.operation, request.args);
            if (result.ok()) {
                self->send(conn, events::tool_result(request.process_id, request.operation,
                                                     result.result, result.error));
            } else {
                self->send(conn, events::error(result.error.value_or("Tool invocation failed")));
            }
        });
    }
};

// ============================================================================
// ConnectionHub Implementation
// ============================================================================

ConnectionHub::ConnectionHub(ConnectionRegistry& registry,
                             workspace::WorkspaceStore& store,
                             runtime::CodeExecutor& executor,
                             runtime::ToolProcessManager& tools,
                             runtime::ExecutionLog& history,
                             HubConfig config)
    : registry_(registry)
    , store_(store)
    , executor_(executor)
    , tools_(tools)
    , history_(history)
    , dispatch_pool_(config.dispatch_threads)
    , execution_pool_(config.execution_threads) {
    spdlog::debug("ConnectionHub initialized (dispatch={}, execution={})",
                  config.dispatch_threads, config.execution_threads);
}

ConnectionHub::~ConnectionHub() {
    shutdown();
}

std::string ConnectionHub::attach(std::shared_ptr<Transport> transport) {
    std::string id = registry_.attach(std::move(transport));
    {
        std::lock_guard<std::mutex> lock(strands_mutex_);
        strands_.emplace(id, asio::make_strand(dispatch_pool_));
    }
    spdlog::info("Client connected: {} ({} total)", id, registry_.size());
    return id;
}

void ConnectionHub::detach(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(strands_mutex_);
        strands_.erase(id);
    }
    if (registry_.detach(id)) {
        spdlog::info("Client disconnected: {} ({} total)", id, registry_.size());
    }
}

void ConnectionHub::send(const std::string& id, const json& event) {
    if (!registry_.send(id, event.dump())) {
        spdlog::debug("Dropped {} for closed connection {}", event.value("type", ""), id);
    }
}

void ConnectionHub::broadcast(const json& event) {
    size_t delivered = registry_.broadcast(event.dump());
    spdlog::debug("Broadcast {} to {} connections", event.value("type", ""), delivered);
}

void ConnectionHub::on_message(const std::string& id, std::string raw) {
    std::optional<Strand> strand;
    {
        std::lock_guard<std::mutex> lock(strands_mutex_);
        auto it = strands_.find(id);
        if (it != strands_.end()) {
            strand = it->second;
        }
    }
    if (!strand) {
        spdlog::debug("Dropping frame for unknown connection {}", id);
        return;
    }
    post_guarded(*strand, id, [this, id, raw = std::move(raw)] {
        handle(id, raw);
    });
}

void ConnectionHub::handle(const std::string& id, const std::string& raw) {
    DecodeResult decoded = decode_request(raw);
    if (!decoded.request) {
        spdlog::debug("Rejected message from {}: {}", id, decoded.error);
        send(id, events::error(decoded.error));
        return;
    }

    spdlog::debug("{} from {}", request_type_name(*decoded.request), id);
    try {
        std::visit(Dispatch{*this, id}, *decoded.request);
    } catch (const std::exception& e) {
        spdlog::error("{} from {} failed: {}", request_type_name(*decoded.request), id, e.what());
        send(id, events::error(e.what()));
    }
}

void ConnectionHub::run_execution(const std::string& id, const ExecuteCode& request) {
    runtime::ExecutionRecord record;
    record.connection_id = id;
    record.language = request.language;
    record.started_at = std::chrono::system_clock::now();

    ConnectionOutput output(registry_, id);
    try {
        runtime::ExecutionResult result = executor_.execute(request.code, request.language, output);
        record.status = result.status;
        record.result = result.result;
        record.error = result.error;
        record.duration_ms = result.duration_ms;
        record.output_lines = result.output.size();
        send(id, events::execution_result(result.result, result.error, request.language));
    } catch (const runtime::SandboxError& e) {
        spdlog::error("Sandbox failure for {}: {}", id, e.what());
        record.status = runtime::ExecutionStatus::SANDBOX_ERROR;
        record.error = e.what();
        send(id, events::execution_error(e.what()));
    }

    history_.record(std::move(record));
}

void ConnectionHub::shutdown() {
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
    }
    dispatch_pool_.join();
    execution_pool_.join();
    spdlog::debug("ConnectionHub pools joined");
}

} // namespace codeact::ipc
