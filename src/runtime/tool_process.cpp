#include "runtime/tool_process.hpp"
#include "util/time_format.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <poll.h>
#include <cerrno>
#include <cstring>
#include <random>

namespace codeact::runtime {

using json = nlohmann::json;

// Response lines kept while nobody is waiting for them
constexpr size_t MAX_PENDING_LINES = 1024;

// ============================================================================
// Utility
// ============================================================================

const char* tool_state_to_string(ToolState state) {
    switch (state) {
        case ToolState::STARTING: return "starting";
        case ToolState::RUNNING:  return "running";
        case ToolState::STOPPED:  return "stopped";
        case ToolState::FAILED:   return "failed";
    }
    return "unknown";
}

const char* stop_outcome_to_string(StopOutcome outcome) {
    switch (outcome) {
        case StopOutcome::STOPPED:         return "stopped";
        case StopOutcome::ALREADY_STOPPED: return "already_stopped";
        case StopOutcome::NOT_FOUND:       return "not_found";
    }
    return "unknown";
}

namespace {

std::string timeout_message(int timeout_ms) {
    return "Tool invocation timed out after " + std::to_string(timeout_ms) + "ms";
}

std::optional<std::string> error_text(const json& response) {
    auto it = response.find("error");
    if (it == response.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_object() && it->contains("message") && (*it)["message"].is_string()) {
        return (*it)["message"].get<std::string>();
    }
    return it->dump();
}

} // namespace

json ToolProcessStatus::to_json() const {
    return {
        {"process_id", process_id},
        {"kind", kind},
        {"status", tool_state_to_string(state)},
        {"pid", pid},
        {"started_at", util::format_iso8601(started_at)},
        {"uptime_seconds", uptime_seconds},
        {"exit_code", exit_code >= 0 ? json(exit_code) : json(nullptr)},
        {"error", error.empty() ? json(nullptr) : json(error)},
    };
}

// ============================================================================
// ToolProcess Implementation
// ============================================================================

ToolProcess::ToolProcess(std::string id, ToolKindSpec kind)
    : id_(std::move(id))
    , kind_(std::move(kind))
    , started_at_(std::chrono::system_clock::now()) {
    spdlog::debug("ToolProcess created: {} (kind={})", id_, kind_.name);
}

ToolProcess::~ToolProcess() {
    stop(1000);
    stopping_ = true;
    if (reader_.joinable()) {
        reader_.join();
    }
}

bool ToolProcess::start() {
    SandboxConfig sandbox_config;
    sandbox_config.name = id_;
    sandbox_config.enable_network = kind_.enable_network;
    sandbox_config.inherit_environment = true;
    sandbox_config.env = kind_.env;

    sandbox_ = std::make_unique<Sandbox>(sandbox_config);
    launched_ = std::chrono::steady_clock::now();
    started_at_ = std::chrono::system_clock::now();

    spdlog::info("Starting tool process {} ({} {})", id_, kind_.name, kind_.command);

    if (!sandbox_->start(kind_.command, kind_.args)) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_locked(sandbox_->last_error());
        return false;
    }

    reader_ = std::thread(&ToolProcess::reader_loop, this);
    return true;
}

void ToolProcess::fail_locked(const std::string& reason) {
    if (state_ == ToolState::STOPPED || state_ == ToolState::FAILED) {
        return;
    }
    spdlog::warn("Tool process {} failed: {}", id_, reason);
    state_ = ToolState::FAILED;
    error_ = reason;
    cv_.notify_all();
}

void ToolProcess::on_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == ToolState::STARTING) {
        if (!kind_.ready_line.empty() && line.rfind(kind_.ready_line, 0) == 0) {
            state_ = ToolState::RUNNING;
            spdlog::info("Tool process {} ready (pid={})", id_, sandbox_->pid());
            cv_.notify_all();
        } else {
            spdlog::debug("[{}] {}", id_, line);
        }
        return;
    }

    if (state_ != ToolState::RUNNING) {
        return;
    }

    lines_.push_back(line);
    if (lines_.size() > MAX_PENDING_LINES) {
        lines_.pop_front();
    }
    cv_.notify_all();
}

void ToolProcess::reader_loop() {
    LineBuffer stdout_lines;
    LineBuffer stderr_lines;
    bool stdout_open = true;
    bool stderr_open = true;
    const auto ready_timeout = std::chrono::milliseconds(kind_.ready_timeout_ms);
    const auto grace = std::chrono::milliseconds(READY_GRACE_MS);

    while (!stopping_ && stdout_open) {
        struct pollfd pfds[2];
        nfds_t count = 0;
        pfds[count++] = {sandbox_->stdout_fd(), POLLIN, 0};
        if (stderr_open) pfds[count++] = {sandbox_->stderr_fd(), POLLIN, 0};

        int ret = poll(pfds, count, 100);
        if (ret < 0 && errno != EINTR) {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_locked(std::string("poll failed: ") + strerror(errno));
            break;
        }

        if (ret > 0) {
            if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                if (stdout_lines.fill_from(pfds[0].fd) <= 0) {
                    stdout_open = false;
                }
                std::string line;
                while (stdout_lines.next_line(line)) {
                    on_line(line);
                }
                if (!stdout_open && stdout_lines.pending() > 0) {
                    on_line(stdout_lines.take_rest());
                }
            }
            if (count > 1 && (pfds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
                if (stderr_lines.fill_from(pfds[1].fd) <= 0) {
                    stderr_open = false;
                }
                std::string line;
                while (stderr_lines.next_line(line)) {
                    spdlog::debug("[{} stderr] {}", id_, line);
                }
            }
        }

        bool kill_now = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == ToolState::STARTING) {
                auto elapsed = std::chrono::steady_clock::now() - launched_;
                if (kind_.ready_line.empty() && elapsed >= grace && sandbox_->is_running()) {
                    state_ = ToolState::RUNNING;
                    spdlog::info("Tool process {} running (pid={})", id_, sandbox_->pid());
                    cv_.notify_all();
                } else if (elapsed >= ready_timeout) {
                    fail_locked("Tool process did not become ready within " +
                                std::to_string(kind_.ready_timeout_ms) + "ms");
                    kill_now = true;
                }
            }
        }
        if (kill_now) {
            sandbox_->kill();
        }
    }

    if (!stopping_) {
        // Give the exit status a moment to become reapable
        sandbox_->wait_for(500);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!stopping_ && (state_ == ToolState::STARTING || state_ == ToolState::RUNNING)) {
        fail_locked("Tool process exited (code " + std::to_string(sandbox_->exit_code()) + ")");
    }
    cv_.notify_all();
}

ToolState ToolProcess::wait_ready(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                 [this] { return state_ != ToolState::STARTING; });
    return state_;
}

ToolState ToolProcess::check_alive() {
    ToolState current = state();
    if (current != ToolState::STARTING && current != ToolState::RUNNING) {
        return current;
    }
    if (stopping_ || !sandbox_ || sandbox_->is_running()) {
        return current;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!stopping_) {
        fail_locked("Tool process exited (code " + std::to_string(sandbox_->exit_code()) + ")");
    }
    return state_;
}

InvokeResult ToolProcess::invoke(const std::string& operation, const json& args, int timeout_ms) {
    std::lock_guard<std::mutex> serial(invoke_mutex_);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    InvokeResult out;

    uint64_t request_id;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return state_ != ToolState::STARTING; });

        if (state_ == ToolState::STARTING) {
            out.status = InvokeStatus::TIMEOUT;
            out.error = timeout_message(timeout_ms);
            return out;
        }
        if (state_ != ToolState::RUNNING) {
            out.status = InvokeStatus::NOT_RUNNING;
            out.error = "Process " + id_ + " is not running";
            return out;
        }

        // Anything left over belongs to an earlier, abandoned request
        lines_.clear();
        request_id = next_request_id_++;
    }

    json request = {
        {"id", request_id},
        {"type", "tool_call"},
        {"tool", operation},
        {"parameters", args.is_null() ? json::object() : args},
        {"timestamp", util::now_iso8601()},
    };

    spdlog::debug("Invoking {} on {} (request {})", operation, id_, request_id);

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) {
        out.status = InvokeStatus::TIMEOUT;
        out.error = timeout_message(timeout_ms);
        return out;
    }

    WriteStatus written = sandbox_->write_stdin(request.dump() + "\n", static_cast<int>(remaining));
    if (written == WriteStatus::TIMED_OUT) {
        // A partial request line leaves the stream unusable for later calls
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_locked("Tool process stopped reading requests");
        }
        sandbox_->kill();
        spdlog::warn("Tool invocation {} on {} timed out writing the request", operation, id_);
        out.status = InvokeStatus::TIMEOUT;
        out.error = timeout_message(timeout_ms);
        return out;
    }
    if (written == WriteStatus::CLOSED) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_locked("stdin closed");
        out.status = InvokeStatus::NOT_RUNNING;
        out.error = "Process " + id_ + " is not running";
        return out;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        while (!lines_.empty()) {
            std::string line = std::move(lines_.front());
            lines_.pop_front();

            json response = json::parse(line, nullptr, false);
            if (response.is_discarded() || !response.is_object()) {
                spdlog::debug("[{}] {}", id_, line);
                continue;
            }
            // Tools that do not echo ids answer with a bare {result, error} object;
            // only one request is ever in flight
            auto id_it = response.find("id");
            if (id_it == response.end()) {
                if (!response.contains("result") && !response.contains("error")) {
                    continue;
                }
            } else if (!id_it->is_number_integer() || id_it->get<uint64_t>() != request_id) {
                continue;
            }

            out.status = InvokeStatus::OK;
            out.result = response.value("result", json(nullptr));
            out.error = error_text(response);
            return out;
        }

        if (state_ != ToolState::RUNNING) {
            out.status = InvokeStatus::NOT_RUNNING;
            out.error = "Process " + id_ + " is not running";
            return out;
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && lines_.empty()) {
            spdlog::warn("Tool invocation {} on {} timed out", operation, id_);
            out.status = InvokeStatus::TIMEOUT;
            out.error = timeout_message(timeout_ms);
            return out;
        }
    }
}

StopOutcome ToolProcess::stop(int timeout_ms) {
    std::lock_guard<std::mutex> serial(stop_mutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ToolState::STARTING && state_ != ToolState::RUNNING) {
            return StopOutcome::ALREADY_STOPPED;
        }
    }

    spdlog::info("Stopping tool process {}", id_);
    stopping_ = true;
    if (sandbox_) {
        sandbox_->stop(timeout_ms);
    }
    if (reader_.joinable()) {
        reader_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ToolState::STOPPED;
    cv_.notify_all();
    spdlog::info("Tool process {} stopped (exit={})", id_, sandbox_ ? sandbox_->exit_code() : -1);
    return StopOutcome::STOPPED;
}

ToolState ToolProcess::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ToolProcessStatus ToolProcess::status() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ToolProcessStatus s;
    s.process_id = id_;
    s.kind = kind_.name;
    s.state = state_;
    s.pid = sandbox_ ? sandbox_->pid() : -1;
    s.started_at = started_at_;
    s.uptime_seconds = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - launched_).count());
    if (state_ == ToolState::STOPPED || state_ == ToolState::FAILED) {
        s.exit_code = sandbox_ ? sandbox_->exit_code() : -1;
    }
    s.error = error_;
    return s;
}

// ============================================================================
// ToolProcessManager Implementation
// ============================================================================

ToolProcessManager::ToolProcessManager(std::vector<ToolKindSpec> kinds, ToolManagerConfig config)
    : kinds_(std::move(kinds))
    , config_(config) {
    spdlog::debug("ToolProcessManager initialized ({} tool kinds)", kinds_.size());
}

ToolProcessManager::~ToolProcessManager() {
    shutdown();
}

const ToolKindSpec* ToolProcessManager::find_kind(const std::string& name) const {
    for (const auto& kind : kinds_) {
        if (kind.name == name) {
            return &kind;
        }
    }
    return nullptr;
}

std::string ToolProcessManager::generate_id(const std::string& kind) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    uint64_t sequence;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sequence = next_sequence_++;
    }
    return fmt::format("{}-{}-{:08x}", kind, sequence, static_cast<uint32_t>(rng()));
}

ToolProcessManager::StartResult ToolProcessManager::start(const std::string& kind) {
    StartResult result;

    const ToolKindSpec* spec = find_kind(kind);
    if (!spec) {
        result.error = "Tool kind " + kind + " not registered";
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            result.error = "Tool manager is shutting down";
            return result;
        }
    }

    std::string id = generate_id(kind);
    auto process = std::make_shared<ToolProcess>(id, *spec);
    bool launched = process->start();

    bool late = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        processes_[id] = process;
        late = shut_down_;
    }
    if (late) {
        // shutdown() may have taken its snapshot before this process was tracked
        spdlog::info("Tool process {} launched during shutdown, stopping it", id);
        process->stop(config_.stop_timeout_ms);
        launched = false;
    }

    auto status = process->status();
    result.ok = launched;
    result.process_id = id;
    result.state = status.state;
    result.error = late ? "Tool manager is shutting down" : status.error;
    return result;
}

StopOutcome ToolProcessManager::stop(const std::string& process_id) {
    auto process = get(process_id);
    if (!process) {
        return StopOutcome::NOT_FOUND;
    }
    return process->stop(config_.stop_timeout_ms);
}

InvokeResult ToolProcessManager::invoke(const std::string& process_id,
                                        const std::string& operation,
                                        const json& args) {
    InvokeResult out;

    auto process = get(process_id);
    if (!process) {
        out.status = InvokeStatus::NOT_FOUND;
        out.error = "Process " + process_id + " not found";
        return out;
    }

    if (!process->kind().allows(operation)) {
        out.status = InvokeStatus::INVALID_OPERATION;
        out.error = "Tool " + operation + " does not belong to server " + process->kind().name;
        return out;
    }

    process->check_alive();
    return process->invoke(operation, args, config_.invoke_timeout_ms);
}

std::shared_ptr<ToolProcess> ToolProcessManager::get(const std::string& process_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(process_id);
    return it != processes_.end() ? it->second : nullptr;
}

std::vector<ToolProcessStatus> ToolProcessManager::list() const {
    std::vector<std::shared_ptr<ToolProcess>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, process] : processes_) {
            snapshot.push_back(process);
        }
    }

    std::vector<ToolProcessStatus> result;
    for (const auto& process : snapshot) {
        result.push_back(process->status());
    }
    return result;
}

size_t ToolProcessManager::live_count() const {
    size_t count = 0;
    for (const auto& status : list()) {
        if (status.state == ToolState::STARTING || status.state == ToolState::RUNNING) {
            ++count;
        }
    }
    return count;
}

void ToolProcessManager::reap() {
    std::vector<std::shared_ptr<ToolProcess>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, process] : processes_) {
            snapshot.push_back(process);
        }
    }
    for (const auto& process : snapshot) {
        process->check_alive();
    }
}

void ToolProcessManager::start_monitor() {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    if (monitor_.joinable()) {
        return;
    }
    monitor_stop_ = false;
    monitor_ = std::thread(&ToolProcessManager::monitor_loop, this);
}

void ToolProcessManager::monitor_loop() {
    std::unique_lock<std::mutex> lock(monitor_mutex_);
    while (!monitor_stop_) {
        monitor_cv_.wait_for(lock, std::chrono::milliseconds(config_.monitor_interval_ms),
                             [this] { return monitor_stop_; });
        if (monitor_stop_) {
            break;
        }
        lock.unlock();
        reap();
        lock.lock();
    }
}

void ToolProcessManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
    }

    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = true;
    }
    monitor_cv_.notify_all();
    if (monitor_.joinable()) {
        monitor_.join();
    }

    std::vector<std::shared_ptr<ToolProcess>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, process] : processes_) {
            snapshot.push_back(process);
        }
    }

    size_t stopped = 0;
    for (const auto& process : snapshot) {
        if (process->stop(config_.stop_timeout_ms) == StopOutcome::STOPPED) {
            ++stopped;
        }
    }
    spdlog::info("Tool manager shut down ({} processes stopped)", stopped);
}

} // namespace codeact::runtime
