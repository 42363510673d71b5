/**
 * codeact Tool Processes
 *
 * A ToolProcess wraps one external tool server (for example a docker
 * container speaking line-delimited JSON on stdin/stdout) and tracks it
 * through starting -> running -> {stopped | failed}.
 *
 * ToolProcessManager is the sole owner of every ToolProcess. Ids are never
 * reused; stopped and failed processes stay listed until shutdown.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/sandbox.hpp"
#include "runtime/tool_kind.hpp"

namespace codeact::runtime {

enum class ToolState {
    STARTING,
    RUNNING,
    STOPPED,
    FAILED
};

const char* tool_state_to_string(ToolState state);

enum class StopOutcome {
    STOPPED,            // was starting/running, now stopped
    ALREADY_STOPPED,    // tracked but not live
    NOT_FOUND
};

const char* stop_outcome_to_string(StopOutcome outcome);

enum class InvokeStatus {
    OK,                 // response received; error may still be set by the tool
    NOT_FOUND,
    NOT_RUNNING,
    INVALID_OPERATION,
    TIMEOUT
};

struct InvokeResult {
    InvokeStatus status = InvokeStatus::OK;
    nlohmann::json result;                 // null unless the tool returned one
    std::optional<std::string> error;      // tool error (OK) or failure reason

    bool ok() const { return status == InvokeStatus::OK; }
};

struct ToolProcessStatus {
    std::string process_id;
    std::string kind;
    ToolState state = ToolState::STARTING;
    pid_t pid = -1;
    std::chrono::system_clock::time_point started_at;
    uint64_t uptime_seconds = 0;
    int exit_code = -1;
    std::string error;

    nlohmann::json to_json() const;
};

class ToolProcess {
public:
    static constexpr int READY_GRACE_MS = 250;

    ToolProcess(std::string id, ToolKindSpec kind);
    ~ToolProcess();

    ToolProcess(const ToolProcess&) = delete;
    ToolProcess& operator=(const ToolProcess&) = delete;

    // Launches the process and the reader thread; false if the launch failed
    bool start();

    StopOutcome stop(int timeout_ms = 5000);

    // Sends one tool_call and waits for the response with the same id, or for
    // a reply object that carries no id at all
    InvokeResult invoke(const std::string& operation, const nlohmann::json& args, int timeout_ms);

    // Blocks until the process leaves STARTING or timeout_ms elapses
    ToolState wait_ready(int timeout_ms);

    // Moves a dead child from starting/running to failed
    ToolState check_alive();

    ToolState state() const;
    ToolProcessStatus status() const;
    const std::string& id() const { return id_; }
    const ToolKindSpec& kind() const { return kind_; }

private:
    std::string id_;
    ToolKindSpec kind_;
    std::unique_ptr<Sandbox> sandbox_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ToolState state_ = ToolState::STARTING;
    std::string error_;
    std::deque<std::string> lines_;

    std::mutex invoke_mutex_;
    std::mutex stop_mutex_;
    uint64_t next_request_id_ = 1;

    std::atomic<bool> stopping_{false};
    std::thread reader_;
    std::chrono::steady_clock::time_point launched_;
    std::chrono::system_clock::time_point started_at_;

    void reader_loop();
    void on_line(const std::string& line);
    void fail_locked(const std::string& reason);
};

struct ToolManagerConfig {
    int invoke_timeout_ms = 30000;
    int stop_timeout_ms = 5000;
    int monitor_interval_ms = 200;
};

class ToolProcessManager {
public:
    struct StartResult {
        bool ok = false;
        std::string process_id;       // empty when the kind is unknown
        ToolState state = ToolState::FAILED;
        std::string error;
    };

    explicit ToolProcessManager(std::vector<ToolKindSpec> kinds, ToolManagerConfig config = {});
    ~ToolProcessManager();

    ToolProcessManager(const ToolProcessManager&) = delete;
    ToolProcessManager& operator=(const ToolProcessManager&) = delete;

    StartResult start(const std::string& kind);
    StopOutcome stop(const std::string& process_id);
    InvokeResult invoke(const std::string& process_id,
                        const std::string& operation,
                        const nlohmann::json& args);
    std::vector<ToolProcessStatus> list() const;
    std::shared_ptr<ToolProcess> get(const std::string& process_id) const;

    const ToolKindSpec* find_kind(const std::string& name) const;
    const std::vector<ToolKindSpec>& kinds() const { return kinds_; }
    size_t live_count() const;

    // Crash detection pass over all tracked processes
    void reap();

    // Background reap() every monitor_interval_ms
    void start_monitor();

    // Stops every live process and the monitor; safe to call twice
    void shutdown();

private:
    std::vector<ToolKindSpec> kinds_;
    ToolManagerConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ToolProcess>> processes_;
    uint64_t next_sequence_ = 1;

    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_stop_ = false;
    std::thread monitor_;
    bool shut_down_ = false;

    std::string generate_id(const std::string& kind);
    void monitor_loop();
};

} // namespace codeact::runtime
