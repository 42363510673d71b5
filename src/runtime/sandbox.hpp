/**
 * codeact Sandbox
 *
 * Launches a child process behind stdin/stdout/stderr pipes with
 * rlimit-based resource caps and, when the network is disabled, an
 * empty network namespace. The child leads its own process group so
 * stop() and kill() reach anything it spawns.
 *
 * Namespace creation needs CAP_SYS_ADMIN; without it the sandbox falls
 * back to fork() and reports the degraded isolation.
 */
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace codeact::runtime {

// Resource limits applied with setrlimit() in the child (unset = inherit)
struct ResourceLimits {
    std::optional<uint64_t> cpu_seconds;
    std::optional<uint64_t> max_file_size;   // 0 forbids file writes
    std::optional<uint64_t> max_open_files;
};

// Sandbox configuration
struct SandboxConfig {
    std::string name;                         // Used in log lines only
    std::string working_dir;                  // Empty = inherit
    ResourceLimits limits;

    bool enable_network = true;               // false = new network namespace
    bool inherit_environment = true;          // false = start from an empty environment
    std::vector<std::pair<std::string, std::string>> env;
};

enum class SandboxState {
    CREATED,
    RUNNING,
    STOPPED,
    FAILED
};

const char* sandbox_state_to_string(SandboxState state);

enum class WriteStatus {
    OK,
    CLOSED,      // EPIPE or another write error
    TIMED_OUT    // the child stopped draining its stdin
};

// What isolation is actually in effect for the running child
struct IsolationStatus {
    bool net_namespace = false;
    bool limits_applied = false;
    std::string degraded_reason;

    bool is_degraded() const { return !degraded_reason.empty(); }
};

class Sandbox {
public:
    explicit Sandbox(SandboxConfig config);
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // Returns false (see last_error()) if pipes, clone/fork or exec fail
    bool start(const std::string& command, const std::vector<std::string>& args = {});

    // SIGTERM to the process group, SIGKILL after timeout_ms
    bool stop(int timeout_ms = 5000);

    // Immediate SIGKILL to the process group, then reap
    void kill();

    // Blocks until the child exits; returns its exit code
    int wait();

    // Waits up to timeout_ms; true if the child has exited
    bool wait_for(int timeout_ms);

    // Reaps the child if it has exited
    bool is_running();

    // Writes all of data to the child's stdin, waiting at most timeout_ms
    // (-1 = no limit) for the pipe to drain
    WriteStatus write_stdin(const std::string& data, int timeout_ms = -1);
    void close_stdin();

    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    SandboxState state() const;
    pid_t pid() const { return child_pid_; }
    int exit_code() const;
    const std::string& last_error() const { return last_error_; }
    const IsolationStatus& isolation_status() const { return isolation_status_; }

private:
    SandboxConfig config_;
    SandboxState state_ = SandboxState::CREATED;
    pid_t child_pid_ = -1;
    int exit_code_ = -1;
    bool reaped_ = false;
    mutable std::mutex reap_mutex_;

    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::string last_error_;
    IsolationStatus isolation_status_;

    bool try_reap_locked(bool block);
    void signal_group(int sig);
    void close_fds();
};

/**
 * Splits bytes read from a pipe into newline-terminated lines.
 * A trailing '\r' is stripped from each line.
 */
class LineBuffer {
public:
    // Reads once from fd. Returns bytes read, 0 on EOF, -1 on error.
    ssize_t fill_from(int fd);

    bool next_line(std::string& line);

    // Whatever is left after the last newline
    std::string take_rest();

    size_t pending() const { return buffer_.size(); }

private:
    std::string buffer_;
};

} // namespace codeact::runtime
