#include "runtime/sandbox.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <sys/resource.h>
#include <poll.h>
#include <sys/wait.h>
#include <sched.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <thread>

extern char** environ;

namespace codeact::runtime {

// Stack size for clone()
constexpr size_t STACK_SIZE = 1024 * 1024; // 1MB

// Highest descriptor closed in the child before exec
constexpr int MAX_INHERITED_FD = 1024;

namespace {

std::once_flag sigpipe_once;

void ignore_sigpipe() {
    std::call_once(sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });
}

// Everything the child needs, prepared before clone()/fork() so the
// child only makes async-signal-safe calls
struct ChildArgs {
    std::vector<std::string> argv_storage;
    std::vector<std::string> envp_storage;
    std::vector<char*> argv;
    std::vector<char*> envp;
    const char* working_dir = nullptr;
    const ResourceLimits* limits = nullptr;

    int stdin_read = -1;
    int stdout_write = -1;
    int stderr_write = -1;
    int error_write = -1;
};

void set_limit(int resource, const std::optional<uint64_t>& value) {
    if (!value) return;
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(*value);
    rl.rlim_max = static_cast<rlim_t>(*value);
    setrlimit(resource, &rl);
}

[[noreturn]] void child_fail(int error_fd) {
    int err = errno;
    ssize_t ignored = write(error_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

int child_entry(void* arg) {
    auto* child = static_cast<ChildArgs*>(arg);

    setsid();

    if (dup2(child->stdin_read, STDIN_FILENO) < 0 ||
        dup2(child->stdout_write, STDOUT_FILENO) < 0 ||
        dup2(child->stderr_write, STDERR_FILENO) < 0) {
        child_fail(child->error_write);
    }

    for (int fd = 3; fd < MAX_INHERITED_FD; ++fd) {
        if (fd != child->error_write) {
            close(fd);
        }
    }

    set_limit(RLIMIT_CPU, child->limits->cpu_seconds);
    set_limit(RLIMIT_FSIZE, child->limits->max_file_size);
    set_limit(RLIMIT_NOFILE, child->limits->max_open_files);

    if (child->working_dir && chdir(child->working_dir) < 0) {
        child_fail(child->error_write);
    }

    execvpe(child->argv[0], child->argv.data(), child->envp.data());
    child_fail(child->error_write);
}

void close_if_open(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

const char* sandbox_state_to_string(SandboxState state) {
    switch (state) {
        case SandboxState::CREATED: return "created";
        case SandboxState::RUNNING: return "running";
        case SandboxState::STOPPED: return "stopped";
        case SandboxState::FAILED:  return "failed";
    }
    return "unknown";
}

// ============================================================================
// Sandbox Implementation
// ============================================================================

Sandbox::Sandbox(SandboxConfig config)
    : config_(std::move(config)) {
    ignore_sigpipe();
}

Sandbox::~Sandbox() {
    if (state() == SandboxState::RUNNING) {
        stop(1000);
    }
    close_fds();
}

bool Sandbox::start(const std::string& command, const std::vector<std::string>& args) {
    if (state_ != SandboxState::CREATED) {
        last_error_ = "sandbox already started";
        spdlog::error("Sandbox {} already started", config_.name);
        return false;
    }

    ChildArgs child;
    child.argv_storage.push_back(command);
    child.argv_storage.insert(child.argv_storage.end(), args.begin(), args.end());
    for (auto& a : child.argv_storage) {
        child.argv.push_back(a.data());
    }
    child.argv.push_back(nullptr);

    if (config_.inherit_environment) {
        for (char** e = environ; e && *e; ++e) {
            child.envp_storage.emplace_back(*e);
        }
    }
    for (const auto& [key, value] : config_.env) {
        child.envp_storage.push_back(key + "=" + value);
    }
    for (auto& e : child.envp_storage) {
        child.envp.push_back(e.data());
    }
    child.envp.push_back(nullptr);

    if (!config_.working_dir.empty()) {
        child.working_dir = config_.working_dir.c_str();
    }
    child.limits = &config_.limits;

    auto fail = [this](std::string message) {
        last_error_ = std::move(message);
        spdlog::error("Sandbox {}: {}", config_.name, last_error_);
        state_ = SandboxState::FAILED;
        return false;
    };

    // in, out, err, exec-error
    int pipes[4][2] = {{-1, -1}, {-1, -1}, {-1, -1}, {-1, -1}};
    for (auto& p : pipes) {
        if (pipe2(p, O_CLOEXEC) < 0) {
            std::string message = std::string("pipe failed: ") + strerror(errno);
            for (auto& q : pipes) {
                close_if_open(q[0]);
                close_if_open(q[1]);
            }
            return fail(message);
        }
    }
    int (&in_pipe)[2] = pipes[0];
    int (&out_pipe)[2] = pipes[1];
    int (&err_pipe)[2] = pipes[2];
    int (&exec_pipe)[2] = pipes[3];

    child.stdin_read = in_pipe[0];
    child.stdout_write = out_pipe[1];
    child.stderr_write = err_pipe[1];
    child.error_write = exec_pipe[1];

    isolation_status_ = IsolationStatus{};
    pid_t pid = -1;

    if (!config_.enable_network) {
        auto stack = std::make_unique<char[]>(STACK_SIZE);
        pid = clone(child_entry, stack.get() + STACK_SIZE, CLONE_NEWNET | SIGCHLD, &child);
        if (pid >= 0) {
            isolation_status_.net_namespace = true;
        } else {
            spdlog::debug("Sandbox {}: clone(CLONE_NEWNET) failed: {}", config_.name, strerror(errno));
            isolation_status_.degraded_reason =
                "clone() failed - no network namespace (need root/CAP_SYS_ADMIN)";
        }
    }

    if (pid < 0) {
        pid = fork();
        if (pid == 0) {
            child_entry(&child);
        }
    }

    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);

    if (pid < 0) {
        std::string message = std::string("fork failed: ") + strerror(errno);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(err_pipe[0]);
        close(exec_pipe[0]);
        return fail(message);
    }

    child_pid_ = pid;
    stdin_fd_ = in_pipe[1];
    fcntl(stdin_fd_, F_SETFL, fcntl(stdin_fd_, F_GETFL) | O_NONBLOCK);
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];

    // The exec pipe closes on a successful exec and carries errno otherwise
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
        {
            std::lock_guard<std::mutex> lock(reap_mutex_);
            try_reap_locked(true);
        }
        close_fds();
        return fail(fmt::format("failed to launch {}: {}", command, strerror(child_errno)));
    }

    isolation_status_.limits_applied = config_.limits.cpu_seconds ||
                                       config_.limits.max_file_size ||
                                       config_.limits.max_open_files;

    {
        std::lock_guard<std::mutex> lock(reap_mutex_);
        state_ = SandboxState::RUNNING;
    }

    if (isolation_status_.is_degraded()) {
        spdlog::warn("Sandbox {} started in DEGRADED MODE (PID={}): {}",
                     config_.name, child_pid_, isolation_status_.degraded_reason);
    } else {
        spdlog::debug("Sandbox {} started (PID={}, netns={})",
                      config_.name, child_pid_, isolation_status_.net_namespace ? "ON" : "OFF");
    }
    return true;
}

bool Sandbox::try_reap_locked(bool block) {
    if (reaped_ || child_pid_ <= 0) {
        return true;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(child_pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return false;
    }

    if (result == child_pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        }
    }

    // ECHILD also lands here: someone else reaped it
    reaped_ = true;
    if (state_ == SandboxState::RUNNING) {
        state_ = SandboxState::STOPPED;
    }
    return true;
}

void Sandbox::signal_group(int sig) {
    if (child_pid_ <= 0) return;
    if (::kill(-child_pid_, sig) < 0 && errno == ESRCH) {
        ::kill(child_pid_, sig);
    }
}

bool Sandbox::is_running() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (state_ != SandboxState::RUNNING) {
        return false;
    }
    return !try_reap_locked(false);
}

bool Sandbox::wait_for(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        {
            std::lock_guard<std::mutex> lock(reap_mutex_);
            if (state_ != SandboxState::RUNNING || try_reap_locked(false)) {
                return true;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int Sandbox::wait() {
    while (!wait_for(1000)) {
    }
    return exit_code();
}

bool Sandbox::stop(int timeout_ms) {
    if (!is_running()) {
        return true;
    }

    spdlog::debug("Stopping sandbox {} (PID={})", config_.name, child_pid_);
    signal_group(SIGTERM);

    if (wait_for(timeout_ms)) {
        spdlog::debug("Sandbox {} stopped (exit={})", config_.name, exit_code());
        return true;
    }

    spdlog::warn("Sandbox {} not responding, sending SIGKILL", config_.name);
    kill();
    return true;
}

void Sandbox::kill() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (state_ != SandboxState::RUNNING || reaped_) {
        return;
    }
    signal_group(SIGKILL);
    try_reap_locked(true);
}

WriteStatus Sandbox::write_stdin(const std::string& data, int timeout_ms) {
    if (stdin_fd_ < 0) return WriteStatus::CLOSED;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = write(stdin_fd_, data.data() + total, data.size() - total);
        if (n >= 0) {
            total += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::debug("Sandbox {}: stdin write failed: {}", config_.name, strerror(errno));
            return WriteStatus::CLOSED;
        }

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                spdlog::debug("Sandbox {}: stdin write timed out after {} of {} bytes",
                              config_.name, total, data.size());
                return WriteStatus::TIMED_OUT;
            }
            wait_ms = static_cast<int>(remaining);
        }

        struct pollfd pfd = {stdin_fd_, POLLOUT, 0};
        if (poll(&pfd, 1, wait_ms) < 0 && errno != EINTR) {
            spdlog::debug("Sandbox {}: poll on stdin failed: {}", config_.name, strerror(errno));
            return WriteStatus::CLOSED;
        }
    }
    return WriteStatus::OK;
}

void Sandbox::close_stdin() {
    close_if_open(stdin_fd_);
}

void Sandbox::close_fds() {
    close_if_open(stdin_fd_);
    close_if_open(stdout_fd_);
    close_if_open(stderr_fd_);
}

SandboxState Sandbox::state() const {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    return state_;
}

int Sandbox::exit_code() const {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    return exit_code_;
}

// ============================================================================
// LineBuffer Implementation
// ============================================================================

ssize_t LineBuffer::fill_from(int fd) {
    char chunk[4096];
    ssize_t n;
    do {
        n = read(fd, chunk, sizeof(chunk));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        buffer_.append(chunk, static_cast<size_t>(n));
    }
    return n;
}

bool LineBuffer::next_line(std::string& line) {
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos) {
        return false;
    }
    line.assign(buffer_, 0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

std::string LineBuffer::take_rest() {
    std::string rest;
    rest.swap(buffer_);
    return rest;
}

} // namespace codeact::runtime
