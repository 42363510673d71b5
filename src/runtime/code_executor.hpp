/**
 * codeact Code Executor
 *
 * Runs one untrusted script per call in a fresh interpreter process.
 * Console output is streamed line by line to an OutputChannel while the
 * script runs; the call returns once the script finishes, fails, or hits
 * the wall-clock deadline.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace codeact::runtime {

// Host-side failure: the interpreter could not be launched at all
class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Writer end of an execution's console stream
class OutputChannel {
public:
    virtual ~OutputChannel() = default;
    virtual void write(const std::string& line) = 0;
};

enum class ExecutionStatus {
    COMPLETED,
    FAILED,         // user program threw or the interpreter died
    TIMED_OUT,
    REJECTED,       // unsupported language, nothing launched
    SANDBOX_ERROR   // set by callers that caught SandboxError
};

const char* execution_status_to_string(ExecutionStatus status);

struct ExecutionResult {
    std::optional<std::string> result;
    std::optional<std::string> error;
    std::vector<std::string> output;
    ExecutionStatus status = ExecutionStatus::COMPLETED;
    uint64_t duration_ms = 0;
};

struct ExecutorConfig {
    std::string node_path = "node";
    int timeout_ms = 5000;
    uint64_t max_old_space_mb = 128;
    int startup_grace_ms = 500;        // added to the host deadline for interpreter startup
    size_t max_stderr_bytes = 16 * 1024;
};

class CodeExecutor {
public:
    explicit CodeExecutor(ExecutorConfig config);

    // "javascript" and "js", case-insensitive
    static bool is_supported(const std::string& language);

    /**
     * Execute source in a fresh interpreter.
     * Never blocks longer than timeout + startup grace.
     * Throws SandboxError only when the interpreter cannot be launched.
     */
    ExecutionResult execute(const std::string& source,
                            const std::string& language,
                            OutputChannel& output) const;

    const ExecutorConfig& config() const { return config_; }

private:
    ExecutorConfig config_;
};

} // namespace codeact::runtime
