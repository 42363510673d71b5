#include "runtime/code_executor.hpp"
#include "runtime/sandbox.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>

using json = nlohmann::json;

namespace codeact::runtime {

namespace {

// Runs inside the interpreter process. Reads the script from stdin,
// evaluates it in a fresh vm context and reports over stdout as JSON lines.
// console and the timer functions are defined inside the context and reach
// the host only through a closure over `bridge`, which accepts primitives and
// context functions and never returns a host object. String code generation
// is disabled in the context.
const char* HARNESS = R"JS(
'use strict';
const vm = require('vm');
const fs = require('fs');
const timeout = Number(process.argv[1]) || 5000;
const source = fs.readFileSync(0, 'utf8');

const emit = (msg) => fs.writeSync(1, JSON.stringify(msg) + '\n');
const message = (e) => {
  try {
    return e && e.message !== undefined ? String(e.message) : String(e);
  } catch (_) {
    return 'Script threw a value that cannot be converted to a string';
  }
};

let done = false;
const finish = (result, error, timedOut) => {
  if (done) return;
  done = true;
  emit({ type: 'execution_result', result, error, timedOut: !!timedOut });
  process.exit(0);
};

const timers = new Map();
let nextTimer = 1;
const bridge = (op, a, b, c) => {
  if (op === 'log') {
    if (typeof a === 'string') emit({ type: 'console_output', output: a });
  } else if (op === 'set') {
    if (typeof a !== 'function') return 0;
    const delay = typeof b === 'number' && b > 0 ? b : 0;
    const id = nextTimer++;
    const run = () => {
      if (c !== true) timers.delete(id);
      a();
    };
    timers.set(id, c === true ? setInterval(run, delay) : setTimeout(run, delay));
    return id;
  } else if (op === 'clear') {
    const timer = timers.get(a);
    if (timer !== undefined) {
      clearTimeout(timer);
      timers.delete(a);
    }
  }
  return undefined;
};

const context = vm.createContext(Object.create(null), {
  codeGeneration: { strings: false, wasm: false },
});
const show = vm.runInContext(`(function (bridge) {
  'use strict';
  const show = (v) => (typeof v === 'object' ? JSON.stringify(v, null, 2) : String(v));
  const log = (...args) => bridge('log', args.map(show).join(' '));
  const schedule = (repeat) => (fn, ms, ...rest) =>
    bridge('set', () => fn(...rest), Number(ms), repeat);
  const clear = (id) => { bridge('clear', id); };
  globalThis.console = { log, info: log, warn: log, error: log, debug: log };
  globalThis.setTimeout = schedule(false);
  globalThis.setInterval = schedule(true);
  globalThis.clearTimeout = clear;
  globalThis.clearInterval = clear;
  return show;
})`, context)(bridge);

process.on('uncaughtException', (e) => finish(null, message(e), false));

let result = null;
try {
  const value = new vm.Script(source, { filename: 'script.js' })
    .runInContext(context, { timeout });
  if (value !== undefined) {
    const shown = show(value);
    result = typeof shown === 'string' ? shown : null;
  }
} catch (e) {
  if (e && e.code === 'ERR_SCRIPT_EXECUTION_TIMEOUT') {
    finish(null, 'Execution timed out after ' + timeout + 'ms', true);
  } else {
    finish(null, message(e), false);
  }
}
process.once('beforeExit', () => finish(result, null, false));
)JS";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::string first_line(const std::string& text) {
    auto pos = text.find('\n');
    return pos == std::string::npos ? text : text.substr(0, pos);
}

} // namespace

const char* execution_status_to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::COMPLETED:     return "completed";
        case ExecutionStatus::FAILED:        return "failed";
        case ExecutionStatus::TIMED_OUT:     return "timed_out";
        case ExecutionStatus::REJECTED:      return "rejected";
        case ExecutionStatus::SANDBOX_ERROR: return "sandbox_error";
    }
    return "unknown";
}

CodeExecutor::CodeExecutor(ExecutorConfig config)
    : config_(std::move(config)) {}

bool CodeExecutor::is_supported(const std::string& language) {
    std::string lang = to_lower(language);
    return lang == "javascript" || lang == "js";
}

ExecutionResult CodeExecutor::execute(const std::string& source,
                                      const std::string& language,
                                      OutputChannel& output) const {
    auto started = std::chrono::steady_clock::now();
    ExecutionResult result;

    auto elapsed_ms = [&started]() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    };

    if (!is_supported(language)) {
        result.error = "Unsupported language: " + language;
        result.status = ExecutionStatus::REJECTED;
        return result;
    }

    SandboxConfig sandbox_config;
    sandbox_config.name = "exec";
    sandbox_config.working_dir = "/";
    sandbox_config.enable_network = false;
    sandbox_config.inherit_environment = false;
    sandbox_config.limits.cpu_seconds = static_cast<uint64_t>(config_.timeout_ms / 1000 + 2);
    sandbox_config.limits.max_file_size = 0;
    sandbox_config.limits.max_open_files = 128;

    Sandbox sandbox(sandbox_config);
    std::vector<std::string> args = {
        "--max-old-space-size=" + std::to_string(config_.max_old_space_mb),
        "-e", HARNESS,
        std::to_string(config_.timeout_ms),
    };

    if (!sandbox.start(config_.node_path, args)) {
        throw SandboxError(sandbox.last_error());
    }

    if (sandbox.write_stdin(source, config_.timeout_ms + config_.startup_grace_ms) != WriteStatus::OK) {
        spdlog::debug("Interpreter did not take the whole script (PID={})", sandbox.pid());
    }
    sandbox.close_stdin();

    auto deadline = started + std::chrono::milliseconds(config_.timeout_ms + config_.startup_grace_ms);

    LineBuffer stdout_lines;
    std::string stderr_text;
    bool stdout_open = true;
    bool stderr_open = true;
    bool finished = false;
    bool timed_out = false;

    auto handle_line = [&](const std::string& line) {
        json msg = json::parse(line, nullptr, false);
        if (msg.is_discarded() || !msg.is_object()) {
            spdlog::debug("Interpreter emitted non-protocol line: {}", line);
            return;
        }

        std::string type = msg.value("type", "");
        if (type == "console_output") {
            std::string text = msg.value("output", "");
            result.output.push_back(text);
            output.write(text);
        } else if (type == "execution_result") {
            result.result = optional_string(msg, "result");
            result.error = optional_string(msg, "error");
            if (msg.value("timedOut", false)) {
                result.status = ExecutionStatus::TIMED_OUT;
            } else if (result.error) {
                result.status = ExecutionStatus::FAILED;
            } else {
                result.status = ExecutionStatus::COMPLETED;
            }
            finished = true;
        }
    };

    while (!finished && (stdout_open || stderr_open)) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        struct pollfd pfds[2];
        nfds_t count = 0;
        if (stdout_open) pfds[count++] = {sandbox.stdout_fd(), POLLIN, 0};
        if (stderr_open) pfds[count++] = {sandbox.stderr_fd(), POLLIN, 0};

        int ret = poll(pfds, count, static_cast<int>(std::min<long long>(remaining, 100)));
        if (ret < 0) {
            if (errno == EINTR) continue;
            sandbox.kill();
            throw SandboxError(std::string("poll failed: ") + strerror(errno));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }

            if (pfds[i].fd == sandbox.stdout_fd()) {
                if (stdout_lines.fill_from(pfds[i].fd) <= 0) {
                    stdout_open = false;
                }
                std::string line;
                while (!finished && stdout_lines.next_line(line)) {
                    handle_line(line);
                }
                if (!finished && !stdout_open && stdout_lines.pending() > 0) {
                    handle_line(stdout_lines.take_rest());
                }
            } else {
                char chunk[4096];
                ssize_t n = read(pfds[i].fd, chunk, sizeof(chunk));
                if (n <= 0) {
                    if (n < 0 && errno == EINTR) continue;
                    stderr_open = false;
                } else if (stderr_text.size() < config_.max_stderr_bytes) {
                    stderr_text.append(chunk, static_cast<size_t>(n));
                }
            }
        }
    }

    if (timed_out) {
        sandbox.kill();
        result.result.reset();
        result.error = "Execution timed out after " + std::to_string(config_.timeout_ms) + "ms";
        result.status = ExecutionStatus::TIMED_OUT;
    } else if (finished) {
        if (!sandbox.wait_for(config_.startup_grace_ms)) {
            sandbox.kill();
        }
    } else {
        // Both pipes closed without a result line
        if (!sandbox.wait_for(config_.startup_grace_ms)) {
            sandbox.kill();
        }
        std::string detail = first_line(stderr_text);
        result.result.reset();
        result.error = "Interpreter exited unexpectedly (code " +
                       std::to_string(sandbox.exit_code()) + ")" +
                       (detail.empty() ? "" : ": " + detail);
        result.status = ExecutionStatus::FAILED;
        spdlog::warn("Interpreter exited without a result (exit={})", sandbox.exit_code());
    }

    result.duration_ms = elapsed_ms();
    spdlog::debug("Execution {} in {}ms ({} output lines)",
                  execution_status_to_string(result.status), result.duration_ms, result.output.size());
    return result;
}

} // namespace codeact::runtime
