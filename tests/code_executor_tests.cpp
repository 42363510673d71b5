#include "doctest/doctest.h"
#include "runtime/code_executor.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace codeact::runtime;

namespace {

class CollectingOutput : public OutputChannel {
public:
    void write(const std::string& line) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lines.push_back(line);
    }
    std::vector<std::string> lines;

private:
    std::mutex mutex_;
};

ExecutorConfig quick_config(int timeout_ms = 2000) {
    ExecutorConfig config;
    config.node_path = "node";
    config.timeout_ms = timeout_ms;
    return config;
}

} // namespace

TEST_CASE("language support is case-insensitive") {
    CHECK(CodeExecutor::is_supported("javascript"));
    CHECK(CodeExecutor::is_supported("JS"));
    CHECK_FALSE(CodeExecutor::is_supported("python"));
}

TEST_CASE("console output is streamed and a bare statement has no result") {
    CodeExecutor executor(quick_config());
    CollectingOutput out;

    auto result = executor.execute("console.log(1+1)", "javascript", out);
    CHECK(result.status == ExecutionStatus::COMPLETED);
    REQUIRE(out.lines.size() == 1);
    CHECK(out.lines[0] == "2");
    CHECK(result.output == out.lines);
    CHECK_FALSE(result.result);
    CHECK_FALSE(result.error);
}

TEST_CASE("the final expression becomes the result") {
    CodeExecutor executor(quick_config());
    CollectingOutput out;

    auto number = executor.execute("6 * 7", "js", out);
    REQUIRE(number.result);
    CHECK(*number.result == "42");

    auto object = executor.execute("({a: 1})", "javascript", out);
    REQUIRE(object.result);
    CHECK(*object.result == "{\n  \"a\": 1\n}");

    auto logged = executor.execute("console.log({b: [1]}, 'x')", "javascript", out);
    CHECK(out.lines.back() == "{\n  \"b\": [\n    1\n  ]\n} x");
    CHECK_FALSE(logged.result);
}

TEST_CASE("thrown errors are reported with their message") {
    CodeExecutor executor(quick_config());
    CollectingOutput out;

    auto result = executor.execute("console.log('before'); throw new Error('boom')", "javascript", out);
    CHECK(result.status == ExecutionStatus::FAILED);
    REQUIRE(result.error);
    CHECK(*result.error == "boom");
    CHECK_FALSE(result.result);
    REQUIRE(out.lines.size() == 1);
    CHECK(out.lines[0] == "before");

    auto async = executor.execute("setTimeout(() => { throw new Error('later') }, 10)", "javascript", out);
    REQUIRE(async.error);
    CHECK(*async.error == "later");
}

TEST_CASE("unsupported languages are rejected without launching anything") {
    CodeExecutor executor(quick_config());
    CollectingOutput out;

    auto result = executor.execute("print(1)", "python", out);
    CHECK(result.status == ExecutionStatus::REJECTED);
    REQUIRE(result.error);
    CHECK(*result.error == "Unsupported language: python");
}

TEST_CASE("runaway scripts are stopped at the deadline") {
    CodeExecutor executor(quick_config(500));
    CollectingOutput out;

    auto started = std::chrono::steady_clock::now();
    auto sync = executor.execute("while (true) {}", "javascript", out);
    auto elapsed = std::chrono::steady_clock::now() - started;
    CHECK(sync.status == ExecutionStatus::TIMED_OUT);
    REQUIRE(sync.error);
    CHECK(*sync.error == "Execution timed out after 500ms");
    CHECK(elapsed < std::chrono::milliseconds(3000));

    auto pending = executor.execute("setInterval(() => {}, 10)", "javascript", out);
    CHECK(pending.status == ExecutionStatus::TIMED_OUT);
    REQUIRE(pending.error);
    CHECK(*pending.error == "Execution timed out after 500ms");
}

TEST_CASE("scripts see no host objects") {
    CodeExecutor executor(quick_config());
    CollectingOutput out;

    auto result = executor.execute("typeof require + ',' + typeof process", "javascript", out);
    REQUIRE(result.result);
    CHECK(*result.result == "undefined,undefined");
}

TEST_CASE("console and timers give no path back to the host realm") {
    CodeExecutor executor(quick_config());
    CollectingOutput out;

    auto via_console = executor.execute(
        "const p = console.log.constructor('return process')();"
        "p.getBuiltinModule('fs').readFileSync('/etc/passwd', 'utf8')",
        "javascript", out);
    CHECK(via_console.status == ExecutionStatus::FAILED);
    CHECK_FALSE(via_console.result);
    CHECK(via_console.error);

    auto via_timer = executor.execute("setTimeout.constructor('return process')()", "javascript", out);
    CHECK(via_timer.status == ExecutionStatus::FAILED);
    CHECK_FALSE(via_timer.result);

    auto via_global = executor.execute("this.constructor.constructor('return process')()", "javascript", out);
    CHECK(via_global.status == ExecutionStatus::FAILED);
    CHECK_FALSE(via_global.result);

    auto realm = executor.execute(
        "[console.log, setTimeout, setInterval, clearTimeout].every((f) => f instanceof Function) + ',' +"
        "typeof setTimeout(() => {}, 0)",
        "javascript", out);
    REQUIRE(realm.result);
    CHECK(*realm.result == "true,number");
}

TEST_CASE("timers still run with their arguments and can be cleared") {
    CodeExecutor executor(quick_config());
    CollectingOutput out;

    auto result = executor.execute(
        "setTimeout((a, b) => console.log(a + b), 5, 'x', 'y');"
        "const id = setTimeout(() => console.log('never'), 20); clearTimeout(id);"
        "let n = 0; const t = setInterval(() => { if (++n === 3) { clearInterval(t); console.log('ticks', n); } }, 1);",
        "javascript", out);
    CHECK(result.status == ExecutionStatus::COMPLETED);
    auto lines = out.lines;
    std::sort(lines.begin(), lines.end());
    CHECK(lines == std::vector<std::string>{"ticks 3", "xy"});
}

TEST_CASE("concurrent executions do not share state") {
    CodeExecutor executor(quick_config());

    std::vector<std::thread> threads;
    std::vector<std::string> results(4);
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&executor, &results, i] {
            CollectingOutput out;
            std::string code = "var x = " + std::to_string(i) + "; x";
            auto r = executor.execute(code, "javascript", out);
            results[i] = r.result.value_or("");
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (int i = 0; i < 4; ++i) {
        CHECK(results[i] == std::to_string(i));
    }
}

TEST_CASE("a missing interpreter raises SandboxError") {
    ExecutorConfig config = quick_config();
    config.node_path = "/nonexistent/node-binary";
    CodeExecutor executor(config);
    CollectingOutput out;

    CHECK_THROWS_AS(executor.execute("1", "javascript", out), SandboxError);
}

TEST_CASE("a looping script does not delay a prompt one") {
    CodeExecutor executor(quick_config(1500));

    ExecutionResult looping;
    std::thread loop_thread([&executor, &looping] {
        CollectingOutput out;
        looping = executor.execute("while (true) {}", "javascript", out);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CollectingOutput out;
    auto started = std::chrono::steady_clock::now();
    auto prompt = executor.execute("'done'", "javascript", out);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(prompt.result);
    CHECK(*prompt.result == "done");
    CHECK(elapsed < std::chrono::milliseconds(1500));

    loop_thread.join();
    CHECK(looping.status == ExecutionStatus::TIMED_OUT);
    CHECK_FALSE(looping.result);
}
