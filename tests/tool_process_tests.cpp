#include "doctest/doctest.h"
#include "test_support.hpp"
#include "runtime/tool_process.hpp"

using namespace codeact::runtime;
using codeact::test::wait_until;

namespace {

// Line-delimited JSON tool server stand-in: answers each tool_call with the
// tool name, reports "fail" as a tool error and exits on "crash"
const char* ECHO_SERVER = R"SH(
echo READY
while IFS= read -r line; do
  id=$(printf '%s\n' "$line" | sed -n 's/.*"id":\([0-9]*\).*/\1/p')
  tool=$(printf '%s\n' "$line" | sed -n 's/.*"tool":"\([^"]*\)".*/\1/p')
  case "$tool" in
    crash) exit 3 ;;
    fail) printf '{"id":%s,"result":null,"error":{"message":"boom"}}\n' "$id" ;;
    *) printf 'noise\n{"id":0,"result":"stale"}\n{"id":%s,"result":{"tool":"%s"},"error":null}\n' "$id" "$tool" ;;
  esac
done
)SH";

ToolKindSpec shell_kind(const std::string& name, const std::string& script) {
    ToolKindSpec kind;
    kind.name = name;
    kind.command = "sh";
    kind.args = {"-c", script};
    kind.ready_line = "READY";
    kind.ready_timeout_ms = 5000;
    kind.enable_network = true;
    return kind;
}

ToolManagerConfig quick_manager() {
    ToolManagerConfig config;
    config.invoke_timeout_ms = 5000;
    config.stop_timeout_ms = 1000;
    config.monitor_interval_ms = 50;
    return config;
}

std::vector<ToolKindSpec> test_kinds() {
    auto echo = shell_kind("echo", ECHO_SERVER);
    echo.operations = {"echo", "fail", "crash"};

    auto flaky = shell_kind("flaky", "echo READY; sleep 0.2; exit 1");

    auto silent = shell_kind("silent", "sleep 10");
    silent.ready_line = "NEVER";
    silent.ready_timeout_ms = 300;

    // Answers with bare {result, error} objects that carry no id
    auto bare = shell_kind("bare",
        "echo READY; while IFS= read -r line; do "
        "printf '{\"log\":\"working\"}\\n{\"result\":\"bare-ok\",\"error\":null}\\n'; done");

    // Never reads its stdin
    auto deaf = shell_kind("deaf", "echo READY; sleep 30");

    return {echo, flaky, silent, bare, deaf};
}

} // namespace

TEST_CASE("tool kinds serialize and parse from config") {
    auto defaults = default_tool_kinds();
    REQUIRE(defaults.size() == 2);
    CHECK(defaults[0].command == "docker");

    auto spec = ToolKindSpec::from_json("echo", {
        {"command", "sh"},
        {"args", {"-c", "cat"}},
        {"operations", {"ping"}},
    });
    CHECK(spec.name == "echo");
    CHECK(spec.allows("ping"));
    CHECK_FALSE(spec.allows("pong"));
    CHECK(spec.to_json()["command"] == "sh");
}

TEST_CASE("a started tool answers invocations by request id") {
    ToolProcessManager manager(test_kinds(), quick_manager());

    auto started = manager.start("echo");
    REQUIRE(started.ok);
    CHECK(started.process_id.rfind("echo-1-", 0) == 0);

    auto process = manager.get(started.process_id);
    REQUIRE(process);
    CHECK(process->wait_ready(5000) == ToolState::RUNNING);

    auto first = manager.invoke(started.process_id, "echo", {{"q", "x"}});
    REQUIRE(first.ok());
    CHECK(first.result["tool"] == "echo");
    CHECK_FALSE(first.error);

    auto second = manager.invoke(started.process_id, "echo", nlohmann::json::object());
    REQUIRE(second.ok());
    CHECK(second.result["tool"] == "echo");

    auto failed = manager.invoke(started.process_id, "fail", nlohmann::json::object());
    REQUIRE(failed.ok());
    CHECK(failed.result.is_null());
    REQUIRE(failed.error);
    CHECK(*failed.error == "boom");

    manager.shutdown();
}

TEST_CASE("invocations are validated before reaching the process") {
    ToolProcessManager manager(test_kinds(), quick_manager());
    auto started = manager.start("echo");
    REQUIRE(started.ok);

    auto missing = manager.invoke("echo-99-deadbeef", "echo", nlohmann::json::object());
    CHECK(missing.status == InvokeStatus::NOT_FOUND);
    CHECK(*missing.error == "Process echo-99-deadbeef not found");

    auto foreign = manager.invoke(started.process_id, "rm", nlohmann::json::object());
    CHECK(foreign.status == InvokeStatus::INVALID_OPERATION);
    CHECK(*foreign.error == "Tool rm does not belong to server echo");

    manager.shutdown();
}

TEST_CASE("unknown kinds are rejected without creating a process") {
    ToolProcessManager manager(test_kinds(), quick_manager());

    auto result = manager.start("nope");
    CHECK_FALSE(result.ok);
    CHECK(result.process_id.empty());
    CHECK(result.error == "Tool kind nope not registered");
    CHECK(manager.list().empty());
}

TEST_CASE("stop is idempotent and unknown ids are reported") {
    ToolProcessManager manager(test_kinds(), quick_manager());
    auto started = manager.start("echo");
    REQUIRE(started.ok);

    CHECK(manager.stop(started.process_id) == StopOutcome::STOPPED);
    CHECK(manager.stop(started.process_id) == StopOutcome::ALREADY_STOPPED);
    CHECK(manager.stop("ghost") == StopOutcome::NOT_FOUND);

    auto status = manager.get(started.process_id)->status();
    CHECK(status.state == ToolState::STOPPED);
    CHECK(manager.live_count() == 0);

    auto after = manager.invoke(started.process_id, "echo", nlohmann::json::object());
    CHECK(after.status == InvokeStatus::NOT_RUNNING);
    CHECK(*after.error == "Process " + started.process_id + " is not running");
}

TEST_CASE("crashed processes move to failed and stay listed") {
    ToolProcessManager manager(test_kinds(), quick_manager());
    manager.start_monitor();

    auto echo = manager.start("echo");
    REQUIRE(echo.ok);
    auto crashed = manager.invoke(echo.process_id, "crash", nlohmann::json::object());
    CHECK(crashed.status == InvokeStatus::NOT_RUNNING);

    auto flaky = manager.start("flaky");
    REQUIRE(flaky.ok);

    REQUIRE(wait_until([&] {
        return manager.get(echo.process_id)->state() == ToolState::FAILED &&
               manager.get(flaky.process_id)->state() == ToolState::FAILED;
    }, 5000));

    auto status = manager.get(flaky.process_id)->status();
    CHECK(status.exit_code == 1);
    CHECK_FALSE(status.error.empty());
    CHECK(manager.list().size() == 2);
    CHECK(manager.stop(flaky.process_id) == StopOutcome::ALREADY_STOPPED);

    manager.shutdown();
}

TEST_CASE("a process that never signals readiness fails after its timeout") {
    ToolProcessManager manager(test_kinds(), quick_manager());
    auto started = manager.start("silent");
    REQUIRE(started.ok);
    CHECK(started.state == ToolState::STARTING);

    auto process = manager.get(started.process_id);
    CHECK(process->wait_ready(3000) == ToolState::FAILED);
    CHECK(process->status().error.find("300ms") != std::string::npos);
}

TEST_CASE("shutdown stops every live process and refuses new ones") {
    ToolProcessManager manager(test_kinds(), quick_manager());
    auto a = manager.start("echo");
    auto b = manager.start("echo");
    REQUIRE(a.ok);
    REQUIRE(b.ok);
    CHECK(a.process_id != b.process_id);

    manager.shutdown();
    manager.shutdown();

    for (const auto& status : manager.list()) {
        CHECK(status.state == ToolState::STOPPED);
    }
    CHECK(manager.live_count() == 0);

    auto late = manager.start("echo");
    CHECK_FALSE(late.ok);
    CHECK(late.error == "Tool manager is shutting down");
}

TEST_CASE("replies without an id answer the request in flight") {
    ToolProcessManager manager(test_kinds(), quick_manager());
    auto started = manager.start("bare");
    REQUIRE(started.ok);
    REQUIRE(manager.get(started.process_id)->wait_ready(5000) == ToolState::RUNNING);

    auto first = manager.invoke(started.process_id, "anything", nlohmann::json::object());
    REQUIRE(first.ok());
    CHECK(first.result == "bare-ok");
    CHECK_FALSE(first.error);

    auto second = manager.invoke(started.process_id, "anything", nlohmann::json::object());
    REQUIRE(second.ok());
    CHECK(second.result == "bare-ok");

    manager.shutdown();
}

TEST_CASE("invocations time out when the tool stops reading its stdin") {
    auto config = quick_manager();
    config.invoke_timeout_ms = 500;
    ToolProcessManager manager(test_kinds(), config);
    auto started = manager.start("deaf");
    REQUIRE(started.ok);
    REQUIRE(manager.get(started.process_id)->wait_ready(5000) == ToolState::RUNNING);

    nlohmann::json args = {{"blob", std::string(1024 * 1024, 'x')}};
    auto begin = std::chrono::steady_clock::now();
    auto result = manager.invoke(started.process_id, "anything", args);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    CHECK(result.status == InvokeStatus::TIMEOUT);
    REQUIRE(result.error);
    CHECK(*result.error == "Tool invocation timed out after 500ms");
    CHECK(elapsed < std::chrono::milliseconds(2500));
    CHECK(manager.get(started.process_id)->state() == ToolState::FAILED);

    manager.shutdown();
}

TEST_CASE("processes started during shutdown are stopped too") {
    ToolProcessManager manager(test_kinds(), quick_manager());
    REQUIRE(manager.start("echo").ok);

    std::thread starter([&manager] {
        for (int i = 0; i < 5; ++i) {
            manager.start("echo");
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    manager.shutdown();
    starter.join();

    for (const auto& status : manager.list()) {
        CHECK(status.state != ToolState::STARTING);
        CHECK(status.state != ToolState::RUNNING);
    }
    CHECK(manager.live_count() == 0);
}
