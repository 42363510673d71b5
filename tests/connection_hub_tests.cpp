#include "doctest/doctest.h"
#include "test_support.hpp"
#include "ipc/connection_hub.hpp"
#include "workspace/fs_watcher.hpp"

#include <memory>
#include <set>

using namespace codeact;
using codeact::test::RecordingTransport;
using codeact::test::wait_until;

namespace {

// Everything a hub needs, with no tool kinds and a short timeout
struct HubFixture {
    std::filesystem::path root;
    ipc::ConnectionRegistry registry;
    workspace::WorkspaceStore store;
    runtime::CodeExecutor executor;
    runtime::ExecutionLog history;
    runtime::ToolProcessManager tools;
    ipc::ConnectionHub hub;

    explicit HubFixture(const std::string& name)
        : root(codeact::test::temp_dir(name))
        , store(root)
        , executor(runtime::ExecutorConfig{"node", 2000})
        , history(10)
        , tools(std::vector<runtime::ToolKindSpec>{})
        , hub(registry, store, executor, tools, history, ipc::HubConfig{4, 2}) {}
};

} // namespace

TEST_CASE("connection ids are unique uuid strings") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = ipc::generate_connection_id();
        CHECK(id.size() == 36);
        CHECK(id[14] == '4');
        ids.insert(id);
    }
    CHECK(ids.size() == 100);
}

TEST_CASE("registry broadcast skips closed transports") {
    ipc::ConnectionRegistry registry;
    auto a = std::make_shared<RecordingTransport>();
    auto b = std::make_shared<RecordingTransport>();
    auto a_id = registry.attach(a);
    registry.attach(b);
    b->close();

    CHECK(registry.broadcast(R"({"type":"ping"})") == 1);
    CHECK(a->count("ping") == 1);
    CHECK(b->count("ping") == 0);

    CHECK(registry.detach(a_id));
    CHECK_FALSE(registry.detach(a_id));
    CHECK_FALSE(registry.send(a_id, "{}"));
    CHECK(registry.size() == 1);
}

TEST_CASE("file requests round trip through the hub") {
    HubFixture f("hub_files");
    auto client = std::make_shared<RecordingTransport>();
    auto id = f.hub.attach(client);

    f.hub.handle(id, R"({"type":"write_file","payload":{"filePath":"a.txt","content":"hi"}})");
    f.hub.handle(id, R"({"type":"read_file","payload":{"filePath":"a.txt"}})");
    f.hub.handle(id, R"({"type":"list_files","payload":{}})");
    f.hub.handle(id, R"({"type":"rename_file","payload":{"oldPath":"a.txt","newPath":"b.txt"}})");
    f.hub.handle(id, R"({"type":"delete_file","payload":{"filePath":"b.txt"}})");

    auto events = client->events();
    REQUIRE(events.size() == 5);
    CHECK(events[0]["type"] == "file_written");
    CHECK(events[1]["type"] == "file_content");
    CHECK(events[1]["content"] == "hi");
    CHECK(events[2]["type"] == "file_list");
    CHECK(events[2]["files"][0]["name"] == "a.txt");
    CHECK(events[3]["type"] == "file_renamed");
    CHECK(events[4]["type"] == "file_deleted");
}

TEST_CASE("errors go only to the requesting connection") {
    HubFixture f("hub_errors");
    auto alice = std::make_shared<RecordingTransport>();
    auto bob = std::make_shared<RecordingTransport>();
    auto alice_id = f.hub.attach(alice);
    f.hub.attach(bob);

    f.hub.handle(alice_id, "garbage");
    f.hub.handle(alice_id, R"({"type":"read_file","payload":{"filePath":"../../etc/passwd"}})");
    f.hub.handle(alice_id, R"({"type":"nope"})");

    auto events = alice->events();
    REQUIRE(events.size() == 3);
    CHECK(events[0]["message"] == "Invalid message format");
    CHECK(events[1]["message"] == "Failed to read file: path not allowed");
    CHECK(events[2]["message"] == "Unknown message type: nope");
    CHECK(bob->events().empty());
}

TEST_CASE("broadcast reaches every open connection") {
    HubFixture f("hub_broadcast");
    auto a = std::make_shared<RecordingTransport>();
    auto b = std::make_shared<RecordingTransport>();
    f.hub.attach(a);
    auto b_id = f.hub.attach(b);
    f.hub.detach(b_id);

    f.hub.broadcast(ipc::events::file_changed("a.txt", "x"));
    CHECK(a->count("file_changed") == 1);
    CHECK(b->count("file_changed") == 0);
}

TEST_CASE("queued messages are handled on the dispatch pool") {
    HubFixture f("hub_queue");
    auto client = std::make_shared<RecordingTransport>();
    auto id = f.hub.attach(client);

    for (int i = 0; i < 10; ++i) {
        f.hub.on_message(id, R"({"type":"list_files"})");
    }
    CHECK(wait_until([&] { return client->count("file_list") == 10; }));

    f.hub.shutdown();
    f.hub.on_message(id, R"({"type":"list_files"})");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CHECK(client->count("file_list") == 10);
}

TEST_CASE("frames from one connection are handled in arrival order") {
    HubFixture f("hub_order");
    auto client = std::make_shared<RecordingTransport>();
    auto id = f.hub.attach(client);

    const int writes = 20;
    for (int round = 0; round < 10; ++round) {
        for (int i = 0; i < writes; ++i) {
            f.hub.on_message(id, R"({"type":"write_file","payload":{"filePath":"a.txt","content":")" +
                                     std::to_string(i) + R"("}})");
        }
        f.hub.on_message(id, R"({"type":"read_file","payload":{"filePath":"a.txt"}})");

        REQUIRE(wait_until([&] { return client->count("file_content") == static_cast<size_t>(round + 1); }));
        auto events = client->events();
        CHECK(events.back()["type"] == "file_content");
        CHECK(events.back()["content"] == std::to_string(writes - 1));
        CHECK(f.store.read("a.txt").content == std::to_string(writes - 1));
    }
    CHECK(client->count("file_written") == static_cast<size_t>(10 * writes));
}

TEST_CASE("frames for detached connections are dropped") {
    HubFixture f("hub_detached");
    auto client = std::make_shared<RecordingTransport>();
    auto id = f.hub.attach(client);
    f.hub.detach(id);

    f.hub.on_message(id, R"({"type":"write_file","payload":{"filePath":"gone.txt","content":"x"}})");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CHECK(client->events().empty());
    CHECK_FALSE(std::filesystem::exists(f.root / "gone.txt"));
}

TEST_CASE("execute_code streams console output then the result") {
    HubFixture f("hub_exec");
    auto client = std::make_shared<RecordingTransport>();
    auto id = f.hub.attach(client);

    f.hub.on_message(id, R"({"type":"execute_code","payload":{"code":"console.log(1+1)"}})");
    REQUIRE(wait_until([&] { return client->count("execution_result") == 1; }, 10000));

    auto events = client->events();
    REQUIRE(events.size() == 2);
    CHECK(events[0]["type"] == "console_output");
    CHECK(events[0]["output"] == "2");
    CHECK(events[1]["result"].is_null());
    CHECK(events[1]["error"].is_null());
    CHECK(f.history.size() == 1);
}

TEST_CASE("tool requests for unknown kinds and processes fail cleanly") {
    HubFixture f("hub_tools");
    auto client = std::make_shared<RecordingTransport>();
    auto id = f.hub.attach(client);

    f.hub.on_message(id, R"({"type":"start_tool","payload":{"kind":"nope"}})");
    f.hub.on_message(id, R"({"type":"stop_tool","payload":{"processId":"nope-1"}})");
    f.hub.handle(id, R"({"type":"list_tools"})");

    REQUIRE(wait_until([&] { return client->events().size() == 3; }));
    CHECK(client->first("error")["message"] == "Tool kind nope not registered");
    CHECK(client->first("tool_stopped")["outcome"] == "not_found");
    CHECK(client->first("tool_list")["processes"].empty());
}

TEST_CASE("created scripts can be executed by the same client") {
    HubFixture f("hub_roundtrip");
    auto client = std::make_shared<RecordingTransport>();
    auto id = f.hub.attach(client);

    f.hub.handle(id, R"({"type":"create_file","payload":{"filePath":"t.js","content":"console.log(1+1)"}})");
    auto created = client->first("file_created");
    REQUIRE_FALSE(created.is_null());
    CHECK(created["path"] == "t.js");

    f.hub.on_message(id, R"({"type":"execute_code","payload":{"code":"console.log(1+1)","language":"javascript"}})");
    REQUIRE(wait_until([&] { return client->count("execution_result") == 1; }, 10000));
    CHECK(client->first("console_output")["output"] == "2");
}

TEST_CASE("a write by one client reaches every client exactly once") {
    HubFixture f("hub_fidelity");
    workspace::FsWatcher watcher(f.store, [&f](const std::string& path, const std::string& content) {
        f.hub.broadcast(ipc::events::file_changed(path, content));
    });
    REQUIRE(watcher.start());

    auto writer = std::make_shared<RecordingTransport>();
    auto observer = std::make_shared<RecordingTransport>();
    auto writer_id = f.hub.attach(writer);
    f.hub.attach(observer);

    f.hub.handle(writer_id, R"({"type":"write_file","payload":{"filePath":"a.txt","content":"X"}})");
    REQUIRE(wait_until([&] {
        return writer->count("file_changed") >= 1 && observer->count("file_changed") >= 1;
    }));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    CHECK(writer->count("file_changed") == 1);
    CHECK(observer->count("file_changed") == 1);
    auto changed = observer->first("file_changed");
    CHECK(changed["path"] == "a.txt");
    CHECK(changed["content"] == "X");

    watcher.stop();
}
