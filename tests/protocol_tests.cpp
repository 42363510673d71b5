#include "doctest/doctest.h"
#include "ipc/protocol.hpp"

using namespace codeact::ipc;

TEST_CASE("decode_request maps wire names onto request structs") {
    auto exec = decode_request(R"({"type":"execute_code","payload":{"code":"1+1"}})");
    REQUIRE(exec.request);
    auto* code = std::get_if<ExecuteCode>(&*exec.request);
    REQUIRE(code);
    CHECK(code->code == "1+1");
    CHECK(code->language == "javascript");

    auto rename = decode_request(
        R"({"type":"rename_file","payload":{"oldPath":"a.txt","newPath":"b/c.txt"}})");
    REQUIRE(rename.request);
    auto* r = std::get_if<RenameFile>(&*rename.request);
    REQUIRE(r);
    CHECK(r->old_path == "a.txt");
    CHECK(r->new_path == "b/c.txt");

    auto list = decode_request(R"({"type":"list_files"})");
    REQUIRE(list.request);
    CHECK(std::get<ListFiles>(*list.request).directory == ".");
    CHECK(std::string(request_type_name(*list.request)) == "list_files");

    auto invoke = decode_request(
        R"({"type":"invoke_tool","payload":{"processId":"fetch-1-0000abcd","operation":"fetch","args":{"url":"http://x"}}})");
    REQUIRE(invoke.request);
    auto& call = std::get<InvokeTool>(*invoke.request);
    CHECK(call.process_id == "fetch-1-0000abcd");
    CHECK(call.args["url"] == "http://x");
}

TEST_CASE("malformed frames are reported as invalid message format") {
    CHECK(decode_request("not json").error == INVALID_MESSAGE_FORMAT);
    CHECK(decode_request("[1,2]").error == INVALID_MESSAGE_FORMAT);
    CHECK(decode_request(R"({"payload":{}})").error == INVALID_MESSAGE_FORMAT);
    CHECK(decode_request(R"({"type":7})").error == INVALID_MESSAGE_FORMAT);
    CHECK(decode_request(R"({"type":"read_file","payload":"a.txt"})").error == INVALID_MESSAGE_FORMAT);
    CHECK(decode_request(R"({"type":"read_file","payload":{}})").error == INVALID_MESSAGE_FORMAT);
    CHECK(decode_request(R"({"type":"write_file","payload":{"filePath":"a","content":3}})").error ==
          INVALID_MESSAGE_FORMAT);
}

TEST_CASE("unknown types name the offending type") {
    auto result = decode_request(R"({"type":"format_disk","payload":{}})");
    CHECK_FALSE(result.request);
    CHECK(result.error == "Unknown message type: format_disk");
}

TEST_CASE("events carry the wire field names") {
    auto result = events::execution_result(std::string("2"), std::nullopt, "javascript");
    CHECK(result["type"] == "execution_result");
    CHECK(result["result"] == "2");
    CHECK(result["error"].is_null());

    auto renamed = events::file_renamed("a", "b");
    CHECK(renamed["oldPath"] == "a");
    CHECK(renamed["newPath"] == "b");

    auto changed = events::file_changed("a.txt", "x");
    CHECK(changed["type"] == "file_changed");
    CHECK(changed["content"] == "x");

    CHECK(events::error("boom")["message"] == "boom");
}
