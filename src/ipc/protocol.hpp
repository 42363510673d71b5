/**
 * codeact Wire Protocol
 *
 * JSON text frames. Inbound: {"type": "...", "payload": {...}}.
 * Outbound events are flat objects with a "type" field.
 *
 * Inbound messages decode into the Request variant; handlers visit it
 * exhaustively, so a new request kind fails to compile until handled.
 */
#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace codeact::ipc {

// ============================================================================
// Requests
// ============================================================================

struct ExecuteCode {
    std::string code;
    std::string language = "javascript";
};

struct ReadFile {
    std::string file_path;
};

struct WriteFile {
    std::string file_path;
    std::string content;
};

struct ListFiles {
    std::string directory = ".";
};

struct CreateFile {
    std::string file_path;
    std::string content;
};

struct DeleteFile {
    std::string file_path;
};

struct RenameFile {
    std::string old_path;
    std::string new_path;
};

struct StartTool {
    std::string kind;
};

struct StopTool {
    std::string process_id;
};

struct ListTools {};

struct InvokeTool {
    std::string process_id;
    std::string operation;
    nlohmann::json args = nlohmann::json::object();
};

using Request = std::variant<
    ExecuteCode,
    ReadFile,
    WriteFile,
    ListFiles,
    CreateFile,
    DeleteFile,
    RenameFile,
    StartTool,
    StopTool,
    ListTools,
    InvokeTool
>;

// Wire name of a request ("execute_code", "read_file", ...)
const char* request_type_name(const Request& request);

struct DecodeResult {
    std::optional<Request> request;
    std::string error;          // set when request is empty
};

constexpr const char* INVALID_MESSAGE_FORMAT = "Invalid message format";

DecodeResult decode_request(const std::string& raw);

// ============================================================================
// Events
// ============================================================================

namespace events {

using json = nlohmann::json;

json console_output(const std::string& output);
json execution_result(const std::optional<std::string>& result,
                      const std::optional<std::string>& error,
                      const std::string& language);
json execution_error(const std::string& error);

json file_content(const std::string& path, const std::string& content);
json file_written(const std::string& path);
json file_created(const std::string& path);
json file_deleted(const std::string& path);
json file_renamed(const std::string& old_path, const std::string& new_path);
json file_list(const json& files, const std::string& directory);
json file_changed(const std::string& path, const std::string& content);

json tool_started(const std::string& process_id, const std::string& kind, const std::string& status);
json tool_stopped(const std::string& process_id, const std::string& outcome);
json tool_list(const json& processes);
json tool_result(const std::string& process_id, const std::string& operation,
                 const json& result, const std::optional<std::string>& error);

json error(const std::string& message);

} // namespace events

} // namespace codeact::ipc
