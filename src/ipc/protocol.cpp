#include "ipc/protocol.hpp"

namespace codeact::ipc {

using json = nlohmann::json;

namespace {

// Throws json::exception when the field is missing or not a string
std::string required(const json& payload, const char* key) {
    return payload.at(key).get<std::string>();
}

std::string optional_field(const json& payload, const char* key, const std::string& fallback) {
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::optional<Request> build(const std::string& type, const json& payload) {
    if (type == "execute_code") {
        return ExecuteCode{required(payload, "code"), optional_field(payload, "language", "javascript")};
    }
    if (type == "read_file") {
        return ReadFile{required(payload, "filePath")};
    }
    if (type == "write_file") {
        return WriteFile{required(payload, "filePath"), required(payload, "content")};
    }
    if (type == "list_files") {
        return ListFiles{optional_field(payload, "directory", ".")};
    }
    if (type == "create_file") {
        return CreateFile{required(payload, "filePath"), optional_field(payload, "content", "")};
    }
    if (type == "delete_file") {
        return DeleteFile{required(payload, "filePath")};
    }
    if (type == "rename_file") {
        return RenameFile{required(payload, "oldPath"), required(payload, "newPath")};
    }
    if (type == "start_tool") {
        return StartTool{required(payload, "kind")};
    }
    if (type == "stop_tool") {
        return StopTool{required(payload, "processId")};
    }
    if (type == "list_tools") {
        return ListTools{};
    }
    if (type == "invoke_tool") {
        InvokeTool request;
        request.process_id = required(payload, "processId");
        request.operation = required(payload, "operation");
        if (payload.contains("args") && !payload["args"].is_null()) {
            request.args = payload["args"];
        }
        return request;
    }
    return std::nullopt;
}

struct TypeName {
    const char* operator()(const ExecuteCode&) const { return "execute_code"; }
    const char* operator()(const ReadFile&) const { return "read_file"; }
    const char* operator()(const WriteFile&) const { return "write_file"; }
    const char* operator()(const ListFiles&) const { return "list_files"; }
    const char* operator()(const CreateFile&) const { return "create_file"; }
    const char* operator()(const DeleteFile&) const { return "delete_file"; }
    const char* operator()(const RenameFile&) const { return "rename_file"; }
    const char* operator()(const StartTool&) const { return "start_tool"; }
    const char* operator()(const StopTool&) const { return "stop_tool"; }
    const char* operator()(const ListTools&) const { return "list_tools"; }
    const char* operator()(const InvokeTool&) const { return "invoke_tool"; }
};

json nullable(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

const char* request_type_name(const Request& request) {
    return std::visit(TypeName{}, request);
}

DecodeResult decode_request(const std::string& raw) {
    DecodeResult out;

    json message = json::parse(raw, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        out.error = INVALID_MESSAGE_FORMAT;
        return out;
    }

    auto type_it = message.find("type");
    if (type_it == message.end() || !type_it->is_string()) {
        out.error = INVALID_MESSAGE_FORMAT;
        return out;
    }
    std::string type = type_it->get<std::string>();

    json payload = json::object();
    auto payload_it = message.find("payload");
    if (payload_it != message.end() && !payload_it->is_null()) {
        if (!payload_it->is_object()) {
            out.error = INVALID_MESSAGE_FORMAT;
            return out;
        }
        payload = *payload_it;
    }

    try {
        out.request = build(type, payload);
    } catch (const json::exception&) {
        out.error = INVALID_MESSAGE_FORMAT;
        return out;
    }

    if (!out.request) {
        out.error = "Unknown message type: " + type;
    }
    return out;
}

// ============================================================================
// Events
// ============================================================================

namespace events {

json console_output(const std::string& output) {
    return {{"type", "console_output"}, {"output", output}};
}

json execution_result(const std::optional<std::string>& result,
                      const std::optional<std::string>& error,
                      const std::string& language) {
    return {
        {"type", "execution_result"},
        {"result", nullable(result)},
        {"error", nullable(error)},
        {"language", language},
    };
}

json execution_error(const std::string& error) {
    return {{"type", "execution_error"}, {"error", error}};
}

json file_content(const std::string& path, const std::string& content) {
    return {{"type", "file_content"}, {"path", path}, {"content", content}};
}

json file_written(const std::string& path) {
    return {{"type", "file_written"}, {"path", path}};
}

json file_created(const std::string& path) {
    return {{"type", "file_created"}, {"path", path}};
}

json file_deleted(const std::string& path) {
    return {{"type", "file_deleted"}, {"path", path}};
}

json file_renamed(const std::string& old_path, const std::string& new_path) {
    return {{"type", "file_renamed"}, {"oldPath", old_path}, {"newPath", new_path}};
}

json file_list(const json& files, const std::string& directory) {
    return {{"type", "file_list"}, {"files", files}, {"directory", directory}};
}

json file_changed(const std::string& path, const std::string& content) {
    return {{"type", "file_changed"}, {"path", path}, {"content", content}};
}

json tool_started(const std::string& process_id, const std::string& kind, const std::string& status) {
    return {{"type", "tool_started"}, {"processId", process_id}, {"kind", kind}, {"status", status}};
}

json tool_stopped(const std::string& process_id, const std::string& outcome) {
    return {{"type", "tool_stopped"}, {"processId", process_id}, {"outcome", outcome}};
}

json tool_list(const json& processes) {
    return {{"type", "tool_list"}, {"processes", processes}};
}

json tool_result(const std::string& process_id, const std::string& operation,
                 const json& result, const std::optional<std::string>& error) {
    return {
        {"type", "tool_result"},
        {"processId", process_id},
        {"operation", operation},
        {"result", result},
        {"error", nullable(error)},
    };
}

json error(const std::string& message) {
    return {{"type", "error"}, {"message", message}};
}

} // namespace events

} // namespace codeact::ipc
