#include "ipc/http_api.hpp"
#include "util/time_format.hpp"
#include <spdlog/spdlog.h>

#include <cctype>

namespace codeact::ipc {

using json = nlohmann::json;

constexpr size_t DEFAULT_EXECUTION_LIMIT = 50;

namespace {

HttpReply not_found() {
    return {404, {{"error", "not_found"}}};
}

bool parse_unsigned(const std::string& text, uint64_t& out) {
    if (text.empty() || text.size() > 19) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    out = value;
    return true;
}

// Value of key in "a=1&b=2", empty if absent
std::string query_param(const std::string& query, const std::string& key) {
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t end = query.find('&', pos);
        if (end == std::string::npos) end = query.size();
        std::string pair = query.substr(pos, end - pos);
        size_t eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == key) {
            return pair.substr(eq + 1);
        }
        pos = end + 1;
    }
    return "";
}

} // namespace

HttpApi::HttpApi(const workspace::WorkspaceStore& store,
                 const ConnectionRegistry& registry,
                 const runtime::ToolProcessManager& tools,
                 const runtime::ExecutionLog& history,
                 std::string interpreter)
    : store_(store)
    , registry_(registry)
    , tools_(tools)
    , history_(history)
    , interpreter_(std::move(interpreter)) {}

HttpReply HttpApi::handle(const std::string& method, const std::string& target) const {
    std::string path = target;
    std::string query;
    auto qpos = target.find('?');
    if (qpos != std::string::npos) {
        path = target.substr(0, qpos);
        query = target.substr(qpos + 1);
    }

    spdlog::debug("HTTP {} {}", method, target);

    if (method != "GET") {
        return {405, {{"error", "method_not_allowed"}}};
    }

    if (path == "/api/health") {
        return health(false);
    }
    if (path == "/api/health/detailed") {
        return health(true);
    }
    if (path == "/api/files") {
        return files();
    }
    if (path == "/api/executions") {
        return executions(query);
    }

    const std::string prefix = "/api/executions/";
    if (path.rfind(prefix, 0) == 0) {
        return execution(path.substr(prefix.size()));
    }

    return not_found();
}

HttpReply HttpApi::health(bool detailed) const {
    json body = {
        {"status", "ok"},
        {"timestamp", util::now_iso8601()},
    };
    if (detailed) {
        body["connections"] = registry_.size();
        body["tool_processes"] = tools_.live_count();
        body["workspace"] = store_.root().string();
        body["interpreter"] = interpreter_;
    }
    return {200, body};
}

HttpReply HttpApi::files() const {
    auto result = store_.list_root();
    if (!result.ok()) {
        return {500, {{"error", result.message}}};
    }

    json files = json::array();
    for (const auto& entry : result.entries) {
        files.push_back({
            {"name", entry.name},
            {"type", entry.is_directory ? "directory" : "file"},
        });
    }
    return {200, {{"files", files}}};
}

HttpReply HttpApi::executions(const std::string& query) const {
    size_t limit = DEFAULT_EXECUTION_LIMIT;
    std::string raw_limit = query_param(query, "limit");
    if (!raw_limit.empty()) {
        uint64_t parsed = 0;
        if (!parse_unsigned(raw_limit, parsed)) {
            return {400, {{"error", "invalid_limit"}}};
        }
        limit = static_cast<size_t>(parsed);
    }

    json list = json::array();
    for (const auto& record : history_.recent(limit)) {
        list.push_back(record.to_json());
    }
    return {200, {{"executions", list}}};
}

HttpReply HttpApi::execution(const std::string& id) const {
    uint64_t parsed = 0;
    if (!parse_unsigned(id, parsed)) {
        return not_found();
    }
    auto record = history_.find(parsed);
    if (!record) {
        return not_found();
    }
    return {200, record->to_json()};
}

} // namespace codeact::ipc
