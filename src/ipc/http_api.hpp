/**
 * codeact HTTP companion surface
 *
 * Stateless, side-effect-free GET routes served on the WebSocket port:
 *   /api/health, /api/health/detailed, /api/files,
 *   /api/executions[?limit=N], /api/executions/<id>
 */
#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "ipc/connection_hub.hpp"
#include "runtime/execution_log.hpp"
#include "runtime/tool_process.hpp"
#include "workspace/workspace_store.hpp"

namespace codeact::ipc {

struct HttpReply {
    unsigned status = 200;
    nlohmann::json body;
};

class HttpApi {
public:
    HttpApi(const workspace::WorkspaceStore& store,
            const ConnectionRegistry& registry,
            const runtime::ToolProcessManager& tools,
            const runtime::ExecutionLog& history,
            std::string interpreter);

    // target may carry a query string
    HttpReply handle(const std::string& method, const std::string& target) const;

private:
    const workspace::WorkspaceStore& store_;
    const ConnectionRegistry& registry_;
    const runtime::ToolProcessManager& tools_;
    const runtime::ExecutionLog& history_;
    std::string interpreter_;

    HttpReply health(bool detailed) const;
    HttpReply files() const;
    HttpReply executions(const std::string& query) const;
    HttpReply execution(const std::string& id) const;
};

} // namespace codeact::ipc
