#pragma once
#include <string>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>

namespace codeact::runtime {

// A named category of external tool server and how to launch it
struct ToolKindSpec {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;
    std::string description;
    std::string category;
    std::vector<std::string> operations;   // empty = any operation accepted
    std::string ready_line;                // empty = ready after the grace period
    int ready_timeout_ms = 30000;
    bool enable_network = true;

    bool allows(const std::string& operation) const;

    nlohmann::json to_json() const;
    static ToolKindSpec from_json(const std::string& name, const nlohmann::json& j);
};

// playwright and fetch, launched through docker like the hosted MCP images
std::vector<ToolKindSpec> default_tool_kinds();

} // namespace codeact::runtime
