#include "runtime/tool_kind.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace codeact::runtime {

bool ToolKindSpec::allows(const std::string& operation) const {
    if (operations.empty()) {
        return true;
    }
    return std::find(operations.begin(), operations.end(), operation) != operations.end();
}

json ToolKindSpec::to_json() const {
    json j;
    j["name"] = name;
    j["command"] = command;
    j["args"] = args;
    json env_obj = json::object();
    for (const auto& [key, value] : env) {
        env_obj[key] = value;
    }
    j["env"] = env_obj;
    j["description"] = description;
    j["category"] = category;
    j["operations"] = operations;
    j["ready_line"] = ready_line;
    j["ready_timeout_ms"] = ready_timeout_ms;
    j["enable_network"] = enable_network;
    return j;
}

ToolKindSpec ToolKindSpec::from_json(const std::string& name, const json& j) {
    ToolKindSpec spec;
    spec.name = name;
    spec.command = j.at("command").get<std::string>();
    spec.args = j.value("args", std::vector<std::string>{});
    if (j.contains("env") && j["env"].is_object()) {
        for (const auto& [key, value] : j["env"].items()) {
            spec.env.emplace_back(key, value.get<std::string>());
        }
    }
    spec.description = j.value("description", "");
    spec.category = j.value("category", "");
    spec.operations = j.value("operations", std::vector<std::string>{});
    spec.ready_line = j.value("ready_line", "");
    spec.ready_timeout_ms = j.value("ready_timeout_ms", 30000);
    spec.enable_network = j.value("enable_network", true);
    return spec;
}

std::vector<ToolKindSpec> default_tool_kinds() {
    ToolKindSpec playwright;
    playwright.name = "playwright";
    playwright.command = "docker";
    playwright.args = {"run", "-i", "--rm", "mcp/playwright"};
    playwright.description = "Browser automation with Playwright";
    playwright.category = "browser";
    playwright.operations = {
        "browser_navigate", "browser_click", "browser_type", "browser_snapshot",
        "browser_take_screenshot", "browser_fill_form", "browser_select_option",
        "browser_hover", "browser_drag", "browser_press_key", "browser_wait_for"
    };

    ToolKindSpec fetch;
    fetch.name = "fetch";
    fetch.command = "docker";
    fetch.args = {"run", "-i", "--rm", "mcp/fetch"};
    fetch.description = "Web content fetching and markdown extraction";
    fetch.category = "web";
    fetch.operations = {"fetch"};

    return {playwright, fetch};
}

} // namespace codeact::runtime
