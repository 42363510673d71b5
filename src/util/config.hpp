/**
 * codeact server configuration
 *
 * Precedence, lowest first: built-in defaults, .env file, environment
 * variables, JSON config file, command line flags.
 */
#pragma once
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/tool_kind.hpp"

namespace codeact::util {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3001;
    std::string workspace_root = "workspace";

    // Execution sandbox
    int execution_timeout_ms = 5000;
    std::string node_path = "node";
    uint64_t max_old_space_mb = 128;
    size_t execution_history = 200;

    // Worker pools (0 = derive from hardware concurrency)
    unsigned dispatch_threads = 0;
    unsigned execution_threads = 0;

    size_t max_message_bytes = 50 * 1024 * 1024;
    size_t max_outbox_bytes = 16 * 1024 * 1024;

    // Tool processes
    int invoke_timeout_ms = 30000;
    int ready_timeout_ms = 30000;
    std::vector<runtime::ToolKindSpec> tool_kinds = runtime::default_tool_kinds();

    std::string log_level = "info";
    std::string config_file;

    unsigned resolved_dispatch_threads() const;
    unsigned resolved_execution_threads() const;

    // Read PORT, HOST, WORKSPACE_DIR, EXECUTION_TIMEOUT_MS, NODE_PATH_BIN, LOG_LEVEL, CODEACT_CONFIG
    void apply_env();

    // Throws ConfigError on type mismatches or invalid values
    void apply_json(const nlohmann::json& j);
    void load_file(const std::string& path);

    // Throws ConfigError on unknown flags or missing values
    void apply_args(int argc, char** argv);

    void validate() const;

    // Full chain: .env, environment, config file, flags
    static ServerConfig load(int argc, char** argv);
};

// Sets variables from the first .env found (cwd, then next to the executable)
// without overriding ones already present in the environment
void load_dotenv();

} // namespace codeact::util
