#include "util/config.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace codeact::util {

namespace {

std::string env_string(const char* key) {
    const char* value = std::getenv(key);
    return (value && *value) ? std::string(value) : std::string();
}

long parse_number(const std::string& text, const std::string& what) {
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed != text.size()) {
            throw ConfigError("invalid " + what + ": " + text);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ConfigError("invalid " + what + ": " + text);
    } catch (const std::out_of_range&) {
        throw ConfigError(what + " out of range: " + text);
    }
}

int to_int(long value, const std::string& what) {
    if (value < INT_MIN || value > INT_MAX) {
        throw ConfigError(what + " out of range: " + std::to_string(value));
    }
    return static_cast<int>(value);
}

// Integer config value that must fit an int; anything else is a ConfigError
int json_int(const json& j, const char* key, int fallback) {
    auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(std::string("invalid ") + key + ": " + it->dump());
    }
    return to_int(it->get<long>(), key);
}

uint16_t parse_port(long value) {
    if (value <= 0 || value > 65535) {
        throw ConfigError("port out of range: " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

void load_dotenv() {
    std::vector<std::filesystem::path> search_paths = {
        std::filesystem::current_path() / ".env",
    };

    char exe_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len != -1) {
        exe_path[len] = '\0';
        auto exe_dir = std::filesystem::path(exe_path).parent_path();
        search_paths.push_back(exe_dir / ".env");
        search_paths.push_back(exe_dir.parent_path() / ".env");
    }

    for (const auto& env_path : search_paths) {
        std::error_code ec;
        if (!std::filesystem::exists(env_path, ec)) {
            continue;
        }

        std::ifstream file(env_path);
        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;

            size_t eq_pos = line.find('=');
            if (eq_pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, eq_pos));
            std::string value = trim(line.substr(eq_pos + 1));
            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
            }
        }
        spdlog::debug("Loaded environment from {}", env_path.string());
        return;
    }
}

unsigned ServerConfig::resolved_dispatch_threads() const {
    if (dispatch_threads > 0) return dispatch_threads;
    return std::max(2u, std::thread::hardware_concurrency());
}

unsigned ServerConfig::resolved_execution_threads() const {
    if (execution_threads > 0) return execution_threads;
    return std::max(4u, std::thread::hardware_concurrency());
}

void ServerConfig::apply_env() {
    if (auto v = env_string("PORT"); !v.empty()) {
        port = parse_port(parse_number(v, "PORT"));
    }
    if (auto v = env_string("HOST"); !v.empty()) {
        host = v;
    }
    if (auto v = env_string("WORKSPACE_DIR"); !v.empty()) {
        workspace_root = v;
    }
    if (auto v = env_string("EXECUTION_TIMEOUT_MS"); !v.empty()) {
        execution_timeout_ms = to_int(parse_number(v, "EXECUTION_TIMEOUT_MS"), "EXECUTION_TIMEOUT_MS");
    }
    if (auto v = env_string("NODE_PATH_BIN"); !v.empty()) {
        node_path = v;
    }
    if (auto v = env_string("LOG_LEVEL"); !v.empty()) {
        log_level = v;
    }
    if (auto v = env_string("CODEACT_CONFIG"); !v.empty()) {
        config_file = v;
    }
}

void ServerConfig::apply_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    try {
        host = j.value("host", host);
        if (j.contains("port")) {
            port = parse_port(j["port"].get<long>());
        }
        workspace_root = j.value("workspace", workspace_root);
        execution_timeout_ms = json_int(j, "execution_timeout_ms", execution_timeout_ms);
        node_path = j.value("node_path", node_path);
        max_old_space_mb = j.value("max_old_space_mb", max_old_space_mb);
        execution_history = j.value("execution_history", execution_history);
        dispatch_threads = j.value("dispatch_threads", dispatch_threads);
        execution_threads = j.value("execution_threads", execution_threads);
        max_message_bytes = j.value("max_message_bytes", max_message_bytes);
        max_outbox_bytes = j.value("max_outbox_bytes", max_outbox_bytes);
        invoke_timeout_ms = json_int(j, "invoke_timeout_ms", invoke_timeout_ms);
        ready_timeout_ms = json_int(j, "ready_timeout_ms", ready_timeout_ms);
        log_level = j.value("log_level", log_level);

        if (j.contains("tools")) {
            const auto& tools = j["tools"];
            if (!tools.is_object()) {
                throw ConfigError("\"tools\" must be an object keyed by tool kind");
            }
            std::vector<runtime::ToolKindSpec> kinds;
            for (const auto& [name, spec] : tools.items()) {
                auto kind = runtime::ToolKindSpec::from_json(name, spec);
                if (!spec.contains("ready_timeout_ms")) {
                    kind.ready_timeout_ms = ready_timeout_ms;
                }
                kinds.push_back(std::move(kind));
            }
            tool_kinds = std::move(kinds);
        } else if (j.contains("ready_timeout_ms")) {
            for (auto& kind : tool_kinds) {
                kind.ready_timeout_ms = ready_timeout_ms;
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }
}

void ServerConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigError("config file is not valid JSON: " + path);
    }

    apply_json(j);
    spdlog::debug("Loaded config file {}", path);
}

void ServerConfig::apply_args(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("missing value for " + flag);
            }
            return argv[++i];
        };

        if (flag == "--port") {
            port = parse_port(parse_number(next(), "port"));
        } else if (flag == "--host") {
            host = next();
        } else if (flag == "--workspace") {
            workspace_root = next();
        } else if (flag == "--config") {
            config_file = next();
        } else if (flag == "--log-level") {
            log_level = next();
        } else if (flag == "--timeout") {
            execution_timeout_ms = to_int(parse_number(next(), "timeout"), "timeout");
        } else {
            throw ConfigError("unknown option: " + flag);
        }
    }
}

void ServerConfig::validate() const {
    if (execution_timeout_ms <= 0) {
        throw ConfigError("execution_timeout_ms must be positive");
    }
    if (invoke_timeout_ms <= 0 || ready_timeout_ms <= 0) {
        throw ConfigError("tool timeouts must be positive");
    }
    if (workspace_root.empty()) {
        throw ConfigError("workspace root must not be empty");
    }
    for (const auto& kind : tool_kinds) {
        if (kind.name.empty() || kind.command.empty()) {
            throw ConfigError("tool kind entries need a name and a command");
        }
    }
}

ServerConfig ServerConfig::load(int argc, char** argv) {
    load_dotenv();

    ServerConfig config;
    config.apply_env();

    // Flags are parsed twice: first to find --config, then to override the file
    ServerConfig flags_only;
    flags_only.apply_args(argc, argv);
    if (!flags_only.config_file.empty()) {
        config.config_file = flags_only.config_file;
    }

    if (!config.config_file.empty()) {
        config.load_file(config.config_file);
    }

    config.apply_args(argc, argv);
    config.validate();
    return config;
}

} // namespace codeact::util
