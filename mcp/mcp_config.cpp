#include "mcpgroup.h"
#include "mcp_config.h"
#include "../config.h"

#include <fstream>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

const char* tools_state_name(ToolsState state) {
    switch (state) {
        case ToolsState::Declared:   return "declared";
        case ToolsState::Discovered: return "discovered";
        case ToolsState::Unknown:
        default:                     return "unknown";
    }
}

json MCPServerConfig::to_json() const {
    json j = {
        {"name", name},
        {"command", command},
        {"args", args},
        {"env", env},
        {"tools", tools},
        {"tools_state", tools_state_name(tools_state)}
    };

    if (node_modules_path) {
        j["node_modules_path"] = *node_modules_path;
    } else {
        j["node_modules_path"] = nullptr;
    }

    return j;
}

MCPServerConfig MCPServerConfig::from_json(const std::string& name, const json& j) {
    if (!j.is_object()) {
        throw ConfigError("server '" + name + "' must be an object");
    }

    MCPServerConfig entry;
    entry.name = name;

    try {
        if (j.contains("command") && !j["command"].is_null()) {
            entry.command = j["command"].get<std::string>();
        }

        if (j.contains("args") && !j["args"].is_null()) {
            entry.args = j["args"].get<std::vector<std::string>>();
        }

        if (j.contains("env") && !j["env"].is_null()) {
            entry.env = j["env"].get<std::map<std::string, std::string>>();
        }

        if (j.contains("node_modules_path") && !j["node_modules_path"].is_null()) {
            entry.node_modules_path = j["node_modules_path"].get<std::string>();
        }

        if (j.contains("tools") && !j["tools"].is_null()) {
            entry.tools = j["tools"].get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        throw ConfigError("server '" + name + "': " + e.what());
    }

    if (!entry.tools.empty()) {
        entry.tools_state = ToolsState::Declared;
    }

    return entry;
}

void MCPServerRegistry::put(const MCPServerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    servers_[config.name] = config;
}

void MCPServerRegistry::put_all(const MCPServerMap& servers) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, config] : servers) {
        servers_[name] = config;
    }
}

std::optional<MCPServerConfig> MCPServerRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(name);
    if (it == servers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MCPServerRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.count(name) > 0;
}

std::vector<std::string> MCPServerRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(servers_.size());
    for (const auto& pair : servers_) {
        result.push_back(pair.first);
    }
    return result;
}

bool MCPServerRegistry::set_tools(const std::string& name, const std::vector<std::string>& tools,
                                  ToolsState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(name);
    if (it == servers_.end()) {
        return false;
    }
    it->second.tools = tools;
    it->second.tools_state = state;
    return true;
}

size_t MCPServerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.size();
}

void MCPServerRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    servers_.clear();
}

bool MCPConfig::load_file(const std::string& config_path, MCPServerMap& servers) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_DEBUG("No MCP config found at " + config_path);
        return false;
    }

    json config;
    try {
        config = json::parse(file);
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse MCP config from " + config_path + ": " + e.what());
        return false;
    }

    if (!config.is_object()) {
        LOG_ERROR("MCP config " + config_path + " is not a JSON object");
        return false;
    }

    if (!config.contains("servers")) {
        LOG_DEBUG("MCP config " + config_path + " has no servers");
        return true;
    }

    const json& servers_json = config["servers"];
    if (!servers_json.is_object()) {
        LOG_ERROR("MCP config " + config_path + ": 'servers' must be an object");
        return false;
    }

    for (auto it = servers_json.begin(); it != servers_json.end(); ++it) {
        try {
            MCPServerConfig entry = MCPServerConfig::from_json(it.key(), it.value());
            servers[entry.name] = std::move(entry);
            LOG_INFO("Loaded MCP server config from JSON: " + it.key());
        } catch (const ConfigError& e) {
            LOG_ERROR("Skipping MCP server in " + config_path + ": " + e.what());
        }
    }

    return true;
}

std::string MCPConfig::env_prefix(const std::string& server_name) {
    std::string env_name = server_name;
    std::transform(env_name.begin(), env_name.end(), env_name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    std::replace(env_name.begin(), env_name.end(), '-', '_');
    return "MCP_SERVER_" + env_name;
}

bool MCPConfig::load_env_server(const std::string& server_name, MCPServerMap& servers) {
    std::string prefix = env_prefix(server_name);

    std::string command = mcpgroup::get_env(prefix + "_COMMAND");
    if (command.empty()) {
        LOG_WARN("No command found for server " + server_name + " (looked for " + prefix + "_COMMAND)");
        return false;
    }

    MCPServerConfig entry;
    entry.name = server_name;
    entry.command = command;

    std::string args_str = mcpgroup::get_env(prefix + "_ARGS");
    if (!args_str.empty()) {
        try {
            entry.args = json::parse(args_str).get<std::vector<std::string>>();
        } catch (const json::exception& e) {
            LOG_ERROR("Invalid JSON for " + prefix + "_ARGS: " + args_str + " (" + e.what() + ")");
            entry.args.clear();
        }
    }

    std::string env_str = mcpgroup::get_env(prefix + "_ENV");
    if (!env_str.empty()) {
        try {
            entry.env = json::parse(env_str).get<std::map<std::string, std::string>>();
        } catch (const json::exception& e) {
            LOG_ERROR("Invalid JSON for " + prefix + "_ENV: " + env_str + " (" + e.what() + ")");
            entry.env.clear();
        }
    }

    std::string node_modules = mcpgroup::get_env(prefix + "_NODE_MODULES");
    if (!node_modules.empty()) {
        entry.node_modules_path = node_modules;
    }

    servers[server_name] = std::move(entry);
    LOG_INFO("Loaded MCP server config: " + server_name);
    return true;
}

size_t MCPConfig::load_env(MCPServerMap& servers) {
    std::string servers_str = mcpgroup::get_env(SERVERS_ENV);
    if (servers_str.empty()) {
        LOG_INFO(std::string("No ") + SERVERS_ENV + " environment variable found");
        return 0;
    }

    size_t loaded = 0;
    size_t start = 0;
    while (start <= servers_str.size()) {
        size_t comma = servers_str.find(',', start);
        if (comma == std::string::npos) {
            comma = servers_str.size();
        }

        std::string name = servers_str.substr(start, comma - start);
        name.erase(0, name.find_first_not_of(" \t"));
        name.erase(name.find_last_not_of(" \t") + 1);

        if (!name.empty() && load_env_server(name, servers)) {
            loaded++;
        }

        start = comma + 1;
    }

    return loaded;
}

MCPServerMap MCPConfig::resolve(const std::string& explicit_path) {
    MCPServerMap servers;

    for (const auto& path : Config::get_search_paths(explicit_path)) {
        load_file(path, servers);
    }

    // Environment variables have final say
    load_env(servers);

    return servers;
}
