#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <chrono>
#include <optional>

/// @brief How much is known about a server's tool list
enum class ToolsState {
    Unknown,      // never discovered, or discovery failed
    Declared,     // taken from a config file, not confirmed by the server
    Discovered    // answered by tools/list (may be a confirmed empty list)
};

const char* tools_state_name(ToolsState state);

/// @brief Static description of one MCP server
struct MCPServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> node_modules_path;   // <path>/.bin is prepended to PATH
    std::vector<std::string> tools;
    ToolsState tools_state = ToolsState::Unknown;

    nlohmann::json to_json() const;

    /// @brief Build an entry from one value of the "servers" mapping
    /// @throws ConfigError if a field has the wrong type
    static MCPServerConfig from_json(const std::string& name, const nlohmann::json& j);
};

using MCPServerMap = std::map<std::string, MCPServerConfig>;

/// @brief Tunables shared by the supervisor, transport and tool layers
struct MCPOptions {
    std::chrono::milliseconds stop_grace{5000};         // SIGTERM -> SIGKILL
    std::chrono::milliseconds poll_interval{200};       // reader wakeups to check for shutdown
    std::chrono::milliseconds request_timeout{5000};    // rpc_request / call_tool
    std::chrono::milliseconds discovery_timeout{3000};  // tools/list
};

/// @brief Thread-safe name -> MCPServerConfig table
class MCPServerRegistry {
public:
    /// @brief Insert or wholly replace the entry named config.name
    void put(const MCPServerConfig& config);

    /// @brief Wholly replace every entry present in servers
    void put_all(const MCPServerMap& servers);

    std::optional<MCPServerConfig> get(const std::string& name) const;
    bool contains(const std::string& name) const;

    /// @brief Sorted configured names
    std::vector<std::string> names() const;

    /// @brief Overwrite the tool list of one entry
    /// @return False if the server is not configured
    bool set_tools(const std::string& name, const std::vector<std::string>& tools, ToolsState state);

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    MCPServerMap servers_;
};

/// @brief Loads MCP server definitions from JSON files and the environment
///
/// Every source replaces whole entries: a name loaded again from a later
/// source overwrites the earlier entry, no field is merged.
class MCPConfig {
public:
    /// @brief Load the "servers" mapping of a JSON config file into servers
    /// @return True if the file was read and applied. A missing file is
    ///         skipped silently, an unparseable one is logged and leaves
    ///         servers untouched.
    static bool load_file(const std::string& config_path, MCPServerMap& servers);

    /// @brief Load servers named in MCP_SERVERS from MCP_SERVER_<NAME>_* variables
    /// @return Number of entries loaded
    static size_t load_env(MCPServerMap& servers);

    /// @brief Load a single server from MCP_SERVER_<NAME>_* variables
    /// @return False (with a warning) if no command variable is set
    static bool load_env_server(const std::string& server_name, MCPServerMap& servers);

    /// @brief Home config, local config, explicit_path, then environment
    static MCPServerMap resolve(const std::string& explicit_path = "");

    /// @brief "my-server" -> "MCP_SERVER_MY_SERVER"
    static std::string env_prefix(const std::string& server_name);

    static constexpr const char* SERVERS_ENV = "MCP_SERVERS";
};
