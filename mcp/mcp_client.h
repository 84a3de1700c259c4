#pragma once

#include "mcp_config.h"
#include "mcp_server.h"
#include "mcp_supervisor.h"
#include "mcp_transport.h"
#include "mcp_tools.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

/// @brief Supervises a group of stdio MCP servers
///
/// Owns the server configs, the running processes and their reader threads.
/// The host program constructs one and keeps it in scope; destruction (or an
/// explicit shutdown()) stops every server and joins every reader.
///
/// @code
///   MCPClient client;
///   client.initialize("", true);
///   auto result = client.call_tool("files", "read_file", {{"path", "/tmp/x"}});
/// @endcode
class MCPClient {
public:
    explicit MCPClient(const MCPOptions& options = MCPOptions());
    ~MCPClient();

    MCPClient(const MCPClient&) = delete;
    MCPClient& operator=(const MCPClient&) = delete;

    /// @brief Resolve configuration: home, local, explicit_path, environment
    /// @return Number of configured servers afterwards
    size_t load(const std::string& explicit_path = "");

    /// @brief load(), then optionally start everything and refresh tool lists
    void initialize(const std::string& explicit_path = "", bool autostart = false);

    /// @brief Register (or wholly replace) one server definition
    void add_server(const MCPServerConfig& config);

    // Configuration
    std::vector<std::string> list_servers() const;
    std::vector<std::string> list_active_servers() const;
    std::optional<MCPServerConfig> get_server_config(const std::string& name) const;

    // Lifecycle
    bool start_server(const std::string& name);
    bool stop_server(const std::string& name);
    std::map<std::string, bool> start_all_servers();
    std::map<std::string, bool> stop_all_servers();
    bool is_alive(const std::string& name) const;

    // Protocol
    bool send_message(const std::string& name, const nlohmann::json& message);
    std::optional<nlohmann::json> rpc_request(const std::string& name, const std::string& method,
                                              const nlohmann::json& params = nlohmann::json::object());
    std::optional<nlohmann::json> rpc_request(const std::string& name, const std::string& method,
                                              const nlohmann::json& params,
                                              std::chrono::milliseconds timeout);
    std::optional<nlohmann::json> initialize_session(const std::string& name);

    // Tools
    std::optional<std::vector<std::string>> discover_tools(const std::string& name);
    std::optional<std::vector<std::string>> discover_tools(const std::string& name,
                                                           std::chrono::milliseconds timeout);
    std::optional<std::vector<std::string>> list_tools(const std::string& name);
    std::map<std::string, std::vector<std::string>> refresh_tools();
    std::map<std::string, std::vector<std::string>> refresh_tools(std::chrono::milliseconds timeout);
    std::optional<MCPCallResult> call_tool(const std::string& name, const std::string& tool_name,
                                           const nlohmann::json& arguments = nlohmann::json::object());

    /// @brief Configured servers with active flag, command and known tools
    nlohmann::json status() const;

    /// @brief Signal readers, stop every server, join every reader. Idempotent.
    void shutdown();

    bool is_shut_down() const { return shutdown_; }
    const MCPOptions& options() const { return options_; }

private:
    MCPOptions options_;
    std::atomic<bool> shutdown_{false};

    MCPServerRegistry registry_;
    MCPSupervisor supervisor_;
    MCPTransport transport_;
    MCPTools tools_;
};
