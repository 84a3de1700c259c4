#pragma once

#include "mcp_config.h"
#include "mcp_supervisor.h"
#include "mcp_transport.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

/// @brief Outcome of a tools/call that got an answer
struct MCPCallResult {
    bool is_error = false;
    nlohmann::json result;   // "result" member, or the whole response if absent
    nlohmann::json error;    // "error" member when is_error

    /// @brief {"error": ...} for failures, the bare result otherwise
    nlohmann::json to_json() const;
};

/// @brief Tool discovery and invocation on top of MCPTransport
class MCPTools {
public:
    MCPTools(MCPServerRegistry& registry, MCPSupervisor& supervisor, MCPTransport& transport);

    /// @brief Names of the tools a server exposes
    /// A non-empty config-declared list is returned without any I/O.
    /// @return Names from tools/list (possibly a confirmed empty list), or
    ///         nullopt when unknown: inactive, timed out, error, bad shape
    std::optional<std::vector<std::string>> discover_tools(const std::string& name,
                                                           std::chrono::milliseconds timeout);

    /// @brief Public alias of discover_tools
    std::optional<std::vector<std::string>> list_tools(const std::string& name,
                                                       std::chrono::milliseconds timeout) {
        return discover_tools(name, timeout);
    }

    /// @brief Discover tools on every active server and store them on its config
    std::map<std::string, std::vector<std::string>> refresh_tools(std::chrono::milliseconds timeout);

    /// @brief tools/call {name: tool_name, arguments}
    /// @return nullopt if the server is not active or did not answer in time
    std::optional<MCPCallResult> call_tool(const std::string& name, const std::string& tool_name,
                                           const nlohmann::json& arguments,
                                           std::chrono::milliseconds timeout);

    /// @brief MCP initialize handshake followed by notifications/initialized
    /// @return The server's initialize result, or nullopt on failure
    std::optional<nlohmann::json> initialize_session(const std::string& name,
                                                     std::chrono::milliseconds timeout);

    /// @brief Tool names from a tools/list result; nullopt if it has no tools array
    static std::optional<std::vector<std::string>> parse_tool_names(const nlohmann::json& result);

    static constexpr const char* PROTOCOL_VERSION = "2024-11-05";

private:
    MCPServerRegistry& registry_;
    MCPSupervisor& supervisor_;
    MCPTransport& transport_;
};
