#include "mcpgroup.h"
#include "mcp_tools.h"

using json = nlohmann::json;

json MCPCallResult::to_json() const {
    if (is_error) {
        return json{{"error", error}};
    }
    return result;
}

MCPTools::MCPTools(MCPServerRegistry& registry, MCPSupervisor& supervisor, MCPTransport& transport)
    : registry_(registry), supervisor_(supervisor), transport_(transport) {
}

std::optional<std::vector<std::string>> MCPTools::parse_tool_names(const json& result) {
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return std::nullopt;
    }

    std::vector<std::string> names;
    for (const auto& tool : result["tools"]) {
        if (tool.is_string()) {
            names.push_back(tool.get<std::string>());
        } else if (tool.is_object()) {
            std::string tool_name;
            if (tool.contains("name") && tool["name"].is_string()) {
                tool_name = tool["name"].get<std::string>();
            }
            if (tool_name.empty() && tool.contains("tool") && tool["tool"].is_string()) {
                tool_name = tool["tool"].get<std::string>();
            }
            if (!tool_name.empty()) {
                names.push_back(tool_name);
            }
        }
    }
    return names;
}

std::optional<std::vector<std::string>> MCPTools::discover_tools(const std::string& name,
                                                                 std::chrono::milliseconds timeout) {
    // First try config-declared tools
    auto config = registry_.get(name);
    if (config && !config->tools.empty()) {
        return config->tools;
    }

    LOG_DEBUG("Listing tools from MCP server: " + name);

    auto response = transport_.rpc_request(name, "tools/list", json::object(), timeout);
    if (!response) {
        return std::nullopt;
    }

    if (response->contains("error")) {
        LOG_WARN("tools/list failed on " + name + ": " + (*response)["error"].dump());
        return std::nullopt;
    }

    auto names = parse_tool_names(response->value("result", json()));
    if (!names) {
        LOG_WARN("Unexpected tools/list result from " + name);
        return std::nullopt;
    }

    LOG_DEBUG("Found " + std::to_string(names->size()) + " tools from: " + name);
    return names;
}

std::map<std::string, std::vector<std::string>> MCPTools::refresh_tools(std::chrono::milliseconds timeout) {
    std::map<std::string, std::vector<std::string>> discovered;

    for (const auto& name : supervisor_.list_active()) {
        auto config = registry_.get(name);
        bool declared = config && !config->tools.empty();

        auto tools = discover_tools(name, timeout);

        ToolsState state = ToolsState::Unknown;
        if (declared) {
            state = config->tools_state;
        } else if (tools) {
            state = ToolsState::Discovered;
        }

        std::vector<std::string> names = tools.value_or(std::vector<std::string>());
        registry_.set_tools(name, names, state);
        discovered[name] = names;
    }

    return discovered;
}

std::optional<MCPCallResult> MCPTools::call_tool(const std::string& name, const std::string& tool_name,
                                                 const json& arguments, std::chrono::milliseconds timeout) {
    LOG_DEBUG("Calling MCP tool '" + tool_name + "' on server: " + name);

    json params = {
        {"name", tool_name},
        {"arguments", arguments.is_null() ? json::object() : arguments}
    };

    auto response = transport_.rpc_request(name, "tools/call", params, timeout);
    if (!response) {
        return std::nullopt;
    }

    MCPCallResult call_result;
    if (response->contains("error")) {
        call_result.is_error = true;
        call_result.error = (*response)["error"];
        LOG_WARN("MCP tool '" + tool_name + "' on " + name + " returned error: " + call_result.error.dump());
    } else if (response->contains("result")) {
        call_result.result = (*response)["result"];
    } else {
        call_result.result = *response;
    }

    return call_result;
}

std::optional<json> MCPTools::initialize_session(const std::string& name, std::chrono::milliseconds timeout) {
    LOG_INFO("Initializing MCP session for server: " + name);

    json init_params = {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", json::object()},
        {"clientInfo", {
            {"name", "mcpgroup"},
            {"version", "1.0.0"}
        }}
    };

    auto response = transport_.rpc_request(name, "initialize", init_params, timeout);
    if (!response) {
        return std::nullopt;
    }

    if (response->contains("error")) {
        LOG_ERROR("MCP initialize failed on " + name + ": " + (*response)["error"].dump());
        return std::nullopt;
    }

    json result = response->value("result", json::object());
    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
        LOG_INFO("Connected to MCP server: " + result["serverInfo"].value("name", "unknown"));
    }

    if (!transport_.notify(name, "notifications/initialized")) {
        return std::nullopt;
    }

    return result;
}
