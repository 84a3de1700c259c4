#include "mcpgroup.h"
#include "mcp_client.h"

#include <algorithm>
#include <signal.h>

using json = nlohmann::json;

MCPClient::MCPClient(const MCPOptions& options)
    : options_(options),
      supervisor_(registry_, options_, shutdown_),
      transport_(supervisor_),
      tools_(registry_, supervisor_, transport_) {
    Logger::instance().configure_from_env();

    // A server dying mid-write must surface as EPIPE, not kill the host
    signal(SIGPIPE, SIG_IGN);

    supervisor_.set_line_handler([this](MCPSession& session, const std::string& line) {
        transport_.handle_line(session, line);
    });
}

MCPClient::~MCPClient() {
    shutdown();
}

size_t MCPClient::load(const std::string& explicit_path) {
    registry_.put_all(MCPConfig::resolve(explicit_path));
    LOG_INFO("MCP client has " + std::to_string(registry_.size()) + " configured servers");
    return registry_.size();
}

void MCPClient::initialize(const std::string& explicit_path, bool autostart) {
    load(explicit_path);

    if (autostart) {
        auto results = start_all_servers();
        size_t started = 0;
        for (const auto& pair : results) {
            if (pair.second) {
                started++;
            }
        }
        LOG_INFO("Started " + std::to_string(started) + " of " + std::to_string(results.size()) +
                 " MCP servers");
        refresh_tools();
    }
}

void MCPClient::add_server(const MCPServerConfig& config) {
    registry_.put(config);
}

std::vector<std::string> MCPClient::list_servers() const {
    return registry_.names();
}

std::vector<std::string> MCPClient::list_active_servers() const {
    return supervisor_.list_active();
}

std::optional<MCPServerConfig> MCPClient::get_server_config(const std::string& name) const {
    return registry_.get(name);
}

bool MCPClient::start_server(const std::string& name) {
    if (shutdown_) {
        LOG_ERROR("MCP client is shut down, not starting " + name);
        return false;
    }
    return supervisor_.start(name);
}

bool MCPClient::stop_server(const std::string& name) {
    return supervisor_.stop(name);
}

std::map<std::string, bool> MCPClient::start_all_servers() {
    if (shutdown_) {
        LOG_ERROR("MCP client is shut down, not starting servers");
        std::map<std::string, bool> results;
        for (const auto& name : registry_.names()) {
            results[name] = false;
        }
        return results;
    }
    return supervisor_.start_all();
}

std::map<std::string, bool> MCPClient::stop_all_servers() {
    return supervisor_.stop_all();
}

bool MCPClient::is_alive(const std::string& name) const {
    return supervisor_.is_alive(name);
}

bool MCPClient::send_message(const std::string& name, const json& message) {
    return transport_.send(name, message);
}

std::optional<json> MCPClient::rpc_request(const std::string& name, const std::string& method,
                                           const json& params) {
    return transport_.rpc_request(name, method, params, options_.request_timeout);
}

std::optional<json> MCPClient::rpc_request(const std::string& name, const std::string& method,
                                           const json& params, std::chrono::milliseconds timeout) {
    return transport_.rpc_request(name, method, params, timeout);
}

std::optional<json> MCPClient::initialize_session(const std::string& name) {
    return tools_.initialize_session(name, options_.request_timeout);
}

std::optional<std::vector<std::string>> MCPClient::discover_tools(const std::string& name) {
    return tools_.discover_tools(name, options_.discovery_timeout);
}

std::optional<std::vector<std::string>> MCPClient::discover_tools(const std::string& name,
                                                                  std::chrono::milliseconds timeout) {
    return tools_.discover_tools(name, timeout);
}

std::optional<std::vector<std::string>> MCPClient::list_tools(const std::string& name) {
    return tools_.list_tools(name, options_.discovery_timeout);
}

std::map<std::string, std::vector<std::string>> MCPClient::refresh_tools() {
    return tools_.refresh_tools(options_.discovery_timeout);
}

std::map<std::string, std::vector<std::string>> MCPClient::refresh_tools(std::chrono::milliseconds timeout) {
    return tools_.refresh_tools(timeout);
}

std::optional<MCPCallResult> MCPClient::call_tool(const std::string& name, const std::string& tool_name,
                                                  const json& arguments) {
    return tools_.call_tool(name, tool_name, arguments, options_.request_timeout);
}

json MCPClient::status() const {
    auto active = supervisor_.list_active();
    json servers = json::array();

    for (const auto& name : registry_.names()) {
        auto config = registry_.get(name);
        if (!config) {
            continue;
        }
        bool is_active = std::find(active.begin(), active.end(), name) != active.end();
        servers.push_back({
            {"name", name},
            {"active", is_active},
            {"command", config->command},
            {"tools", config->tools},
            {"tools_state", tools_state_name(config->tools_state)}
        });
    }

    return json{
        {"servers", servers},
        {"configured", registry_.size()},
        {"active", active.size()}
    };
}

void MCPClient::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }

    LOG_INFO("Shutting down MCP client...");

    // Readers see the flag at their next poll; stop() joins them
    auto results = supervisor_.stop_all();
    for (const auto& pair : results) {
        if (!pair.second) {
            LOG_ERROR("Server " + pair.first + " did not stop cleanly");
        }
    }

    LOG_INFO("MCP client shutdown complete");
}
