#ifndef MCP_STACK_H
#define MCP_STACK_H

#include <gtest/gtest.h>
#include "mcp/mcp_config.h"
#include "mcp/mcp_supervisor.h"
#include "mcp/mcp_transport.h"
#include "mcp/mcp_tools.h"
#include <atomic>
#include <string>
#include <vector>

#ifndef MCP_ECHO_SERVER_PATH
#error "MCP_ECHO_SERVER_PATH must point at the mcp_echo_server test binary"
#endif

namespace test_helpers {

inline const char* echo_server_path() {
    return MCP_ECHO_SERVER_PATH;
}

// Registry, supervisor, transport and tools wired together the way
// MCPClient wires them, with short timeouts so tests stay fast
class MCPStackTest : public ::testing::Test {
protected:
    MCPStackTest()
        : options(short_options()),
          supervisor(registry, options, shutdown),
          transport(supervisor),
          tools(registry, supervisor, transport) {
        supervisor.set_line_handler([this](MCPSession& session, const std::string& line) {
            transport.handle_line(session, line);
        });
    }

    ~MCPStackTest() override {
        supervisor.stop_all();
    }

    static MCPOptions short_options() {
        MCPOptions opts;
        opts.stop_grace = std::chrono::milliseconds(1000);
        opts.poll_interval = std::chrono::milliseconds(50);
        opts.request_timeout = std::chrono::milliseconds(2000);
        opts.discovery_timeout = std::chrono::milliseconds(2000);
        return opts;
    }

    void add_server(const std::string& name, const std::string& command,
                    const std::vector<std::string>& args = {}) {
        MCPServerConfig config;
        config.name = name;
        config.command = command;
        config.args = args;
        registry.put(config);
    }

    void add_echo_server(const std::string& name, const std::vector<std::string>& flags = {}) {
        add_server(name, echo_server_path(), flags);
    }

    MCPOptions options;
    std::atomic<bool> shutdown{false};
    MCPServerRegistry registry;
    MCPSupervisor supervisor;
    MCPTransport transport;
    MCPTools tools;
};

} // namespace test_helpers

#endif // MCP_STACK_H
