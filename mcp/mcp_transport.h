#pragma once

#include "mcp_supervisor.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/// @brief Line-delimited JSON-RPC over each server's stdin/stdout
///
/// Outbound messages are written whole under the session write lock.
/// Inbound stdout lines carrying an id plus result or error are routed to
/// the session's response channel; everything else is discarded.
class MCPTransport {
public:
    explicit MCPTransport(MCPSupervisor& supervisor);

    /// @brief Serialize message as one line to the server's stdin
    /// @return False if the server is not active, the write failed, or the
    ///         pipe stayed full for the request timeout
    bool send(const std::string& name, const nlohmann::json& message);

    /// @brief Send a JSON-RPC notification (no id, no response expected)
    bool notify(const std::string& name, const std::string& method,
                const nlohmann::json& params = nlohmann::json::object());

    /// @brief Send a request and wait for the response carrying its id
    /// @return The response object, or nullopt if the server is not active,
    ///         the write failed, or nothing matched before timeout
    std::optional<nlohmann::json> rpc_request(const std::string& name, const std::string& method,
                                              const nlohmann::json& params,
                                              std::chrono::milliseconds timeout);

    /// @brief Classify one stdout line of a session (reader thread)
    void handle_line(MCPSession& session, const std::string& line);

    /// @brief A JSON object with an id and a result or error member
    static bool is_response(const nlohmann::json& message);

    /// @brief Integer id of a message, nullopt if absent, not an integer or out of range
    static std::optional<int64_t> message_id(const nlohmann::json& message);

    static nlohmann::json create_request(int64_t id, const std::string& method, const nlohmann::json& params);

private:
    bool write_message(MCPSession& session, const nlohmann::json& message,
                       std::chrono::milliseconds timeout);

    MCPSupervisor& supervisor_;
};
