#include "mcpgroup.h"
#include "mcp_transport.h"

#include <limits>

using json = nlohmann::json;

MCPTransport::MCPTransport(MCPSupervisor& supervisor)
    : supervisor_(supervisor) {
}

json MCPTransport::create_request(int64_t id, const std::string& method, const json& params) {
    return json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? json::object() : params}
    };
}

bool MCPTransport::is_response(const json& message) {
    return message.is_object() && message.contains("id") &&
           (message.contains("result") || message.contains("error"));
}

std::optional<int64_t> MCPTransport::message_id(const json& message) {
    if (!message.is_object() || !message.contains("id")) {
        return std::nullopt;
    }
    const json& id = message["id"];
    if (id.is_number_unsigned()) {
        uint64_t value = id.get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (id.is_number_integer()) {
        return id.get<int64_t>();
    }
    return std::nullopt;
}

bool MCPTransport::write_message(MCPSession& session, const json& message,
                                 std::chrono::milliseconds timeout) {
    try {
        std::string line = message.dump();
        {
            std::lock_guard<std::mutex> lock(session.write_mutex);
            session.server->write_line(line, timeout);
        }
        if (Logger::instance().is_enabled(LogLevel::DEBUG)) {
            LOG_DEBUG("Sent message to " + session.name + ": " + mcpgroup::truncate_for_log(line));
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to send message to server " + session.name + ": " + e.what());
        return false;
    }
}

bool MCPTransport::send(const std::string& name, const json& message) {
    auto session = supervisor_.find(name);
    if (!session) {
        LOG_ERROR("Server " + name + " not running");
        return false;
    }
    return write_message(*session, message, supervisor_.options().request_timeout);
}

bool MCPTransport::notify(const std::string& name, const std::string& method, const json& params) {
    json notification = {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params.is_null() ? json::object() : params}
    };
    return send(name, notification);
}

std::optional<json> MCPTransport::rpc_request(const std::string& name, const std::string& method,
                                              const json& params, std::chrono::milliseconds timeout) {
    auto session = supervisor_.find(name);
    if (!session) {
        LOG_ERROR("Server " + name + " not running");
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    int64_t request_id = session->allocate_id();
    json request = create_request(request_id, method, params);

    auto matches = [request_id](const json& message) {
        return message_id(message) == request_id;
    };

    std::optional<json> response;
    if (write_message(*session, request, timeout)) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining < std::chrono::milliseconds(0)) {
            remaining = std::chrono::milliseconds(0);
        }
        response = session->responses.wait_for_and_take(matches, remaining);

        if (!response) {
            if (session->stdout_closed) {
                LOG_ERROR("Server " + name + " closed stdout before answering " + method);
            } else {
                LOG_ERROR("Timeout waiting for response from server " + name + " for method " +
                          method + " after " + mcpgroup::format_ms(timeout));
            }
        }
    }

    session->release_id(request_id);
    if (!response) {
        // A reply racing the deadline must not linger in the channel
        session->responses.remove_if(matches);
    }

    return response;
}

void MCPTransport::handle_line(MCPSession& session, const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::exception&) {
        LOG_DEBUG("Non-JSON output from " + session.name + ": " + mcpgroup::truncate_for_log(line));
        return;
    }

    if (!is_response(message)) {
        LOG_DEBUG("Ignoring non-response message from " + session.name + ": " +
                  mcpgroup::truncate_for_log(line));
        return;
    }

    auto id = message_id(message);
    if (!id || !session.is_pending(*id)) {
        LOG_DEBUG("Dropping response with unexpected id " + message["id"].dump() + " from " + session.name);
        return;
    }

    if (Logger::instance().is_enabled(LogLevel::DEBUG)) {
        LOG_DEBUG("MCP response from " + session.name + ": " + mcpgroup::truncate_for_log(line));
    }
    session.responses.push(std::move(message));
}
