#pragma once

#include "mcp_config.h"
#include "mcp_server.h"
#include "../thread_queue.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

/// @brief Everything owned on behalf of one active server name
///
/// The process, its response channel, its request id sequence and its two
/// reader threads live and die together. Removing the session from the
/// supervisor table is the only cleanup path.
struct MCPSession {
    explicit MCPSession(const MCPServerConfig& config);
    ~MCPSession();

    MCPSession(const MCPSession&) = delete;
    MCPSession& operator=(const MCPSession&) = delete;

    /// @brief Next request id, registered as pending until release_id()
    int64_t allocate_id();
    void release_id(int64_t id);
    bool is_pending(int64_t id) const;

    std::string name;
    std::unique_ptr<MCPServer> server;
    ThreadQueue<nlohmann::json> responses;

    mutable std::mutex id_mutex;
    int64_t next_id = 1;
    std::set<int64_t> pending_ids;

    std::mutex write_mutex;             // one outbound line at a time
    std::atomic<bool> ready{false};     // process spawned, readers running
    std::atomic<bool> terminating{false};  // stop() in progress, entry kept until done
    std::atomic<bool> stopping{false};  // readers leave at the next poll
    std::atomic<bool> stdout_closed{false};

    std::thread stdout_reader;
    std::thread stderr_reader;
};

/// @brief Owns the name -> session table; starts, stops and drains servers
class MCPSupervisor {
public:
    /// @brief Receives every stdout line of a session (on its reader thread)
    using LineHandler = std::function<void(MCPSession&, const std::string&)>;

    MCPSupervisor(const MCPServerRegistry& registry, const MCPOptions& options,
                  const std::atomic<bool>& shutdown_flag);
    ~MCPSupervisor();

    MCPSupervisor(const MCPSupervisor&) = delete;
    MCPSupervisor& operator=(const MCPSupervisor&) = delete;

    void set_line_handler(LineHandler handler);

    /// @brief Spawn a configured server
    /// Waits for a stop of the same name that is still running.
    /// @return False if not configured or spawning failed; true if already active
    bool start(const std::string& name);

    /// @brief Terminate a server (SIGTERM, grace period, SIGKILL)
    /// The entry stays in the table, hidden from find(), until the process is gone.
    /// @return True if stopped or never active
    bool stop(const std::string& name);

    std::map<std::string, bool> start_all();
    std::map<std::string, bool> stop_all();

    bool is_active(const std::string& name) const;

    /// @brief Sorted names of active servers
    std::vector<std::string> list_active() const;

    /// @brief Active session for name, or nullptr
    std::shared_ptr<MCPSession> find(const std::string& name) const;

    /// @brief True if the server is active and its process not yet reaped
    bool is_alive(const std::string& name) const;
    std::optional<pid_t> pid(const std::string& name) const;

    const MCPOptions& options() const { return options_; }

private:
    void read_output(MCPSession* session, int fd, bool is_stderr);
    void process_line(MCPSession& session, const std::string& line, bool is_stderr);
    void join_readers(MCPSession& session);
    void erase_session(const std::string& name, const std::shared_ptr<MCPSession>& session);

    const MCPServerRegistry& registry_;
    MCPOptions options_;
    const std::atomic<bool>& shutdown_;

    LineHandler line_handler_;

    mutable std::mutex sessions_mutex_;
    std::condition_variable sessions_cv_;   // signalled when an entry leaves the table
    std::map<std::string, std::shared_ptr<MCPSession>> sessions_;
};
