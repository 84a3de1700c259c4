#pragma once

#include "mcp_config.h"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <chrono>
#include <stdexcept>
#include <sys/types.h>

class MCPServerError : public std::runtime_error {
public:
    explicit MCPServerError(const std::string& message) : std::runtime_error(message) {}
};

// Represents a running MCP server process and the parent ends of its
// stdin/stdout/stderr pipes
class MCPServer {
public:
    explicit MCPServer(const MCPServerConfig& config);
    ~MCPServer();

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    // Process lifecycle
    // Throws MCPServerError if the executable cannot be found or exec'd
    void start();

    // SIGTERM, wait up to grace, then SIGKILL and wait unconditionally.
    // Returns true if the process exited within the grace period.
    bool stop(std::chrono::milliseconds grace);

    // True until the child has been reaped
    bool is_running() const;

    // I/O
    // Writes line plus newline. Throws MCPServerError if the child is gone or
    // its stdin stays full past timeout; a line cut off midway closes stdin.
    void write_line(const std::string& line,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));
    void close_fds();

    const std::string& get_name() const { return config_.name; }
    pid_t get_pid() const { return pid_; }
    int get_stdout_fd() const { return stdout_fd_; }
    int get_stderr_fd() const { return stderr_fd_; }

    // Inherited environment overlaid with config.env, node_modules/.bin first on PATH.
    static std::map<std::string, std::string> build_environment(const MCPServerConfig& config);

    // Locate command on path_value the way execvp would. Commands containing
    // a '/' are returned unchanged. Empty string when nothing executable matches.
    static std::string resolve_executable(const std::string& command, const std::string& path_value);

    // Search path execvp uses when PATH is unset (confstr _CS_PATH)
    static std::string default_search_path();

private:
    bool reap(bool block) const;

    MCPServerConfig config_;
    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;

    mutable std::mutex reap_mutex_;
    mutable bool reaped_;
    mutable int exit_status_;
};
