#include "mcpgroup.h"
#include "mcp_supervisor.h"

#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

MCPSession::MCPSession(const MCPServerConfig& config)
    : name(config.name), server(std::make_unique<MCPServer>(config)) {
}

MCPSession::~MCPSession() {
    stopping = true;
    if (stdout_reader.joinable()) {
        stdout_reader.join();
    }
    if (stderr_reader.joinable()) {
        stderr_reader.join();
    }
}

int64_t MCPSession::allocate_id() {
    std::lock_guard<std::mutex> lock(id_mutex);
    int64_t id = next_id++;
    pending_ids.insert(id);
    return id;
}

void MCPSession::release_id(int64_t id) {
    std::lock_guard<std::mutex> lock(id_mutex);
    pending_ids.erase(id);
}

bool MCPSession::is_pending(int64_t id) const {
    std::lock_guard<std::mutex> lock(id_mutex);
    return pending_ids.count(id) > 0;
}

MCPSupervisor::MCPSupervisor(const MCPServerRegistry& registry, const MCPOptions& options,
                             const std::atomic<bool>& shutdown_flag)
    : registry_(registry), options_(options), shutdown_(shutdown_flag) {
}

MCPSupervisor::~MCPSupervisor() {
    stop_all();
}

void MCPSupervisor::set_line_handler(LineHandler handler) {
    line_handler_ = std::move(handler);
}

bool MCPSupervisor::start(const std::string& name) {
    auto config = registry_.get(name);
    if (!config) {
        LOG_ERROR("Server " + name + " not configured");
        return false;
    }

    std::shared_ptr<MCPSession> session;
    {
        std::unique_lock<std::mutex> lock(sessions_mutex_);
        // A stop in progress still owns the process: wait until it is reaped
        sessions_cv_.wait(lock, [this, &name] {
            auto it = sessions_.find(name);
            return it == sessions_.end() || !it->second->terminating;
        });
        if (sessions_.count(name)) {
            LOG_WARN("Server " + name + " already running");
            return true;
        }
        // Reserve the name so a concurrent start() is a no-op
        session = std::make_shared<MCPSession>(*config);
        sessions_[name] = session;
    }

    try {
        session->server->start();

        // Readers get a raw pointer: the session outlives them (joined in stop)
        MCPSession* raw = session.get();
        session->stdout_reader = std::thread(&MCPSupervisor::read_output, this, raw,
                                             session->server->get_stdout_fd(), false);
        session->stderr_reader = std::thread(&MCPSupervisor::read_output, this, raw,
                                             session->server->get_stderr_fd(), true);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server " + name + ": " + e.what());
        session->stopping = true;
        join_readers(*session);
        erase_session(name, session);
        return false;
    }

    session->ready = true;

    LOG_INFO("Started MCP server: " + name);
    return true;
}

bool MCPSupervisor::stop(const std::string& name) {
    std::shared_ptr<MCPSession> session;
    {
        std::unique_lock<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(name);
        if (it == sessions_.end()) {
            LOG_WARN("Server " + name + " not running");
            return true;
        }
        if (it->second->terminating) {
            // Another caller is stopping it; done once the entry is gone
            std::shared_ptr<MCPSession> other = it->second;
            sessions_cv_.wait(lock, [this, &name, &other] {
                auto current = sessions_.find(name);
                return current == sessions_.end() || current->second != other || !other->terminating;
            });
            auto current = sessions_.find(name);
            return current == sessions_.end() || current->second != other;
        }
        if (!it->second->ready) {
            LOG_WARN("Server " + name + " is still starting");
            return false;
        }
        session = it->second;
        // Hidden from find() and list_active(), but the name stays taken
        session->ready = false;
        session->terminating = true;
    }

    try {
        if (!session->server->stop(options_.stop_grace)) {
            LOG_DEBUG("Server " + name + " required SIGKILL");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to stop server " + name + ": " + e.what());
        // Leave it active so a later stop() can retry
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            session->terminating = false;
            session->ready = true;
        }
        sessions_cv_.notify_all();
        return false;
    }

    session->stopping = true;
    join_readers(*session);
    session->responses.close();

    {
        std::lock_guard<std::mutex> lock(session->write_mutex);
        session->server->close_fds();
    }

    erase_session(name, session);

    LOG_INFO("Stopped MCP server: " + name);
    return true;
}

std::map<std::string, bool> MCPSupervisor::start_all() {
    std::map<std::string, bool> results;
    for (const auto& name : registry_.names()) {
        results[name] = start(name);
    }
    return results;
}

std::map<std::string, bool> MCPSupervisor::stop_all() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& pair : sessions_) {
            names.push_back(pair.first);
        }
    }

    std::map<std::string, bool> results;
    for (const auto& name : names) {
        results[name] = stop(name);
    }
    return results;
}

bool MCPSupervisor::is_active(const std::string& name) const {
    return find(name) != nullptr;
}

std::vector<std::string> MCPSupervisor::list_active() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<std::string> names;
    for (const auto& pair : sessions_) {
        if (pair.second->ready) {
            names.push_back(pair.first);
        }
    }
    return names;
}

std::shared_ptr<MCPSession> MCPSupervisor::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(name);
    if (it == sessions_.end() || !it->second->ready) {
        return nullptr;
    }
    return it->second;
}

bool MCPSupervisor::is_alive(const std::string& name) const {
    auto session = find(name);
    return session && session->server->is_running();
}

std::optional<pid_t> MCPSupervisor::pid(const std::string& name) const {
    auto session = find(name);
    if (!session) {
        return std::nullopt;
    }
    return session->server->get_pid();
}

void MCPSupervisor::join_readers(MCPSession& session) {
    if (session.stdout_reader.joinable()) {
        session.stdout_reader.join();
    }
    if (session.stderr_reader.joinable()) {
        session.stderr_reader.join();
    }
}

void MCPSupervisor::erase_session(const std::string& name, const std::shared_ptr<MCPSession>& session) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(name);
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
        }
    }
    sessions_cv_.notify_all();
}

void MCPSupervisor::read_output(MCPSession* session, int fd, bool is_stderr) {
    const char* stream_type = is_stderr ? "stderr" : "stdout";
    std::string buffer;
    char chunk[4096];
    bool eof = false;

    try {
        while (!shutdown_ && !session->stopping) {
            // Wait for data with timeout so the flags above are rechecked
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLIN;

            int ready = poll(&pfd, 1, static_cast<int>(options_.poll_interval.count()));
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("poll failed on " + std::string(stream_type) + " of " + session->name +
                          ": " + strerror(errno));
                break;
            }
            if (ready == 0) {
                continue;
            }

            ssize_t n = read(fd, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    continue;
                }
                LOG_ERROR("read failed on " + std::string(stream_type) + " of " + session->name +
                          ": " + strerror(errno));
                break;
            }
            if (n == 0) {
                eof = true;
                break;
            }

            buffer.append(chunk, static_cast<size_t>(n));

            size_t newline_pos;
            while ((newline_pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, newline_pos);
                buffer.erase(0, newline_pos + 1);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                process_line(*session, line, is_stderr);
            }
        }

        // Unterminated final line
        if (eof && !buffer.empty()) {
            process_line(*session, buffer, is_stderr);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling " + std::string(stream_type) + " for server " + session->name + ": " + e.what());
    }

    if (eof && !is_stderr) {
        LOG_INFO("Server " + session->name + " closed stdout");
        session->stdout_closed = true;
        // Nothing more can arrive: release anyone waiting for a response
        session->responses.close();
    }
}

void MCPSupervisor::process_line(MCPSession& session, const std::string& line, bool is_stderr) {
    if (line.empty()) {
        return;
    }

    if (is_stderr) {
        LOG_WARN("Server " + session.name + " stderr: " + line);
        return;
    }

    if (Logger::instance().is_enabled(LogLevel::TRACE)) {
        LOG_TRACE("Server " + session.name + " stdout: " + line);
    }
    if (line_handler_) {
        line_handler_(session, line);
    }
}
