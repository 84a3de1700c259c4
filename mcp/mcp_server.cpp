#include "mcpgroup.h"
#include "mcp_server.h"

#include <unistd.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <signal.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

namespace {

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; i++) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

} // namespace

MCPServer::MCPServer(const MCPServerConfig& config)
    : config_(config), pid_(-1), stdin_fd_(-1), stdout_fd_(-1), stderr_fd_(-1),
      reaped_(true), exit_status_(0) {
}

MCPServer::~MCPServer() {
    try {
        if (is_running()) {
            stop(std::chrono::milliseconds(1000));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error stopping MCP server '" + config_.name + "': " + e.what());
    }
    close_fds();
}

std::map<std::string, std::string> MCPServer::build_environment(const MCPServerConfig& config) {
    std::map<std::string, std::string> env;

    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv = *entry;
        size_t eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }

    for (const auto& [key, value] : config.env) {
        env[key] = value;
    }

    // Add node_modules/.bin to PATH if specified
    if (config.node_modules_path) {
        std::string node_bin_path = *config.node_modules_path + "/.bin";
        auto it = env.find("PATH");
        if (it != env.end() && !it->second.empty()) {
            it->second = node_bin_path + ":" + it->second;
        } else {
            env["PATH"] = node_bin_path;
        }
    }

    return env;
}

std::string MCPServer::default_search_path() {
    size_t len = confstr(_CS_PATH, nullptr, 0);
    if (len == 0) {
        return "/bin:/usr/bin";
    }
    std::string path(len, '\0');
    confstr(_CS_PATH, &path[0], len);
    path.resize(len - 1);
    return path;
}

std::string MCPServer::resolve_executable(const std::string& command, const std::string& path_value) {
    if (command.empty()) {
        return "";
    }
    if (command.find('/') != std::string::npos) {
        return command;
    }

    size_t start = 0;
    while (start <= path_value.size()) {
        size_t colon = path_value.find(':', start);
        if (colon == std::string::npos) {
            colon = path_value.size();
        }

        std::string dir = path_value.substr(start, colon - start);
        if (dir.empty()) {
            dir = ".";
        }

        std::string candidate = dir + "/" + command;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }

        start = colon + 1;
    }

    return "";
}

void MCPServer::start() {
    if (is_running()) {
        throw MCPServerError("Server already running");
    }
    if (config_.command.empty()) {
        throw MCPServerError("No command configured for server '" + config_.name + "'");
    }

    auto env = build_environment(config_);
    auto path_it = env.find("PATH");
    std::string executable = resolve_executable(
        config_.command, path_it != env.end() ? path_it->second : default_search_path());
    if (executable.empty()) {
        throw MCPServerError("Command not found: " + config_.command);
    }

    // Everything the child needs is built before fork; after fork the child
    // only makes async-signal-safe calls.
    std::vector<std::string> env_strings;
    env_strings.reserve(env.size());
    for (const auto& [key, value] : env) {
        env_strings.push_back(key + "=" + value);
    }

    std::vector<char*> envp;
    for (auto& entry : env_strings) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(config_.command.c_str()));
    for (const auto& arg : config_.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // Create pipes: [read_end, write_end]. Close-on-exec keeps them out of
    // other children spawned concurrently; dup2 clears the flag on 0/1/2.
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (pipe2(stdin_pipe, O_CLOEXEC) < 0 || pipe2(stdout_pipe, O_CLOEXEC) < 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) < 0 || pipe2(status_pipe, O_CLOEXEC) < 0) {
        std::string err = strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        throw MCPServerError("Failed to create pipes: " + err);
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::string err = strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        throw MCPServerError("Failed to fork: " + err);
    }

    if (pid == 0) {
        // Child process
        signal(SIGPIPE, SIG_DFL);

        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        execve(executable.c_str(), argv.data(), envp.data());

        // If we get here, exec failed: report errno through the status pipe
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    // Close child ends of pipes
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(status_pipe[1]);

    {
        std::lock_guard<std::mutex> lock(reap_mutex_);
        pid_ = pid;
        reaped_ = false;
        exit_status_ = 0;
    }
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];

    // The status pipe reads EOF once execve succeeds
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n > 0) {
        reap(true);
        close_fds();
        pid_ = -1;
        throw MCPServerError("Failed to execute " + config_.command + ": " + strerror(child_errno));
    }

    // Non-blocking on our side; readers and writers poll() instead
    fcntl(stdin_fd_, F_SETFL, fcntl(stdin_fd_, F_GETFL) | O_NONBLOCK);
    fcntl(stdout_fd_, F_SETFL, fcntl(stdout_fd_, F_GETFL) | O_NONBLOCK);
    fcntl(stderr_fd_, F_SETFL, fcntl(stderr_fd_, F_GETFL) | O_NONBLOCK);

    LOG_INFO("MCP server '" + config_.name + "' started with PID " + std::to_string(pid_));
}

bool MCPServer::reap(bool block) const {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (reaped_ || pid_ <= 0) {
        return true;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return false;
    }

    if (result < 0) {
        // ECHILD: someone else already collected it
        LOG_DEBUG("waitpid(" + std::to_string(pid_) + ") failed: " + strerror(errno));
    } else {
        exit_status_ = status;
    }

    reaped_ = true;
    return true;
}

bool MCPServer::stop(std::chrono::milliseconds grace) {
    if (!is_running()) {
        return true;
    }

    LOG_DEBUG("Stopping MCP server '" + config_.name + "' (PID " + std::to_string(pid_) + ")");

    if (kill(pid_, SIGTERM) < 0 && errno != ESRCH) {
        throw MCPServerError("Failed to terminate PID " + std::to_string(pid_) + ": " + strerror(errno));
    }

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (reap(false)) {
        return true;
    }

    // Force kill
    LOG_WARN("Server " + config_.name + " didn't terminate gracefully, killing...");
    if (kill(pid_, SIGKILL) < 0 && errno != ESRCH) {
        throw MCPServerError("Failed to kill PID " + std::to_string(pid_) + ": " + strerror(errno));
    }
    reap(true);
    return false;
}

bool MCPServer::is_running() const {
    if (pid_ <= 0) {
        return false;
    }
    return !reap(false);
}

void MCPServer::write_line(const std::string& line, std::chrono::milliseconds timeout) {
    if (stdin_fd_ < 0 || !is_running()) {
        throw MCPServerError("Server not running");
    }

    std::string data = line + "\n";
    size_t offset = 0;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (offset < data.size()) {
        ssize_t written = write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (written >= 0) {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throw MCPServerError("Failed to write to server: " + std::string(strerror(errno)));
        }

        // Pipe full: wait for the child to drain it, up to the deadline
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            if (offset > 0) {
                // Half a line is in the pipe; nothing sent later could be framed
                close(stdin_fd_);
                stdin_fd_ = -1;
            }
            throw MCPServerError("Timed out writing to server '" + config_.name + "' after " +
                                 std::to_string(timeout.count()) + "ms");
        }

        struct pollfd pfd{};
        pfd.fd = stdin_fd_;
        pfd.events = POLLOUT;
        if (poll(&pfd, 1, static_cast<int>(remaining.count())) < 0 && errno != EINTR) {
            throw MCPServerError("poll failed on server stdin: " + std::string(strerror(errno)));
        }
    }
}

void MCPServer::close_fds() {
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
        close(stderr_fd_);
        stderr_fd_ = -1;
    }
}
