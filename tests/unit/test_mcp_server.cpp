#include <gtest/gtest.h>
#include "mcp/mcp_server.h"
#include "test_helpers.h"
#include "temp_dir.h"
#include <poll.h>
#include <unistd.h>
#include <signal.h>
#include <cerrno>
#include <thread>

using namespace std::chrono_literals;
using test_helpers::ScopedEnv;

namespace {

MCPServerConfig make_config(const std::string& name, const std::string& command,
                            const std::vector<std::string>& args = {}) {
    MCPServerConfig config;
    config.name = name;
    config.command = command;
    config.args = args;
    return config;
}

// Read one line from fd, waiting at most timeout
std::string read_line(int fd, std::chrono::milliseconds timeout) {
    std::string line;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char c;
    while (std::chrono::steady_clock::now() < deadline) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        if (poll(&pfd, 1, 50) <= 0) {
            continue;
        }
        ssize_t n = read(fd, &c, 1);
        if (n <= 0) {
            if (n < 0 && errno == EAGAIN) {
                continue;
            }
            break;
        }
        if (c == '\n') {
            break;
        }
        line += c;
    }
    return line;
}

} // namespace

TEST(MCPServerTest, BuildEnvironmentOverlaysConfig) {
    ScopedEnv inherited("MCPGROUP_TEST_INHERITED", "parent");
    ScopedEnv path("PATH", "/usr/bin:/bin");

    MCPServerConfig config = make_config("s", "cat");
    config.env["MCPGROUP_TEST_INHERITED"] = "child";
    config.env["MCPGROUP_TEST_EXTRA"] = "1";
    config.node_modules_path = "/srv/app/node_modules";

    auto env = MCPServer::build_environment(config);
    EXPECT_EQ(env["MCPGROUP_TEST_INHERITED"], "child");
    EXPECT_EQ(env["MCPGROUP_TEST_EXTRA"], "1");
    EXPECT_EQ(env["PATH"], "/srv/app/node_modules/.bin:/usr/bin:/bin");
}

TEST(MCPServerTest, BuildEnvironmentWithoutPath) {
    ScopedEnv path("PATH");

    MCPServerConfig config = make_config("s", "cat");
    config.node_modules_path = "/nm";

    auto env = MCPServer::build_environment(config);
    EXPECT_EQ(env["PATH"], "/nm/.bin");
}

TEST(MCPServerTest, ResolveExecutable) {
    test_helpers::TempDir dir;
    ASSERT_TRUE(dir.valid());
    std::string bin = dir.make_dir("bin");
    ASSERT_TRUE(test_helpers::write_script(bin + "/my-tool", "exit 0\n"));
    dir.write("bin/not-exec", "data");

    EXPECT_EQ(MCPServer::resolve_executable("my-tool", "/nonexistent:" + bin), bin + "/my-tool");
    EXPECT_EQ(MCPServer::resolve_executable("not-exec", bin), "");
    EXPECT_EQ(MCPServer::resolve_executable("missing", bin), "");
    EXPECT_EQ(MCPServer::resolve_executable("./relative/tool", ""), "./relative/tool");
    EXPECT_EQ(MCPServer::resolve_executable("", bin), "");
}

TEST(MCPServerTest, DefaultSearchPath) {
    std::string path = MCPServer::default_search_path();
    EXPECT_NE(path.find("/bin"), std::string::npos);
    EXPECT_EQ(path.find('\0'), std::string::npos);
}

TEST(MCPServerTest, StartWithoutPathUsesDefaultSearchPath) {
    ScopedEnv path("PATH");

    MCPServer server(make_config("cat", "cat"));
    ASSERT_NO_THROW(server.start());
    EXPECT_TRUE(server.is_running());
    server.stop(2s);
}

TEST(MCPServerTest, StartWriteReadStop) {
    MCPServer server(make_config("cat", "cat"));
    server.start();

    EXPECT_TRUE(server.is_running());
    EXPECT_GT(server.get_pid(), 0);

    server.write_line("hello");
    EXPECT_EQ(read_line(server.get_stdout_fd(), 2s), "hello");

    EXPECT_TRUE(server.stop(2s));
    EXPECT_FALSE(server.is_running());
    EXPECT_THROW(server.write_line("late"), MCPServerError);
}

TEST(MCPServerTest, StartTwiceThrows) {
    MCPServer server(make_config("cat", "cat"));
    server.start();
    EXPECT_THROW(server.start(), MCPServerError);
    server.stop(2s);
}

TEST(MCPServerTest, MissingCommandThrows) {
    MCPServer server(make_config("ghost", "definitely-not-a-command-mcpgroup"));
    EXPECT_THROW(server.start(), MCPServerError);
    EXPECT_FALSE(server.is_running());

    MCPServer empty(make_config("empty", ""));
    EXPECT_THROW(empty.start(), MCPServerError);
}

TEST(MCPServerTest, ExecFailureIsReported) {
    test_helpers::TempDir dir;
    // Executable bit set, but not a valid binary or script
    std::string path = dir.write("broken", "\x7f" "ELF garbage");
    ASSERT_EQ(chmod(path.c_str(), 0755), 0);

    MCPServer server(make_config("broken", path));
    EXPECT_THROW(server.start(), MCPServerError);
    EXPECT_FALSE(server.is_running());
}

TEST(MCPServerTest, StopKillsAfterGrace) {
    MCPServer server(make_config("stubborn", "sh", {"-c", "trap '' TERM; echo ready; while :; do sleep 1; done"}));
    server.start();
    ASSERT_EQ(read_line(server.get_stdout_fd(), 2s), "ready");

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(server.stop(300ms));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
    EXPECT_FALSE(server.is_running());
}

TEST(MCPServerTest, ExitedProcessIsNotRunning) {
    MCPServer server(make_config("true", "true"));
    server.start();

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (server.is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(server.is_running());
    EXPECT_TRUE(server.stop(100ms));
}

TEST(MCPServerTest, ChildSeesConfiguredEnvironment) {
    MCPServerConfig config = make_config("env", "sh", {"-c", "echo $MCPGROUP_TEST_VALUE"});
    config.env["MCPGROUP_TEST_VALUE"] = "from-config";

    MCPServer server(config);
    server.start();
    EXPECT_EQ(read_line(server.get_stdout_fd(), 2s), "from-config");
    server.stop(1s);
}

TEST(MCPServerTest, WriteToFullPipeTimesOut) {
    MCPServer server(make_config("deaf", "sh", {"-c", "exec sleep 30"}));
    server.start();

    std::string blob(1024 * 1024, 'x');
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(server.write_line(blob, 200ms), MCPServerError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

    // Half a line went out, so stdin is closed for good
    EXPECT_THROW(server.write_line("next", 200ms), MCPServerError);
    EXPECT_TRUE(server.is_running());

    server.stop(2s);
}
