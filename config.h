#pragma once

#include <string>
#include <vector>
#include <stdexcept>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Filesystem locations of the MCP server configuration files
class Config {
public:
    // Name of the per-directory and per-user config file
    static constexpr const char* CONFIG_FILE_NAME = "mcp_config.json";

    // Directory under $HOME holding the user config
    static constexpr const char* HOME_CONFIG_DIR = ".mcp-group";

    // Get user's home directory (tries HOME first, then getpwuid)
    static std::string get_home_directory();

    // $HOME/.mcp-group/mcp_config.json
    static std::string get_home_config_path();

    // ./mcp_config.json, resolved against the current working directory
    static std::string get_local_config_path();

    // Config files in load order, lowest precedence first.
    // explicit_path (if not empty) is appended last so it overrides the defaults.
    static std::vector<std::string> get_search_paths(const std::string& explicit_path = "");
};
