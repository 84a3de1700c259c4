#include "mcpgroup.h"
#include "config.h"

#include <filesystem>
#include <pwd.h>
#include <unistd.h>

std::string Config::get_home_directory() {
    // Try HOME environment variable first (respects user's explicit setting)
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home);
    }

    // Fallback to system passwd database
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }

    throw ConfigError("Unable to determine home directory");
}

std::string Config::get_home_config_path() {
    return get_home_directory() + "/" + HOME_CONFIG_DIR + "/" + CONFIG_FILE_NAME;
}

std::string Config::get_local_config_path() {
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        LOG_WARN("Unable to determine working directory: " + ec.message());
        return CONFIG_FILE_NAME;
    }
    return (cwd / CONFIG_FILE_NAME).string();
}

std::vector<std::string> Config::get_search_paths(const std::string& explicit_path) {
    std::vector<std::string> paths;

    try {
        paths.push_back(get_home_config_path());
    } catch (const ConfigError& e) {
        LOG_WARN(std::string("Skipping home config: ") + e.what());
    }

    paths.push_back(get_local_config_path());

    if (!explicit_path.empty()) {
        paths.push_back(explicit_path);
    }

    return paths;
}
