#ifndef TEMP_DIR_H
#define TEMP_DIR_H

#include <string>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace test_helpers {

// RAII temporary directory, removed with everything below it
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "mcpgroup_test_") {
        std::string tmpl = "/tmp/" + prefix + "XXXXXX";
        char* path = mkdtemp(tmpl.data());
        if (path) {
            path_ = path;
        }
    }

    ~TempDir() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    std::string file_path(const std::string& name) const {
        return path_ + "/" + name;
    }

    // Create (with parents) a directory below the temp dir, return its path
    std::string make_dir(const std::string& name) const {
        std::string dir = file_path(name);
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        return dir;
    }

    // Write a file below the temp dir, return its path
    std::string write(const std::string& name, const std::string& content) const {
        std::string file = file_path(name);
        std::ofstream out(file);
        out << content;
        return file;
    }

    bool valid() const { return !path_.empty(); }

private:
    std::string path_;
};

} // namespace test_helpers

#endif // TEMP_DIR_H
