#ifndef ECCFLOW_TEST_PATH_UTILS_H
#define ECCFLOW_TEST_PATH_UTILS_H

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace eccflow_test {

// Fresh, empty directory under the system temp dir, unique per process.
inline std::string make_temp_dir(const std::string& dirname) {
    auto path = std::filesystem::temp_directory_path() /
                (dirname + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
    return path.string();
}

inline void touch_file(const std::filesystem::path& path, const std::string& content = "") {
    std::ofstream out(path);
    out << content;
}

inline void remove_tree(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

// Restores the working directory on scope exit.
class ScopedCurrentPath {
public:
    explicit ScopedCurrentPath(const std::filesystem::path& path)
        : saved_(std::filesystem::current_path()) {
        std::filesystem::current_path(path);
    }
    ~ScopedCurrentPath() {
        std::error_code ec;
        std::filesystem::current_path(saved_, ec);
    }

    ScopedCurrentPath(const ScopedCurrentPath&) = delete;
    ScopedCurrentPath& operator=(const ScopedCurrentPath&) = delete;

private:
    std::filesystem::path saved_;
};

}  // namespace eccflow_test

#endif  // ECCFLOW_TEST_PATH_UTILS_H
