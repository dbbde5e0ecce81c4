#include "workdir.h"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace eccflow {

namespace fs = std::filesystem;

WorkingDirectorySession::WorkingDirectorySession(fs::path path, bool owns_directory)
    : path_(std::move(path)),
      owns_directory_(owns_directory) {}

fs::path WorkingDirectorySession::default_path() {
    return fs::current_path() / ("eccflow_tmp_" + std::to_string(::getpid()));
}

WorkingDirectorySession WorkingDirectorySession::open(
    const std::optional<std::string>& requested_path) {
    const bool owned = !requested_path.has_value() || requested_path->empty();
    fs::path path = owned ? default_path() : fs::path(*requested_path);

    if (fs::exists(path) && !fs::is_directory(path)) {
        throw fs::filesystem_error(
            "working directory path exists and is not a directory",
            path,
            std::make_error_code(std::errc::not_a_directory));
    }

    const bool created = fs::create_directories(path);
    std::cerr << "[Workdir] " << (created ? "created " : "using ") << path.string()
              << (owned ? " (temporary)" : "") << '\n';

    return WorkingDirectorySession(std::move(path), owned);
}

std::string WorkingDirectorySession::artifact(const std::string& name) const {
    return (path_ / name).string();
}

bool WorkingDirectorySession::close() {
    if (closed_) {
        return false;
    }
    closed_ = true;

    if (!owns_directory_) {
        return false;
    }

    const auto removed = fs::remove_all(path_);
    std::cerr << "[Workdir] removed " << path_.string() << " (" << removed << " entries)\n";
    return true;
}

}  // namespace eccflow
