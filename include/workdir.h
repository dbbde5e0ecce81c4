#ifndef ECCFLOW_WORKDIR_H
#define ECCFLOW_WORKDIR_H

#include <filesystem>
#include <optional>
#include <string>

namespace eccflow {

/**
 * WorkingDirectorySession: scratch directory for one pipeline run.
 *
 * owns_directory is fixed at open():
 *   - no path requested: <cwd>/eccflow_tmp_<pid>, owned, removed by close();
 *   - path requested:    used as given (created if missing), never removed.
 *
 * The destructor does not remove anything. Only an explicit close() after a
 * successful run tears an owned directory down, so a failed run leaves it
 * in place for inspection.
 */
class WorkingDirectorySession {
public:
    static WorkingDirectorySession open(const std::optional<std::string>& requested_path);

    // Path used when the caller does not supply one.
    static std::filesystem::path default_path();

    const std::filesystem::path& path() const { return path_; }
    bool owns_directory() const { return owns_directory_; }
    bool is_closed() const { return closed_; }

    std::string artifact(const std::string& name) const;

    // Returns true when the directory was removed.
    bool close();

private:
    WorkingDirectorySession(std::filesystem::path path, bool owns_directory);

    std::filesystem::path path_;
    bool owns_directory_ = false;
    bool closed_ = false;
};

}  // namespace eccflow

#endif  // ECCFLOW_WORKDIR_H
