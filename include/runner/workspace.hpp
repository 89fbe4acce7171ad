#pragma once

#include <filesystem>

namespace ptyrun {

/**
 * @brief A uniquely named directory that holds one request's files
 * The directory is named sandbox_<random uuid> under the given root and is
 * recursively removed on destruction. Removal failures are logged and
 * ignored: the workspace must never mask the outcome of the request.
 * This is not a security boundary, just an isolation from concurrent runs.
 */
class sandbox_workspace {
public:
    /**
     * @brief Creates the workspace directory (and root if missing)
     * @param root directory in which the workspace is created
     * @throw workspace_error if the directory cannot be created
     */
    explicit sandbox_workspace(const std::filesystem::path &root);
    ~sandbox_workspace();

    sandbox_workspace(const sandbox_workspace &) = delete;
    sandbox_workspace &operator=(const sandbox_workspace &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief Copies a file into the workspace, keeping its file name
     * Isolates the run from later changes of the original.
     * @return path of the copy
     * @throw workspace_error if the copy fails
     */
    std::filesystem::path stage(const std::filesystem::path &file) const;

    /**
     * @brief Removes the workspace now instead of at destruction
     */
    void remove() noexcept;

private:
    std::filesystem::path dir;
    bool removed = false;
};

}  // namespace ptyrun
