#pragma once

#include <filesystem>
#include "runner/execution_result.hpp"
#include "session/multiplexer.hpp"

namespace ptyrun {

/**
 * @brief One request to compile and interactively run a source file
 */
struct execution_request {
    std::filesystem::path source_file;

    /**
     * @brief Wall-clock budget of the program in seconds, must be positive
     */
    int timeout_seconds = (int)DEFAULT_TIMEOUT.count();
};

/**
 * @brief Compiles a single source file inside a fresh sandbox workspace and
 * runs it in an interactive session.
 *
 * The workspace is removed before execute() returns, whatever the outcome.
 */
class process_launcher {
public:
    /**
     * @param sandbox_root directory under which workspaces are created
     * @param options descriptors and grace period of the sessions; the
     * timeout is taken from each request
     */
    process_launcher(const std::filesystem::path &sandbox_root, const session_options &options = session_options());

    /**
     * @brief Never throws, every failure is reported as system_failure
     */
    execution_result execute(const execution_request &request);

    execution_result execute(const std::filesystem::path &source_file, int timeout_seconds);

private:
    execution_result compile_and_run(const execution_request &request);

    std::filesystem::path sandbox_root;
    session_options options;
};

}  // namespace ptyrun
