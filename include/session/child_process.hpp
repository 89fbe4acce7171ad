#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>

namespace ptyrun {

class pty_pair;

/**
 * @brief The program under supervision, attached to a pty slave
 * The child is a session leader whose controlling terminal is the pty, so
 * its process group id equals its pid and signals go to the whole group.
 * If the handle is destroyed while the child is still alive, the group is
 * killed and the child reaped: no orphan keeps the pty open.
 */
class child_process {
public:
    /**
     * @brief Forks and executes binary with the pty slave as stdin/stdout/stderr
     * @param binary the program to run, without arguments
     * @param workdir working directory of the program
     * @param pty the pair whose slave the program gets
     * @throw process_error if fork fails or the binary cannot be executed
     */
    child_process(const std::filesystem::path &binary, const std::filesystem::path &workdir, const pty_pair &pty);
    ~child_process();

    child_process(const child_process &) = delete;
    child_process &operator=(const child_process &) = delete;

    pid_t pid() const;

    /**
     * @brief Reaps the child if it has exited, without blocking
     * @return true if the child has exited
     */
    bool try_wait();

    /**
     * @brief Waits up to timeout for the child to exit
     * @return true if the child has exited
     */
    bool wait_for(std::chrono::milliseconds timeout);

    /**
     * @brief Asks the process group to stop with SIGTERM
     */
    void terminate();

    /**
     * @brief Kills the process group with SIGKILL and reaps the child
     */
    void kill();

    bool exited() const;

    /**
     * @brief Exit status, 128 + signal for a signalled death,
     * FORCE_KILLED_EXIT_CODE after kill()
     * @throw process_error if the child has not exited yet
     */
    int exit_code() const;

private:
    void signal_group(int sig);
    void record_status(int status);

    pid_t child_pid = -1;
    bool reaped = false;
    bool killed = false;
    int code = -1;
};

}  // namespace ptyrun
