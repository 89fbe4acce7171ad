#pragma once

#include <string>

namespace ptyrun {

/**
 * @brief A pseudo terminal pair owned by one session
 * The master side stays in this process and is read and written by the
 * multiplexer; the slave side becomes the program's stdin, stdout and stderr.
 * Both descriptors are close-on-exec and closed on destruction.
 */
class pty_pair {
public:
    /**
     * @throw pty_error if no pseudo terminal can be allocated
     */
    pty_pair();
    ~pty_pair();

    pty_pair(const pty_pair &) = delete;
    pty_pair &operator=(const pty_pair &) = delete;

    int master() const;
    int slave() const;
    const std::string &slave_name() const;

    /**
     * @brief Gives the pty the window size of the operator's terminal
     * Does nothing if fd is not a terminal.
     */
    void copy_window_size(int fd);

    /**
     * @brief Closes our copy of the slave once the child holds its own
     * Required to get a hang-up on the master when the program exits.
     */
    void close_slave();

    void close_master();

private:
    int master_fd = -1;
    int slave_fd = -1;
    std::string name;
};

}  // namespace ptyrun
