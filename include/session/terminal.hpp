#pragma once

#include <termios.h>

namespace ptyrun {

/**
 * @brief Puts the operator's terminal in raw mode for the lifetime of the guard
 * Raw mode forwards every keystroke immediately and lets the program's own
 * pty do the echoing. The saved mode is restored exactly once, either by
 * restore() or by the destructor, on every exit path.
 *
 * If fd is not a terminal (pipe, file, test harness) the guard is inactive
 * and never touches it.
 */
class terminal_mode_guard {
public:
    /**
     * @throw std::system_error if fd is a terminal whose mode cannot be changed
     */
    explicit terminal_mode_guard(int fd);
    ~terminal_mode_guard();

    terminal_mode_guard(const terminal_mode_guard &) = delete;
    terminal_mode_guard &operator=(const terminal_mode_guard &) = delete;

    /**
     * @brief True if a mode was saved and has not been restored yet
     */
    bool active() const;

    /**
     * @brief Restores the saved mode, later calls do nothing
     */
    void restore() noexcept;

private:
    int fd;
    bool saved = false;
    struct termios original;
};

}  // namespace ptyrun
