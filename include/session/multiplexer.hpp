#pragma once

#include <unistd.h>
#include <chrono>
#include <filesystem>
#include "config.hpp"
#include "runner/execution_result.hpp"
#include "session/state_machine.hpp"

namespace ptyrun {

class pty_pair;
class child_process;

/**
 * @brief Descriptors and time limits of one interactive session
 */
struct session_options {
    /**
     * @brief Wall-clock budget of the program, measured from its start
     */
    std::chrono::seconds timeout = DEFAULT_TIMEOUT;

    /**
     * @brief Time between SIGTERM and SIGKILL when the program has to be stopped
     */
    std::chrono::milliseconds grace_period = KILL_GRACE_PERIOD;

    /**
     * @brief Where operator keystrokes come from
     * Put into raw mode for the duration of the session if it is a terminal.
     */
    int operator_fd = STDIN_FILENO;

    /**
     * @brief Where program output is echoed to
     */
    int display_fd = STDOUT_FILENO;

    /**
     * @brief Frame the session on the display with START and END banners
     * Only a session that actually starts gets banners, so compilation
     * failures never show them.
     */
    bool show_banners = false;
};

/**
 * @brief Runs a compiled program on a pseudo terminal and relays the operator's
 * terminal to it until the program exits, the deadline passes or the
 * operator types the interrupt byte.
 *
 * All decisions are taken by session_state_machine; this class only turns
 * descriptor readiness into events and performs the resulting writes.
 */
class session_multiplexer {
public:
    explicit session_multiplexer(const session_options &options);

    /**
     * @brief Runs the binary with workdir as working directory
     * Never throws: any failure is returned as system_failure, after the
     * operator terminal has been restored and the program stopped.
     */
    execution_result run(const std::filesystem::path &binary, const std::filesystem::path &workdir);

private:
    void relay(pty_pair &pty, session_state_machine &machine);

    void drain(child_process &child, session_state_machine &machine);

    bool apply(pty_pair &pty, session_state_machine &machine, const session_event &event);

    void write_display(const std::string &data);

    void write_banner(const std::string &title);

    session_options options;
};

}  // namespace ptyrun
