#pragma once

namespace ptyrun {

/**
 * @brief How an interactive session ended
 * Early termination is a routine outcome when supervising unknown programs,
 * so none of these values is an error.
 */
enum class status {
    /**
     * @brief The program closed its terminal on its own
     * The exit code is whatever the program returned, or 128 + signal
     * if it crashed.
     */
    COMPLETED = 0,

    /**
     * @brief The wall-clock budget ran out and the program was terminated
     */
    TERMINATED_BY_TIMEOUT = 1,

    /**
     * @brief The operator pressed Ctrl-C and the program was terminated
     */
    TERMINATED_BY_INTERRUPT = 2,

    /**
     * @brief The program ignored SIGTERM for the whole grace period
     * and was killed with SIGKILL. The exit code is FORCE_KILLED_EXIT_CODE.
     */
    FORCIBLY_KILLED = 3
};

/**
 * @brief Human readable name, shown on the terminal
 */
const char *get_display_message(status);

/**
 * @brief Stable snake_case name, used in JSON results
 */
const char *get_status_key(status);

}  // namespace ptyrun
