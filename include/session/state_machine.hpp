#pragma once

#include <chrono>
#include <string>
#include <variant>
#include "common/status.hpp"
#include "session/transcript.hpp"

namespace ptyrun {

/**
 * @brief Lifecycle of one interactive session
 * STARTING -> RUNNING -> DRAINING -> CLOSED
 */
enum class session_state {
    STARTING,
    RUNNING,
    DRAINING,
    CLOSED
};

/**
 * @brief The program wrote to its terminal
 * An empty chunk means the program side of the pty is gone.
 */
struct program_output {
    std::string bytes;
};

/**
 * @brief The operator typed a byte
 */
struct operator_input {
    char byte;
};

/**
 * @brief The wall-clock budget of the session is used up
 */
struct deadline_expired {};

/**
 * @brief Reading or writing one of the session descriptors failed
 */
struct io_failure {
    std::string what;
};

using session_event = std::variant<program_output, operator_input, deadline_expired, io_failure>;

/**
 * @brief Why the session left RUNNING
 */
enum class drain_reason {
    NONE,
    END_OF_OUTPUT,
    TIMEOUT,
    INTERRUPT,
    IO_ERROR
};

/**
 * @brief Bytes the multiplexer has to write after an event
 */
struct session_action {
    std::string to_display;
    std::string to_program;
};

/**
 * @brief Pure transition function of the session, without any I/O
 * The multiplexer turns descriptor readiness into session_events, feeds them
 * to handle() and performs the returned action. Keeping all decisions here
 * makes the session testable with synthetic event sequences.
 */
class session_state_machine {
public:
    /**
     * @param timeout the session budget, only used in the timeout annotation
     * @param transcript_limit number of characters kept in the transcript
     */
    session_state_machine(std::chrono::seconds timeout, size_t transcript_limit);

    /**
     * @brief STARTING -> RUNNING, once the program is attached to the pty
     */
    void start();

    /**
     * @brief Applies one event
     * Events are only meaningful while RUNNING and are ignored otherwise.
     */
    session_action handle(const session_event &event);

    /**
     * @brief Notes that the program ignored SIGTERM and is being killed
     * @return the annotation to show on the display
     */
    std::string record_forced_kill();

    /**
     * @brief DRAINING -> CLOSED
     * @return final status, derived from the drain reason and a forced kill
     */
    status close();

    session_state state() const;

    drain_reason reason() const;

    const transcript_buffer &transcript() const;

private:
    session_action drain(drain_reason why, const std::string &annotation);

    std::chrono::seconds timeout;
    session_state current = session_state::STARTING;
    drain_reason why = drain_reason::NONE;
    bool forced_kill = false;
    transcript_buffer buffer;
};

}  // namespace ptyrun
