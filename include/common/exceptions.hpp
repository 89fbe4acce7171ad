#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace ptyrun {

/**
 * @brief Base of the errors raised inside the execution engine
 * Carries the stack trace of the throw site, printed by operator<<.
 * The launcher converts every exception into a system_failure result,
 * so none of these reach the caller of execute().
 */
struct runner_exception : std::exception {
    runner_exception();
    explicit runner_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runner_exception &ex);

    template <typename T>
    runner_exception operator<<(const T &t) const {
        return runner_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief Failure to allocate or configure the pseudo terminal
 */
struct pty_error : public runner_exception {
    pty_error();
    explicit pty_error(const std::string &message);
};

/**
 * @brief Failure to start, signal or reap a child process
 * Also raised when the program binary cannot be executed.
 */
struct process_error : public runner_exception {
    process_error();
    explicit process_error(const std::string &message);
};

/**
 * @brief Failure to create or populate a sandbox workspace
 */
struct workspace_error : public runner_exception {
    workspace_error();
    explicit workspace_error(const std::string &message);
};

}  // namespace ptyrun
