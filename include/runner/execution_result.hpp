#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include "common/status.hpp"

/**
 * This header contains the only value that outlives an execution request.
 * Every alternative is immutable once built; the make_* factories enforce the
 * excerpt limits and replace invalid UTF-8 with U+FFFD, so that a result can
 * always be logged or serialized without further care.
 */
namespace ptyrun {

/**
 * @brief The source did not compile
 */
struct compilation_failed {
    /**
     * @brief First ERROR_EXCERPT_LIMIT characters of the compiler diagnostics
     * Deliberately lossy, only meant to tell the grader why it failed.
     */
    const std::string error_excerpt;
};

/**
 * @brief The source file has no execution strategy (not .c or .cpp)
 */
struct unsupported_file {};

/**
 * @brief The program ran, whatever the way it stopped
 */
struct run_completed {
    /**
     * @brief Last TRANSCRIPT_LIMIT characters of the program output,
     * with annotations for interrupts, timeouts and forced kills
     * Callers must not assume this is the complete output.
     */
    const std::string transcript_excerpt;

    /**
     * @brief Exit status of the program, 128 + signal if it died from a signal,
     * or FORCE_KILLED_EXIT_CODE if it had to be killed
     */
    const int exit_code;

    const status session_status;
};

/**
 * @brief Unexpected OS or runtime failure while setting up or running the session
 */
struct system_failure {
    /**
     * @brief First ERROR_EXCERPT_LIMIT characters of the error message
     */
    const std::string message;
};

using execution_result = std::variant<compilation_failed, unsupported_file, run_completed, system_failure>;

execution_result make_compilation_failed(const std::string &compiler_output);

execution_result make_run_completed(const std::string &transcript, int exit_code, status session_status);

execution_result make_system_failure(const std::string &message);

/**
 * @brief One line description for logs and the terminal
 */
std::string describe(const execution_result &result);

void to_json(nlohmann::json &j, const compilation_failed &result);
void to_json(nlohmann::json &j, const unsupported_file &result);
void to_json(nlohmann::json &j, const run_completed &result);
void to_json(nlohmann::json &j, const system_failure &result);

/**
 * @brief Serializes any result, tagged by its "type" field
 * @code{.json}
 *     {"type": "completed", "transcript_excerpt": "hi\r\n", "exit_code": 0, "status": "completed"}
 * @endcode
 */
nlohmann::json result_to_json(const execution_result &result);

}  // namespace ptyrun
