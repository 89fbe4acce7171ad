#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace ptyrun {

/**
 * @brief Process exit codes of the ptyrun command line tool
 * The values of E_COMPILER_ERROR and E_INTERNAL_ERROR are kept compatible
 * with the grading scripts that consume them.
 */
enum error_codes {
    E_SUCCESS = 0,
    E_BAD_OPTIONS = 1,
    E_INTERNAL_ERROR = 2,

    E_COMPILER_ERROR = 45,
    E_UNSUPPORTED_FILE = 46
};

/**
 * @brief Exit code reported for a program that had to be killed with SIGKILL
 * Real exit codes are in [0, 255], so a negative value can never collide.
 */
constexpr int FORCE_KILLED_EXIT_CODE = -1;

/**
 * @brief Byte the operator types to stop the program (Ctrl-C in raw mode)
 */
constexpr char INTERRUPT_BYTE = '\x03';

/**
 * @brief Wall-clock budget of one session when the caller does not give one
 * @defaultValue 300 seconds
 */
extern std::chrono::seconds DEFAULT_TIMEOUT;

/**
 * @brief How long a program may take to exit after SIGTERM before it is killed
 * @defaultValue 5 seconds
 */
extern std::chrono::milliseconds KILL_GRACE_PERIOD;

/**
 * @brief How long we wait for a program to be reaped after it closed the pty
 * on its own, before treating it as still running.
 */
extern std::chrono::milliseconds EXIT_SETTLE_PERIOD;

/**
 * @brief Maximum time the compiler may run
 * Sources like `#include </dev/random>` never finish compiling.
 * @defaultValue 60 seconds
 */
extern std::chrono::seconds COMPILE_TIME_LIMIT;

/**
 * @brief Compiler executable, looked up in PATH
 * @defaultValue g++, used for both C and C++ sources
 */
extern std::string COMPILER;

/**
 * @brief Language standard flag passed to the compiler
 * @defaultValue -std=c++11
 */
extern std::string COMPILER_STANDARD;

/**
 * @brief Directory where sandbox workspaces are created
 *
 * SANDBOX_ROOT
 * ├── sandbox_0f8c... // one workspace per request, removed afterwards
 * │   ├── Q1.cpp // copy of the submitted source
 * │   └── program // compiled binary
 * └── ...
 */
extern std::filesystem::path SANDBOX_ROOT;

/**
 * @brief Maximum number of bytes read from the pty master at once
 */
extern size_t OUTPUT_CHUNK_SIZE;

/**
 * @brief Number of trailing characters of program output kept in the result
 */
extern size_t TRANSCRIPT_LIMIT;

/**
 * @brief Number of characters kept from compiler diagnostics and error messages
 */
extern size_t ERROR_EXCERPT_LIMIT;

}  // namespace ptyrun
