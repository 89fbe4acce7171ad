#pragma once

#include <filesystem>
#include <string>

namespace ptyrun {

/**
 * @brief Result of one compiler invocation
 */
struct compilation_outcome {
    bool success = false;

    /**
     * @brief Compiler diagnostics, or a note that the compiler timed out
     */
    std::string log;
};

/**
 * @brief Tells whether we know how to build and run the file
 * Only C and C++ sources (.c, .cpp) are supported.
 */
bool is_supported_source(const std::filesystem::path &source);

/**
 * @brief Compiles a single source file with COMPILER and COMPILER_STANDARD
 * Runs synchronously, bounded by COMPILE_TIME_LIMIT.
 * @param source the source file, already copied into the workspace
 * @param binary where the executable is written
 * @throw process_error if the compiler cannot be started
 */
compilation_outcome compile_source(const std::filesystem::path &source, const std::filesystem::path &binary);

}  // namespace ptyrun
