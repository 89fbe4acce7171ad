#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <string>

namespace ptyrun::test {

/**
 * @brief Scratch directory of the whole test run, removed at the end
 */
std::filesystem::path test_root();

void setup_test_environment();

void cleanup_test_environment();

/**
 * @brief Writes a source file outside of any sandbox
 */
std::filesystem::path write_source(const std::string &name, const std::string &content);

/**
 * @brief Compiles a test program with the system compiler
 * Fails the calling test if compilation does not succeed.
 */
std::filesystem::path compile_program(const std::string &name, const std::string &source);

/**
 * @brief Number of sandbox_* directories left under root
 */
size_t count_sandboxes(const std::filesystem::path &root);

/**
 * @brief Waits until a file appears and reads the pid a test program wrote there
 * @return -1 if the file did not appear within timeout
 */
pid_t wait_for_pid_file(const std::filesystem::path &file, std::chrono::milliseconds timeout);

bool process_exists(pid_t pid);

/**
 * @brief A file the multiplexer can echo program output to
 */
class display_file {
public:
    display_file();
    ~display_file();

    display_file(const display_file &) = delete;
    display_file &operator=(const display_file &) = delete;

    int fd() const;

    std::string content() const;

private:
    std::filesystem::path file;
    int file_fd = -1;
};

/**
 * @brief A pipe used as operator input
 */
class operator_pipe {
public:
    operator_pipe();
    ~operator_pipe();

    operator_pipe(const operator_pipe &) = delete;
    operator_pipe &operator=(const operator_pipe &) = delete;

    int read_end() const;

    void send(const std::string &keys);

    void close_write_end();

private:
    int fds[2] = {-1, -1};
};

}  // namespace ptyrun::test
