#include "test/helpers.hpp"
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <fstream>
#include <system_error>
#include <thread>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "runner/compiler.hpp"

namespace ptyrun::test {
using namespace std;
namespace fs = std::filesystem;

fs::path test_root() {
    static fs::path root = fs::temp_directory_path() / ("ptyrun-test-" + to_string(getpid()));
    return root;
}

void setup_test_environment() {
    fs::create_directories(test_root() / "sources");
    fs::create_directories(test_root() / "bin");
    SANDBOX_ROOT = test_root() / "sandboxes";
    KILL_GRACE_PERIOD = chrono::milliseconds(1000);
}

void cleanup_test_environment() {
    error_code ec;
    fs::remove_all(test_root(), ec);
}

fs::path write_source(const string &name, const string &content) {
    fs::path file = test_root() / "sources" / name;
    ofstream fout(file, ios::binary);
    fout << content;
    return file;
}

fs::path compile_program(const string &name, const string &source) {
    fs::path src = write_source(name + ".cpp", source);
    fs::path binary = test_root() / "bin" / name;
    auto outcome = compile_source(src, binary);
    EXPECT_TRUE(outcome.success) << outcome.log;
    return binary;
}

size_t count_sandboxes(const fs::path &root) {
    if (!fs::exists(root)) return 0;
    size_t count = 0;
    for (auto &entry : fs::directory_iterator(root))
        if (boost::algorithm::starts_with(entry.path().filename().string(), "sandbox_"))
            ++count;
    return count;
}

pid_t wait_for_pid_file(const fs::path &file, chrono::milliseconds timeout) {
    auto deadline = chrono::steady_clock::now() + timeout;
    while (chrono::steady_clock::now() < deadline) {
        string content = read_file_content(file, "");
        // the program writes "<pid>\n" so a partial write has no newline yet
        if (!content.empty() && content.back() == '\n')
            return boost::lexical_cast<pid_t>(content.substr(0, content.size() - 1));
        this_thread::sleep_for(chrono::milliseconds(10));
    }
    return -1;
}

bool process_exists(pid_t pid) {
    return ::kill(pid, 0) == 0 || errno != ESRCH;
}

display_file::display_file() {
    static int counter = 0;
    file = test_root() / ("display_" + to_string(++counter));
    file_fd = open(file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (file_fd < 0) throw system_error(errno, system_category(), "creating display file");
}

display_file::~display_file() {
    if (file_fd >= 0) close(file_fd);
}

int display_file::fd() const {
    return file_fd;
}

string display_file::content() const {
    return read_file_content(file, "");
}

operator_pipe::operator_pipe() {
    if (pipe2(fds, O_CLOEXEC) < 0) throw system_error(errno, system_category(), "creating operator pipe");
}

operator_pipe::~operator_pipe() {
    for (int fd : fds)
        if (fd >= 0) close(fd);
}

int operator_pipe::read_end() const {
    return fds[0];
}

void operator_pipe::send(const string &keys) {
    ASSERT_EQ((ssize_t)keys.size(), write(fds[1], keys.data(), keys.size()));
}

void operator_pipe::close_write_end() {
    if (fds[1] >= 0) close(fds[1]);
    fds[1] = -1;
}

}  // namespace ptyrun::test
