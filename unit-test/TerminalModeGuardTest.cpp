#include <fcntl.h>
#include <termios.h>
#include <unistd.h>
#include <cstring>
#include <thread>
#include "gtest/gtest.h"
#include "session/multiplexer.hpp"
#include "session/pty.hpp"
#include "session/terminal.hpp"
#include "test/helpers.hpp"
#include "test/programs.hpp"

using namespace std;
using std::filesystem::path;
using namespace ptyrun;
using namespace ptyrun::test;

static bool same_mode(const struct termios &a, const struct termios &b) {
    return memcmp(&a, &b, sizeof(struct termios)) == 0;
}

// The slave side of a private pty stands in for the operator's terminal.
TEST(TerminalModeGuardTest, RawWhileActiveRestoredAfterwards) {
    pty_pair operator_terminal;
    struct termios before, during, after;
    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &before));
    ASSERT_TRUE(before.c_lflag & ICANON);

    {
        terminal_mode_guard guard(operator_terminal.slave());
        EXPECT_TRUE(guard.active());
        ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &during));
        EXPECT_FALSE(during.c_lflag & ICANON);
        EXPECT_FALSE(during.c_lflag & ECHO);
        EXPECT_FALSE(during.c_lflag & ISIG);
    }

    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &after));
    EXPECT_TRUE(same_mode(before, after));
}

TEST(TerminalModeGuardTest, RestoresExactlyOnce) {
    pty_pair operator_terminal;
    struct termios before, after;
    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &before));

    terminal_mode_guard guard(operator_terminal.slave());
    guard.restore();
    EXPECT_FALSE(guard.active());

    // changes made after restoring are not undone by a second restore
    struct termios changed = before;
    changed.c_lflag &= ~ECHO;
    ASSERT_EQ(0, tcsetattr(operator_terminal.slave(), TCSANOW, &changed));
    guard.restore();
    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &after));
    EXPECT_FALSE(after.c_lflag & ECHO);
}

TEST(TerminalModeGuardTest, NonTerminalIsLeftAlone) {
    int fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    ASSERT_GE(fd, 0);
    {
        terminal_mode_guard guard(fd);
        EXPECT_FALSE(guard.active());
    }
    close(fd);
}

TEST(TerminalModeGuardTest, SessionLeavesOperatorTerminalUntouched) {
    pty_pair operator_terminal;
    struct termios before, after;
    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &before));

    display_file display;
    session_options options;
    options.timeout = chrono::seconds(10);
    options.operator_fd = operator_terminal.slave();
    options.display_fd = display.fd();
    auto result = session_multiplexer(options).run(compile_program("terminal_hello", hello_world), test_root());

    ASSERT_TRUE(holds_alternative<run_completed>(result)) << describe(result);
    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &after));
    EXPECT_TRUE(same_mode(before, after));
}

TEST(TerminalModeGuardTest, SessionRestoresTerminalAfterInterrupt) {
    pty_pair operator_terminal;
    struct termios before, after;
    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &before));

    path pid_file = test_root() / "terminal_interrupt.pid";
    path binary = compile_program("terminal_interrupt", sleeper(pid_file));

    // typed on the operator terminal, delivered as a raw byte once the guard is active
    thread typist([&] {
        if (wait_for_pid_file(pid_file, chrono::seconds(10)) > 0) {
            char key = '\x03';
            (void)!write(operator_terminal.master(), &key, 1);
        }
    });

    display_file display;
    session_options options;
    options.timeout = chrono::seconds(20);
    options.operator_fd = operator_terminal.slave();
    options.display_fd = display.fd();
    auto result = session_multiplexer(options).run(binary, test_root());
    typist.join();

    ASSERT_TRUE(holds_alternative<run_completed>(result)) << describe(result);
    EXPECT_EQ(status::TERMINATED_BY_INTERRUPT, get<run_completed>(result).session_status);
    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &after));
    EXPECT_TRUE(same_mode(before, after));
}

// Raw mode is already on when the program fails to start.
TEST(TerminalModeGuardTest, SessionRestoresTerminalAfterInternalError) {
    pty_pair operator_terminal;
    struct termios before, after;
    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &before));

    path not_executable = write_source("terminal_not_executable", "plain text, no exec permission\n");

    display_file display;
    session_options options;
    options.timeout = chrono::seconds(10);
    options.operator_fd = operator_terminal.slave();
    options.display_fd = display.fd();
    auto result = session_multiplexer(options).run(not_executable, test_root());

    ASSERT_TRUE(holds_alternative<system_failure>(result)) << describe(result);
    EXPECT_NE(string::npos, get<system_failure>(result).message.find("exec"));
    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &after));
    EXPECT_TRUE(same_mode(before, after));
}

TEST(TerminalModeGuardTest, SessionRestoresTerminalWhenWorkdirIsMissing) {
    pty_pair operator_terminal;
    struct termios before, after;
    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &before));

    display_file display;
    session_options options;
    options.timeout = chrono::seconds(10);
    options.operator_fd = operator_terminal.slave();
    options.display_fd = display.fd();
    auto result = session_multiplexer(options).run(compile_program("terminal_workdir", hello_world), test_root() / "no-such-dir");

    ASSERT_TRUE(holds_alternative<system_failure>(result)) << describe(result);
    ASSERT_EQ(0, tcgetattr(operator_terminal.slave(), &after));
    EXPECT_TRUE(same_mode(before, after));
}
