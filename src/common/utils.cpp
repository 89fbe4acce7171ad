#include "common/utils.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace ptyrun {
using namespace std;

static int remaining_millis(chrono::steady_clock::time_point deadline) {
    auto left = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
    return left > 0 ? (int)left : 0;
}

process_output exec_program(const char **argv, chrono::milliseconds time_limit) {
    int output_pipe[2], error_pipe[2];
    if (pipe2(output_pipe, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "creating output pipe");
    if (pipe2(error_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(output_pipe[0]);
        close(output_pipe[1]);
        throw system_error(err, system_category(), "creating exec status pipe");
    }
    defer {
        close(output_pipe[0]);
        close(error_pipe[0]);
    };

    pid_t pid;
    switch (pid = fork()) {
        case -1: {  // fork failed
            int err = errno;
            close(output_pipe[1]);
            close(error_pipe[1]);
            throw system_error(err, system_category(), "fork");
        }
        case 0: {  // child
            // Own process group, so a time limit kills the compiler's children too
            setpgid(0, 0);
            // The operator's Ctrl-C belongs to the parent
            signal(SIGINT, SIG_IGN);
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
            dup2(output_pipe[1], STDOUT_FILENO);
            dup2(output_pipe[1], STDERR_FILENO);
            execvp(argv[0], (char **)argv);
            int err = errno;
            if (write(error_pipe[1], &err, sizeof(err)) < 0) {
                // nothing left to report to
            }
            _exit(127);
        }
        default:  // parent
            break;
    }

    close(output_pipe[1]);
    close(error_pipe[1]);

    process_output result;
    auto deadline = chrono::steady_clock::now() + time_limit;
    char buf[4096];
    while (true) {
        struct pollfd pfd = {output_pipe[0], POLLIN, 0};
        int r = poll(&pfd, 1, remaining_millis(deadline));
        if (r < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            kill(-pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            throw system_error(err, system_category(), "waiting for command output");
        }
        if (r == 0) {
            LOG(WARNING) << argv[0] << " exceeded its time limit of " << time_limit.count() << "ms, killing it";
            result.timed_out = true;
            kill(-pid, SIGKILL);
            break;
        }
        ssize_t n = read(output_pipe[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        result.output.append(buf, n);
    }

    // The command may close its output and keep running: the deadline still holds.
    int status = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, result.timed_out ? 0 : WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "waiting on command");
        }
        if (remaining_millis(deadline) == 0) {
            LOG(WARNING) << argv[0] << " exceeded its time limit of " << time_limit.count() << "ms after closing its output, killing it";
            result.timed_out = true;
            kill(-pid, SIGKILL);
            continue;
        }
        this_thread::sleep_for(chrono::milliseconds(10));
    }

    int exec_errno = 0;
    if (read(error_pipe[0], &exec_errno, sizeof(exec_errno)) == sizeof(exec_errno)) {
        throw process_error(string("unable to start command ") + argv[0] + ": " + strerror(exec_errno));
    }

    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else
        result.exit_code = -1;
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace ptyrun
