#include "session/child_process.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "session/pty.hpp"

namespace ptyrun {
using namespace std;

child_process::child_process(const filesystem::path &binary, const filesystem::path &workdir, const pty_pair &pty) {
    // Everything the child needs is prepared before fork: no allocation after it.
    string program = binary.string();
    string dir = workdir.string();
    char *argv[] = {program.data(), nullptr};
    int slave = pty.slave();

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0)
        throw process_error(string("creating exec status pipe: ") + strerror(errno));

    switch (child_pid = fork()) {
        case -1: {
            int err = errno;
            close(status_pipe[0]);
            close(status_pipe[1]);
            throw process_error(string("unable to fork: ") + strerror(err));
        }
        case 0: {  // child process, run the program
            auto die = [&](const char *step) {
                int err[2] = {errno, 0};
                size_t len = strlen(step);
                err[1] = (int)len;
                if (write(status_pipe[1], err, sizeof(err)) > 0 &&
                    write(status_pipe[1], step, len) > 0) {
                }
                _exit(127);
            };

            close(status_pipe[0]);

            // New session, so the pty becomes our controlling terminal and
            // Ctrl-C typed on the operator's terminal never reaches us directly.
            if (setsid() < 0) die("setsid");
            if (ioctl(slave, TIOCSCTTY, 0) < 0) die("setting controlling terminal");

            for (int i = 0; i <= 2; ++i)
                if (dup2(slave, i) < 0) die("redirecting standard streams");

            // Dispositions ignored by the supervisor survive exec: undo them.
            sigset_t empty;
            sigemptyset(&empty);
            sigprocmask(SIG_SETMASK, &empty, nullptr);
            signal(SIGINT, SIG_DFL);
            signal(SIGQUIT, SIG_DFL);
            signal(SIGTERM, SIG_DFL);
            signal(SIGPIPE, SIG_DFL);

            if (chdir(dir.c_str()) < 0) die("chdir");

            execv(argv[0], argv);
            die("exec");
            // [[noreturn]] does not work on lambdas...
            _exit(127);
        }
        default:
            break;
    }

    close(status_pipe[1]);
    defer { close(status_pipe[0]); };
    int err[2] = {0, 0};
    ssize_t n;
    while ((n = read(status_pipe[0], err, sizeof(err))) < 0 && errno == EINTR) {
    }
    if (n == (ssize_t)sizeof(err)) {
        char step[128] = {};
        if (read(status_pipe[0], step, min<size_t>(err[1], sizeof(step) - 1)) < 0) step[0] = 0;
        int status;
        waitpid(child_pid, &status, 0);
        reaped = true;
        throw process_error(string("unable to start ") + program + ": " + step + ": " + strerror(err[0]));
    }
    LOG(INFO) << "Started " << program << " as pid " << child_pid << " on " << pty.slave_name();
}

child_process::~child_process() {
    if (child_pid <= 0 || reaped) return;
    LOG(WARNING) << "child " << child_pid << " still alive when its handle was released, killing it";
    try {
        signal_group(SIGKILL);
    } catch (process_error &ex) {
        LOG(ERROR) << ex;
        return;
    }
    int status;
    while (waitpid(child_pid, &status, 0) < 0 && errno == EINTR) {
    }
}

pid_t child_process::pid() const {
    return child_pid;
}

void child_process::record_status(int status) {
    reaped = true;
    if (WIFEXITED(status)) {
        code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // same convention as a shell: 128 + signal number
        code = 128 + WTERMSIG(status);
        LOG(WARNING) << "Program terminated with signal (" << WTERMSIG(status) << ", " << strsignal(WTERMSIG(status)) << ")";
    }
    if (killed) code = FORCE_KILLED_EXIT_CODE;
}

bool child_process::try_wait() {
    if (reaped) return true;
    int status = 0;
    pid_t r = waitpid(child_pid, &status, WNOHANG);
    if (r < 0) {
        if (errno == EINTR) return false;
        throw process_error(string("waiting on child: ") + strerror(errno));
    }
    if (r == child_pid) record_status(status);
    return reaped;
}

bool child_process::wait_for(chrono::milliseconds timeout) {
    auto deadline = chrono::steady_clock::now() + timeout;
    while (!try_wait()) {
        if (chrono::steady_clock::now() >= deadline) return false;
        this_thread::sleep_for(chrono::milliseconds(10));
    }
    return true;
}

void child_process::signal_group(int sig) {
    // Don't report an already exited process as error.
    if (::kill(-child_pid, sig) != 0 && errno != ESRCH) {
        LOG(WARNING) << "signalling process group " << child_pid << ": " << strerror(errno);
        if (::kill(child_pid, sig) != 0 && errno != ESRCH)
            throw process_error(string("sending signal to program: ") + strerror(errno));
    }
}

void child_process::terminate() {
    if (reaped) return;
    LOG(INFO) << "sending SIGTERM to " << child_pid;
    signal_group(SIGTERM);
}

void child_process::kill() {
    if (reaped) return;
    LOG(INFO) << "sending SIGKILL to " << child_pid;
    killed = true;
    signal_group(SIGKILL);
    int status = 0;
    while (waitpid(child_pid, &status, 0) < 0) {
        if (errno != EINTR) throw process_error(string("waiting on killed child: ") + strerror(errno));
    }
    record_status(status);
}

bool child_process::exited() const {
    return reaped;
}

int child_process::exit_code() const {
    if (!reaped) throw process_error("program " + to_string(child_pid) + " has not exited yet");
    return code;
}

}  // namespace ptyrun
