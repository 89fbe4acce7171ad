#include "session/multiplexer.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <optional>
#include <vector>
#include <fmt/core.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "session/child_process.hpp"
#include "session/pty.hpp"
#include "session/terminal.hpp"

namespace ptyrun {
using namespace std;

session_multiplexer::session_multiplexer(const session_options &options)
    : options(options) {}

/**
 * @brief Writes all of data to a possibly non-blocking descriptor
 * @return errno of the first hard failure, 0 on success
 */
static int write_fully(int fd, const string &data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n >= 0) {
            offset += n;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            // The program is not reading its input. Wait a little for room
            // and drop the keystrokes if it never comes.
            struct pollfd pfd = {fd, POLLOUT, 0};
            if (poll(&pfd, 1, 100) <= 0) {
                LOG(WARNING) << "dropping " << data.size() - offset << " bytes, program is not reading its input";
                return 0;
            }
        } else {
            return errno;
        }
    }
    return 0;
}

void session_multiplexer::write_display(const string &data) {
    if (data.empty()) return;
    if (int err = write_fully(options.display_fd, data))
        LOG(WARNING) << "unable to write program output to display: " << strerror(err);
}

void session_multiplexer::write_banner(const string &title) {
    if (options.show_banners)
        write_display(fmt::format("\n{0}\n{1:=^60}\n{0}\n\n", string(60, '='), " " + title + " "));
}

bool session_multiplexer::apply(pty_pair &pty, session_state_machine &machine, const session_event &event) {
    session_action action = machine.handle(event);
    write_display(action.to_display);
    if (!action.to_program.empty()) {
        if (int err = write_fully(pty.master(), action.to_program))
            write_display(machine.handle(io_failure{string("writing to program: ") + strerror(err)}).to_display);
    }
    return machine.state() == session_state::RUNNING;
}

void session_multiplexer::relay(pty_pair &pty, session_state_machine &machine) {
    auto deadline = chrono::steady_clock::now() + options.timeout;
    bool operator_open = true;
    vector<char> buffer(OUTPUT_CHUNK_SIZE);

    while (machine.state() == session_state::RUNNING) {
        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            apply(pty, machine, deadline_expired{});
            break;
        }
        auto remaining = chrono::ceil<chrono::milliseconds>(deadline - now).count();
        int wait_ms = remaining > INT_MAX ? INT_MAX : (int)remaining;

        struct pollfd fds[2] = {{pty.master(), POLLIN, 0}, {options.operator_fd, POLLIN, 0}};
        int ret = poll(fds, operator_open ? 2 : 1, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            apply(pty, machine, io_failure{string("poll: ") + strerror(errno)});
            break;
        }
        if (ret == 0) continue;  // deadline is checked at the top

        if (fds[0].revents) {
            ssize_t n = read(pty.master(), buffer.data(), buffer.size());
            if (n > 0) {
                if (!apply(pty, machine, program_output{string(buffer.data(), n)})) break;
            } else if (n == 0 || errno == EIO) {
                // Linux reports EIO on the master once every slave holder is gone
                apply(pty, machine, program_output{});
                break;
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                apply(pty, machine, io_failure{string("reading program output: ") + strerror(errno)});
                break;
            }
        }

        if (operator_open && fds[1].revents) {
            char byte;
            ssize_t n = read(options.operator_fd, &byte, 1);
            if (n == 1) {
                apply(pty, machine, operator_input{byte});
            } else if (n == 0) {
                DLOG(INFO) << "operator input reached end of file";
                operator_open = false;
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                apply(pty, machine, io_failure{string("reading operator input: ") + strerror(errno)});
            }
        }
    }
}

void session_multiplexer::drain(child_process &child, session_state_machine &machine) {
    switch (machine.reason()) {
        case drain_reason::END_OF_OUTPUT:
        case drain_reason::IO_ERROR:
            // The program usually closed its terminal because it is exiting.
            child.wait_for(EXIT_SETTLE_PERIOD);
            break;
        default:
            child.try_wait();
            break;
    }
    if (child.exited()) return;

    child.terminate();
    if (child.wait_for(options.grace_period)) return;

    LOG(WARNING) << "program " << child.pid() << " is still alive " << options.grace_period.count() << "ms after SIGTERM";
    write_display(machine.record_forced_kill());
    child.kill();
}

execution_result session_multiplexer::run(const filesystem::path &binary, const filesystem::path &workdir) {
    write_banner("PROGRAM EXECUTION START");
    // The END banner is written once the terminal is back in its original mode.
    defer {
        write_banner("PROGRAM EXECUTION END");
    };
    try {
        // Destruction order matters on failure: the terminal is restored
        // first, then any surviving program is killed, then the pty closed.
        pty_pair pty;
        optional<child_process> child;
        terminal_mode_guard terminal(options.operator_fd);
        pty.copy_window_size(options.operator_fd);

        session_state_machine machine(options.timeout, TRANSCRIPT_LIMIT);
        child.emplace(binary, workdir, pty);
        pty.close_slave();
        machine.start();
        LOG(INFO) << "running " << binary.string() << " as " << child->pid() << " on " << pty.slave_name()
                  << ", timeout " << options.timeout.count() << "s";

        elapsed_time timer;
        relay(pty, machine);
        drain(*child, machine);

        status result = machine.close();
        terminal.restore();
        pty.close_master();

        LOG(INFO) << "program " << child->pid() << " finished after " << timer.duration<chrono::milliseconds>().count()
                  << "ms: " << get_display_message(result) << ", exit code " << child->exit_code();
        return make_run_completed(machine.transcript().str(), child->exit_code(), result);
    } catch (runner_exception &ex) {
        LOG(ERROR) << "interactive session failed: " << ex;
        return make_system_failure(ex.what());
    } catch (exception &ex) {
        LOG(ERROR) << "interactive session failed: " << ex.what();
        return make_system_failure(ex.what());
    }
}

}  // namespace ptyrun
