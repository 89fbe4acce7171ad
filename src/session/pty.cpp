#include "session/pty.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include "common/exceptions.hpp"

namespace ptyrun {
using namespace std;

static string errno_message(const char *what) {
    return string(what) + ": " + strerror(errno);
}

pty_pair::pty_pair() {
    master_fd = posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (master_fd < 0) throw pty_error(errno_message("posix_openpt"));

    if (grantpt(master_fd) != 0 || unlockpt(master_fd) != 0) {
        string message = errno_message("unlocking pty");
        close(master_fd);
        throw pty_error(message);
    }

    char buf[256];
    if (int err = ptsname_r(master_fd, buf, sizeof(buf)); err != 0) {
        close(master_fd);
        throw pty_error(string("ptsname: ") + strerror(err));
    }
    name = buf;

    slave_fd = open(buf, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (slave_fd < 0) {
        string message = errno_message(("opening " + name).c_str());
        close(master_fd);
        throw pty_error(message);
    }

    // The loop must never block on a program that stopped reading its input.
    int flags = fcntl(master_fd, F_GETFL);
    if (flags == -1 || fcntl(master_fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        string message = errno_message("setting pty master non-blocking");
        close(slave_fd);
        close(master_fd);
        throw pty_error(message);
    }
    DLOG(INFO) << "Allocated pty " << name;
}

pty_pair::~pty_pair() {
    close_slave();
    close_master();
}

int pty_pair::master() const {
    return master_fd;
}

int pty_pair::slave() const {
    return slave_fd;
}

const string &pty_pair::slave_name() const {
    return name;
}

void pty_pair::copy_window_size(int fd) {
    if (!isatty(fd)) return;
    struct winsize ws;
    if (ioctl(fd, TIOCGWINSZ, &ws) != 0) {
        LOG(WARNING) << "unable to read window size: " << strerror(errno);
        return;
    }
    if (ioctl(slave_fd, TIOCSWINSZ, &ws) != 0)
        LOG(WARNING) << "unable to set window size of " << name << ": " << strerror(errno);
}

void pty_pair::close_slave() {
    if (slave_fd < 0) return;
    if (close(slave_fd) != 0)
        LOG(WARNING) << "closing pty slave: " << strerror(errno);
    slave_fd = -1;
}

void pty_pair::close_master() {
    if (master_fd < 0) return;
    if (close(master_fd) != 0)
        LOG(WARNING) << "closing pty master: " << strerror(errno);
    master_fd = -1;
}

}  // namespace ptyrun
