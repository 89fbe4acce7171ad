#include "session/terminal.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace ptyrun {
using namespace std;

terminal_mode_guard::terminal_mode_guard(int fd) : fd(fd) {
    if (!isatty(fd)) {
        DLOG(INFO) << "fd " << fd << " is not a terminal, leaving its mode alone";
        return;
    }
    if (tcgetattr(fd, &original) != 0)
        throw system_error(errno, system_category(), "saving terminal mode");

    struct termios raw = original;
    cfmakeraw(&raw);
    if (tcsetattr(fd, TCSAFLUSH, &raw) != 0)
        throw system_error(errno, system_category(), "entering raw mode");
    saved = true;
}

terminal_mode_guard::~terminal_mode_guard() {
    restore();
}

bool terminal_mode_guard::active() const {
    return saved;
}

void terminal_mode_guard::restore() noexcept {
    if (!saved) return;
    saved = false;
    while (tcsetattr(fd, TCSADRAIN, &original) != 0) {
        if (errno == EINTR) continue;
        LOG(ERROR) << "unable to restore terminal mode: " << strerror(errno);
        break;
    }
}

}  // namespace ptyrun
