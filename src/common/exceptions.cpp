#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace ptyrun {
using namespace std;

runner_exception::runner_exception()
    : runner_exception("") {}

runner_exception::runner_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runner_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runner_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

pty_error::pty_error()
    : runner_exception() {}

pty_error::pty_error(const string &message)
    : runner_exception(message) {}

process_error::process_error()
    : runner_exception() {}

process_error::process_error(const string &message)
    : runner_exception(message) {}

workspace_error::workspace_error()
    : runner_exception() {}

workspace_error::workspace_error(const string &message)
    : runner_exception(message) {}

}  // namespace ptyrun
