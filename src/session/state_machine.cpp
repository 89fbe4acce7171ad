#include "session/state_machine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <stdexcept>
#include "common/stl_utils.hpp"
#include "config.hpp"

namespace ptyrun {
using namespace std;

session_state_machine::session_state_machine(chrono::seconds timeout, size_t transcript_limit)
    : timeout(timeout), buffer(transcript_limit) {}

void session_state_machine::start() {
    if (current != session_state::STARTING)
        throw logic_error("session already started");
    current = session_state::RUNNING;
}

session_action session_state_machine::drain(drain_reason reason, const string &annotation) {
    why = reason;
    current = session_state::DRAINING;
    buffer.append(annotation);
    return session_action{annotation, ""};
}

session_action session_state_machine::handle(const session_event &event) {
    if (current != session_state::RUNNING) return {};

    return visit(overloaded{
                     [this](const program_output &e) -> session_action {
                         if (e.bytes.empty()) return drain(drain_reason::END_OF_OUTPUT, "");
                         buffer.append(e.bytes);
                         return session_action{e.bytes, ""};
                     },
                     [this](const operator_input &e) -> session_action {
                         if (e.byte == INTERRUPT_BYTE)
                             return drain(drain_reason::INTERRUPT, "\r\n[Execution stopped by user]\r\n");
                         return session_action{"", string(1, e.byte)};
                     },
                     [this](const deadline_expired &) -> session_action {
                         return drain(drain_reason::TIMEOUT, fmt::format("\r\n[Execution timed out after {} seconds]\r\n", timeout.count()));
                     },
                     [this](const io_failure &e) -> session_action {
                         LOG(WARNING) << "I/O error, ending session: " << e.what;
                         return drain(drain_reason::IO_ERROR, "");
                     }},
                 event);
}

string session_state_machine::record_forced_kill() {
    forced_kill = true;
    string annotation = "\r\n[Program ignored SIGTERM and was killed]\r\n";
    buffer.append(annotation);
    return annotation;
}

status session_state_machine::close() {
    if (current != session_state::DRAINING)
        throw logic_error("session closed before draining");
    current = session_state::CLOSED;

    if (forced_kill) return status::FORCIBLY_KILLED;
    switch (why) {
        case drain_reason::TIMEOUT:
            return status::TERMINATED_BY_TIMEOUT;
        case drain_reason::INTERRUPT:
            return status::TERMINATED_BY_INTERRUPT;
        default:
            return status::COMPLETED;
    }
}

session_state session_state_machine::state() const {
    return current;
}

drain_reason session_state_machine::reason() const {
    return why;
}

const transcript_buffer &session_state_machine::transcript() const {
    return buffer;
}

}  // namespace ptyrun
