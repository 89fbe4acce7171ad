#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace ptyrun {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::COMPLETED, "Completed")
    (status::TERMINATED_BY_TIMEOUT, "Terminated by Timeout")
    (status::TERMINATED_BY_INTERRUPT, "Terminated by Interrupt")
    (status::FORCIBLY_KILLED, "Forcibly Killed");

static const unordered_map<status, const char *> status_key = boost::assign::map_list_of
    (status::COMPLETED, "completed")
    (status::TERMINATED_BY_TIMEOUT, "terminated_by_timeout")
    (status::TERMINATED_BY_INTERRUPT, "terminated_by_interrupt")
    (status::FORCIBLY_KILLED, "forcibly_killed");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_status_key(status stat) {
    return status_key.at(stat);
}

}  // namespace ptyrun
