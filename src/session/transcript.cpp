#include "session/transcript.hpp"
#include "common/io_utils.hpp"

namespace ptyrun {
using namespace std;

transcript_buffer::transcript_buffer(size_t limit) : max_chars(limit) {}

void transcript_buffer::append(const string &text) {
    data += text;
    // Every character is at least one byte, so a short buffer is within the limit.
    // After trimming it holds at most 4 * limit bytes, whatever the program printed.
    if (data.size() > max_chars && utf8_length(data) > max_chars)
        data = utf8_tail(data, max_chars);
}

const string &transcript_buffer::str() const {
    return data;
}

size_t transcript_buffer::limit() const {
    return max_chars;
}

}  // namespace ptyrun
