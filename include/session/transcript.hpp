#pragma once

#include <string>

namespace ptyrun {

/**
 * @brief Rolling excerpt of what the program printed
 * Keeps only the most recent `limit` characters (UTF-8 code points); older
 * content is evicted as new output arrives. Bytes that are not valid UTF-8
 * count as one character each. The full output is only ever streamed to the
 * display, never stored.
 */
class transcript_buffer {
public:
    explicit transcript_buffer(size_t limit);

    void append(const std::string &text);

    const std::string &str() const;

    size_t limit() const;

private:
    size_t max_chars;
    std::string data;
};

}  // namespace ptyrun
