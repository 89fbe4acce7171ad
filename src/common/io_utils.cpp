#include "common/io_utils.hpp"
#include <fstream>
#include <iterator>

namespace ptyrun {
using namespace std;

static bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

/**
 * @return byte length of the well-formed sequence starting at pos, 0 if the
 * byte at pos does not start one
 */
static size_t sequence_length(const string &string, size_t pos) {
    unsigned char c = string[pos];
    size_t n;
    if (c <= 0x7f)
        return 1;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0)
        n = 2;  // 110bbbbb
    else if (c == 0xed && pos + 1 < string.size() && ((unsigned char)string[pos + 1] & 0xa0) == 0xa0)
        return 0;  // U+d800 to U+dfff
    else if ((c & 0xF0) == 0xE0)
        n = 3;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0)
        n = 4;  // 11110bbb
    else
        return 0;
    if (pos + n > string.size()) return 0;
    for (size_t j = 1; j < n; ++j)
        if (!is_continuation(string[pos + j])) return 0;
    return n;
}

// An invalid byte is a character by itself.
static size_t char_length(const string &string, size_t pos) {
    size_t n = sequence_length(string, pos);
    return n ? n : 1;
}

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

bool utf8_check_is_valid(const string &string) {
    for (size_t i = 0; i < string.size();) {
        size_t n = sequence_length(string, i);
        if (!n) return false;
        i += n;
    }
    return true;
}

string utf8_replace_invalid(const string &string) {
    if (utf8_check_is_valid(string)) return string;
    std::string result;
    result.reserve(string.size() + 16);
    for (size_t i = 0; i < string.size();) {
        size_t n = sequence_length(string, i);
        if (n) {
            result.append(string, i, n);
            i += n;
        } else {
            result += "\xef\xbf\xbd";  // U+FFFD
            ++i;
        }
    }
    return result;
}

size_t utf8_length(const string &string) {
    size_t length = 0;
    for (size_t i = 0; i < string.size(); i += char_length(string, i))
        ++length;
    return length;
}

string utf8_head(const string &string, size_t limit) {
    size_t count = 0;
    for (size_t i = 0; i < string.size(); i += char_length(string, i)) {
        if (count == limit) return string.substr(0, i);
        ++count;
    }
    return string;
}

string utf8_tail(const string &string, size_t limit) {
    size_t length = utf8_length(string);
    if (length <= limit) return string;
    size_t skip = length - limit, i = 0;
    while (skip-- > 0)
        i += char_length(string, i);
    return string.substr(i);
}

}  // namespace ptyrun
