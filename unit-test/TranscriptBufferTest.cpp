#include "gtest/gtest.h"
#include "common/io_utils.hpp"
#include "session/transcript.hpp"

using namespace std;
using namespace ptyrun;

TEST(TranscriptBufferTest, KeepsEverythingBelowLimit) {
    transcript_buffer buffer(10);
    buffer.append("abc");
    buffer.append("def");
    EXPECT_EQ("abcdef", buffer.str());
    EXPECT_EQ(10u, buffer.limit());
}

TEST(TranscriptBufferTest, KeepsMostRecentCharacters) {
    transcript_buffer buffer(1000);
    string expected;
    for (int i = 0; i < 300; ++i) {
        string line = to_string(i) + "\n";
        buffer.append(line);
        expected += line;
    }
    EXPECT_EQ(expected.substr(expected.size() - 1000), buffer.str());
}

TEST(TranscriptBufferTest, DoesNotSplitMultiByteCharacters) {
    transcript_buffer buffer(3);
    buffer.append("\xe4\xbd\xa0\xe5\xa5\xbd");  // 你好
    buffer.append("ab");
    EXPECT_EQ("\xe5\xa5\xbd" "ab", buffer.str());
}

TEST(TranscriptBufferTest, CharacterSplitAcrossChunks) {
    transcript_buffer buffer(2);
    buffer.append("x\xe4");
    buffer.append("\xbd\xa0y");
    EXPECT_EQ("\xe4\xbd\xa0y", buffer.str());
}

TEST(TranscriptBufferTest, StrayContinuationBytesAreCharacters) {
    transcript_buffer buffer(1000);
    string chunk(1024, '\x80');
    for (int i = 0; i < 2000; ++i) {
        buffer.append(chunk);
        ASSERT_LE(buffer.str().size(), 4 * buffer.limit());
    }
    EXPECT_EQ(string(1000, '\x80'), buffer.str());
}

TEST(TranscriptBufferTest, InvalidTailAfterValidCharacter) {
    transcript_buffer buffer(1000);
    buffer.append("A" + string(5000, '\xbf'));
    EXPECT_EQ(string(1000, '\xbf'), buffer.str());
}

TEST(TranscriptBufferTest, MixedGarbageStaysBounded) {
    transcript_buffer buffer(100);
    for (int i = 0; i < 1000; ++i)
        buffer.append("\xf0\x9f\x98\x80" "\xff\xe4\xbd" "x");  // 😀, two broken bytes, x
    EXPECT_EQ(100u, utf8_length(buffer.str()));
    EXPECT_LE(buffer.str().size(), 400u);
}
